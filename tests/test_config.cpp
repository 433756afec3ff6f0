#include "test_common.h"
#include "tabula/config.h"
#include <cstdlib>

static void clear_env() {
    const char* keys[] = {
        "TABULA_PROFILE", "TABULA_SANDBOX_CPU_TIME", "TABULA_SANDBOX_MEMORY_BYTES",
        "TABULA_SANDBOX_USER", "TABULA_SANDBOX_TEMP_DIR", "TABULA_SANDBOX_TIMEOUT",
        "TABULA_PYTHON", "TABULA_SANDBOX_LIMITS", "TABULA_SANDBOX_MAX_OUTPUT",
        "TABULA_SANDBOX_SWEEP_AGE_SEC", "TABULA_SANDBOX_MAX_CODE", "TABULA_SANDBOX_MAX_LINE",
        "TABULA_LOG_LEVEL",
    };
    for (const char* k : keys) unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = tabula::detect_profile();
    expect_true(p == tabula::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("TABULA_PROFILE", "PROD", 1);
    p = tabula::detect_profile();
    expect_true(p == tabula::Profile::PROD, "should detect PROD case-insensitive");
    setenv("TABULA_PROFILE", "production", 1);
    expect_true(tabula::detect_profile() == tabula::Profile::PROD, "production alias");

    // Test 3: Defaults with nothing set
    clear_env();
    auto cfg = tabula::load_sandbox_config();
    expect_eq_ll(cfg.cpu_time_seconds, 2, "default cpu");
    expect_eq_ll((long long)cfg.memory_bytes, 200LL * 1024 * 1024, "default memory");
    expect_eq_ll(cfg.timeout_seconds, 5, "default timeout");
    expect_eq_ll(cfg.sweep_max_age_seconds, 3600, "default sweep age");
    expect_true(cfg.interpreter == "python3", "default interpreter");
    expect_true(cfg.enable_limits, "limits on by default");
    expect_true(cfg.run_as_user.empty(), "no run-as user by default");
    expect_eq_str(cfg.scratch_dir, tabula::default_scratch_dir(), "scratch dir default");
    expect_eq_ll((long long)cfg.max_code_bytes, 256 * 1024, "default code bound");
    expect_eq_ll((long long)cfg.max_line_bytes, 10000, "default line bound");
    expect_true(tabula::validate_config(cfg).empty(), "defaults are valid");

    // Test 4: Env overrides
    setenv("TABULA_SANDBOX_CPU_TIME", "7", 1);
    setenv("TABULA_SANDBOX_MEMORY_BYTES", "1048576", 1);
    setenv("TABULA_SANDBOX_TIMEOUT", "11", 1);
    setenv("TABULA_SANDBOX_TEMP_DIR", "/tmp/tabula_cfg_test", 1);
    setenv("TABULA_SANDBOX_USER", "nobody", 1);
    setenv("TABULA_PYTHON", "/usr/bin/python3", 1);
    setenv("TABULA_SANDBOX_LIMITS", "off", 1);
    setenv("TABULA_SANDBOX_MAX_OUTPUT", "4096", 1);
    setenv("TABULA_SANDBOX_MAX_CODE", "65536", 1);
    setenv("TABULA_SANDBOX_MAX_LINE", "500", 1);
    cfg = tabula::load_sandbox_config();
    expect_eq_ll(cfg.cpu_time_seconds, 7, "cpu override");
    expect_eq_ll((long long)cfg.memory_bytes, 1048576, "memory override");
    expect_eq_ll(cfg.timeout_seconds, 11, "timeout override");
    expect_true(cfg.scratch_dir == "/tmp/tabula_cfg_test", "scratch override");
    expect_true(cfg.run_as_user == "nobody", "user override");
    expect_true(cfg.interpreter == "/usr/bin/python3", "interpreter override");
    expect_true(!cfg.enable_limits, "limits off");
    expect_eq_ll((long long)cfg.output_max_bytes, 4096, "max output override");
    expect_eq_ll((long long)cfg.max_code_bytes, 65536, "code bound override");
    expect_eq_ll((long long)cfg.max_line_bytes, 500, "line bound override");

    // Test 5: Malformed numbers keep defaults
    setenv("TABULA_SANDBOX_CPU_TIME", "abc", 1);
    setenv("TABULA_SANDBOX_TIMEOUT", "-3", 1);
    setenv("TABULA_SANDBOX_MEMORY_BYTES", "12x", 1);
    cfg = tabula::load_sandbox_config();
    expect_eq_ll(cfg.cpu_time_seconds, 2, "bad cpu falls back");
    expect_eq_ll(cfg.timeout_seconds, 5, "negative timeout falls back");
    expect_eq_ll((long long)cfg.memory_bytes, 200LL * 1024 * 1024, "bad memory falls back");

    // Test 6: validate_config
    tabula::SandboxConfig bad;
    bad.scratch_dir = "/tmp/x";
    bad.timeout_seconds = 0;
    expect_true(!tabula::validate_config(bad).empty(), "zero timeout rejected");
    bad.timeout_seconds = 1;
    bad.interpreter = "";
    expect_true(!tabula::validate_config(bad).empty(), "empty interpreter rejected");
    bad.interpreter = "python3";
    bad.scratch_dir = "";
    expect_true(!tabula::validate_config(bad).empty(), "empty scratch dir rejected");
    bad.scratch_dir = "/tmp/x";
    bad.max_line_bytes = 0;
    expect_true(!tabula::validate_config(bad).empty(), "zero line bound rejected");

    // Test 7: Apply defaults (won't override existing)
    clear_env();
    setenv("TABULA_SANDBOX_TIMEOUT", "42", 1);
    tabula::apply_profile_defaults(tabula::Profile::PROD);
    std::string val = std::getenv("TABULA_SANDBOX_TIMEOUT") ? std::getenv("TABULA_SANDBOX_TIMEOUT") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 8: Apply sets missing vars
    val = std::getenv("TABULA_SANDBOX_USER") ? std::getenv("TABULA_SANDBOX_USER") : "";
    expect_true(val == "nobody", "PROD should run as nobody");
    clear_env();
    tabula::apply_profile_defaults(tabula::Profile::DEV);
    val = std::getenv("TABULA_SANDBOX_USER") ? std::getenv("TABULA_SANDBOX_USER") : "";
    expect_true(val == "current", "DEV should keep the current user");
    cfg = tabula::load_sandbox_config();
    expect_eq_ll(cfg.timeout_seconds, 30, "DEV timeout");

    // Test 9: Profile name
    expect_true(std::string(tabula::profile_name(tabula::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(tabula::profile_name(tabula::Profile::PROD)) == "prod", "prod name");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
