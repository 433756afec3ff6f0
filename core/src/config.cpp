#include "tabula/config.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace tabula {

Profile detect_profile() {
    const char* env = std::getenv("TABULA_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("TABULA_SANDBOX_USER",     "current", NO_OVERWRITE);
            setenv("TABULA_SANDBOX_TIMEOUT",  "30",      NO_OVERWRITE);
            setenv("TABULA_SANDBOX_LIMITS",   "1",       NO_OVERWRITE);
            setenv("TABULA_LOG_LEVEL",        "debug",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("TABULA_SANDBOX_USER",     "nobody",  NO_OVERWRITE);
            setenv("TABULA_SANDBOX_TIMEOUT",  "5",       NO_OVERWRITE);
            setenv("TABULA_SANDBOX_CPU_TIME", "2",       NO_OVERWRITE);
            setenv("TABULA_SANDBOX_LIMITS",   "1",       NO_OVERWRITE);
            setenv("TABULA_LOG_LEVEL",        "info",    NO_OVERWRITE);
            break;
    }
}

static bool env_u64(const char* key, uint64_t* out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || v[0] == '-') return false;
    *out = n;
    return true;
}

static bool env_flag(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v) return def;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

SandboxConfig load_sandbox_config() {
    SandboxConfig cfg;
    uint64_t n = 0;

    if (env_u64("TABULA_SANDBOX_CPU_TIME", &n)) cfg.cpu_time_seconds = (uint32_t)n;
    if (env_u64("TABULA_SANDBOX_MEMORY_BYTES", &n)) cfg.memory_bytes = n;
    if (env_u64("TABULA_SANDBOX_TIMEOUT", &n)) cfg.timeout_seconds = (uint32_t)n;
    if (env_u64("TABULA_SANDBOX_MAX_OUTPUT", &n)) cfg.output_max_bytes = (size_t)n;
    if (env_u64("TABULA_SANDBOX_SWEEP_AGE_SEC", &n)) cfg.sweep_max_age_seconds = (uint32_t)n;
    if (env_u64("TABULA_SANDBOX_MAX_CODE", &n)) cfg.max_code_bytes = (size_t)n;
    if (env_u64("TABULA_SANDBOX_MAX_LINE", &n)) cfg.max_line_bytes = (size_t)n;

    if (const char* v = std::getenv("TABULA_SANDBOX_USER")) cfg.run_as_user = v;
    if (const char* v = std::getenv("TABULA_PYTHON")) {
        if (*v) cfg.interpreter = v;
    }
    cfg.enable_limits = env_flag("TABULA_SANDBOX_LIMITS", true);

    if (const char* v = std::getenv("TABULA_SANDBOX_TEMP_DIR"); v && *v) {
        cfg.scratch_dir = v;
    } else {
        cfg.scratch_dir = default_scratch_dir();
    }
    return cfg;
}

std::string default_scratch_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "tabula_sandbox").string();
}

std::string validate_config(const SandboxConfig& cfg) {
    if (cfg.timeout_seconds == 0) return "timeout_seconds must be > 0";
    if (cfg.scratch_dir.empty()) return "scratch_dir is empty";
    if (cfg.interpreter.empty()) return "interpreter is empty";
    if (cfg.max_code_bytes == 0 || cfg.max_line_bytes == 0) return "code size bounds must be > 0";
    return "";
}

} // namespace tabula
