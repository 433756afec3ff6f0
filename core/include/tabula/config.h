#pragma once
#include <cstdint>
#include <string>

namespace tabula {

enum class Profile { DEV, PROD };

// Detect profile from TABULA_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (current user, no memory cap tightening, generous timeout)
// PROD: strict (run as nobody, tight timeout, limits forced on)
void apply_profile_defaults(Profile p);

// Sandbox settings. Built once, handed to ProcessSandbox, never mutated after.
struct SandboxConfig {
    uint32_t cpu_time_seconds{2};
    uint64_t memory_bytes{200ULL * 1024 * 1024};
    std::string run_as_user;          // empty or "current": keep identity
    std::string scratch_dir;
    uint32_t timeout_seconds{5};

    std::string interpreter{"python3"};
    bool enable_limits{true};         // false: skip rlimits and identity switch
    size_t output_max_bytes{1024 * 1024};
    uint32_t sweep_max_age_seconds{3600};

    // Validator rejects larger submissions before scanning them.
    size_t max_code_bytes{256 * 1024};
    size_t max_line_bytes{10000};
};

// <temp dir>/tabula_sandbox
std::string default_scratch_dir();

// Build a SandboxConfig from TABULA_SANDBOX_* env vars.
// Malformed numeric values keep the default.
SandboxConfig load_sandbox_config();

// Returns empty string if cfg is usable, otherwise a description of the problem.
std::string validate_config(const SandboxConfig& cfg);

} // namespace tabula
