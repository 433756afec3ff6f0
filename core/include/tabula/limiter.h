#pragma once

// Resource limits and identity switch applied to the worker process between
// fork and exec. This is best-effort hardening, not an isolation boundary:
// without namespaces or a syscall filter a worker that escapes the validator
// still shares the host's filesystem and network.

#include <cstdint>
#include <memory>
#include <string>

namespace tabula {

struct SandboxConfig;
class JsonlLogger;

class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    // Runs in the forked child before exec. Must only make async-signal-safe
    // calls on precomputed values. Failures are ignored one by one.
    virtual void apply_in_child() const noexcept = 0;

    // Make `path` readable by the identity the child will run as.
    virtual void grant_access(const std::string& path) const = 0;

    // Human-readable summary for logs.
    virtual std::string describe() const = 0;
};

// No limits, no identity switch. Only the wall-clock timeout applies.
class NullResourceLimiter : public ResourceLimiter {
public:
    void apply_in_child() const noexcept override {}
    void grant_access(const std::string&) const override {}
    std::string describe() const override { return "none"; }
};

#ifndef _WIN32
// RLIMIT_CPU + RLIMIT_AS, then setgid/setuid to the run-as account if one
// was resolved.
class PosixResourceLimiter : public ResourceLimiter {
public:
    // uid/gid < 0: keep the current identity.
    PosixResourceLimiter(uint32_t cpu_seconds, uint64_t memory_bytes,
                         long uid = -1, long gid = -1);

    void apply_in_child() const noexcept override;
    void grant_access(const std::string& path) const override;
    std::string describe() const override;

    uint64_t memory_bytes() const { return memory_bytes_; }
    bool switches_identity() const { return uid_ >= 0; }

private:
    uint32_t cpu_seconds_;
    uint64_t memory_bytes_;
    long uid_;
    long gid_;
};

// Resolve run_as_user to (uid, gid). Returns false, leaving the outputs
// untouched, when no switch should happen: empty or "current", the current
// user, an unknown account, or uid >= 65534. `why` gets the reason.
bool resolve_run_as(const std::string& user, long* uid, long* gid, std::string* why);
#endif

// Picks the implementation for this platform and config.
std::unique_ptr<ResourceLimiter> make_resource_limiter(const SandboxConfig& cfg,
                                                       JsonlLogger* log = nullptr);

} // namespace tabula
