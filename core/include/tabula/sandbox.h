#pragma once

// ProcessSandbox: validate, write scratch script, run under limits, capture.
//
// One instance owns its config, its injected dataset and its limiter. There
// is no process-wide state. execute() may run concurrently on one instance;
// inject()/clear() must not overlap with in-flight executions.

#include "tabula/config.h"
#include "tabula/dataset.h"
#include "tabula/scratch.h"
#include "tabula/validator.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabula {

class JsonlLogger;
class ProcessRunner;
class ResourceLimiter;

enum class ExecStatus {
    REJECTED,       // validator said no, nothing was spawned
    COMPLETED,      // child ran to exit (any exit code)
    TIMED_OUT,      // killed at the wall-clock bound
    SPAWN_FAILED,   // scratch I/O, fork or exec failed
};

const char* exec_status_name(ExecStatus s);

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};          // -1 when no process ran
    int64_t duration_ms{0};
    ExecStatus status{ExecStatus::SPAWN_FAILED};

    std::vector<Violation> violations;   // REJECTED only
    bool output_truncated{false};
    std::string script_path;             // already deleted on return
};

class ProcessSandbox {
public:
    // Uses ForkProcessRunner and make_resource_limiter(cfg). log may be nullptr.
    explicit ProcessSandbox(SandboxConfig cfg, JsonlLogger* log = nullptr);

    // Explicit collaborators, mainly for tests.
    ProcessSandbox(SandboxConfig cfg,
                   std::unique_ptr<ResourceLimiter> limiter,
                   std::unique_ptr<ProcessRunner> runner,
                   JsonlLogger* log = nullptr);

    ~ProcessSandbox();

    ProcessSandbox(const ProcessSandbox&) = delete;
    ProcessSandbox& operator=(const ProcessSandbox&) = delete;

    // Uses cfg.timeout_seconds.
    ExecutionResult execute(const std::string& code);
    ExecutionResult execute(const std::string& code, uint32_t timeout_seconds);

    // Returns empty on success.
    std::string inject(const Dataset& ds);
    void clear();
    const std::optional<InjectedDataset>& injected() const { return injector_.current(); }

    // Remove stale script_/dataset_/check_ files older than cfg.sweep_max_age_seconds.
    // The active dataset blob is never touched.
    SweepStats sweep();

    const SandboxConfig& config() const { return cfg_; }
    const CodeValidator& validator() const { return validator_; }
    const ResourceLimiter& limiter() const { return *limiter_; }

private:
    ExecutionResult run_validated(const std::string& code, uint32_t timeout_seconds);

    const SandboxConfig cfg_;
    JsonlLogger* log_;
    CodeValidator validator_;
    DatasetInjector injector_;
    std::unique_ptr<ResourceLimiter> limiter_;
    std::unique_ptr<ProcessRunner> runner_;
};

} // namespace tabula
