#include "tabula/sandbox.h"
#include "tabula/limiter.h"
#include "tabula/log.h"
#include "tabula/proc.h"
#include "tabula/scratch.h"

#include <json-c/json.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace tabula {

static const std::vector<std::string> kScratchPrefixes = {"script_", "dataset_", "check_"};

const char* exec_status_name(ExecStatus s) {
    switch (s) {
        case ExecStatus::REJECTED: return "rejected";
        case ExecStatus::COMPLETED: return "completed";
        case ExecStatus::TIMED_OUT: return "timed_out";
        case ExecStatus::SPAWN_FAILED: return "spawn_failed";
    }
    return "spawn_failed";
}

ProcessSandbox::ProcessSandbox(SandboxConfig cfg, JsonlLogger* log)
    : ProcessSandbox(cfg, make_resource_limiter(cfg, log),
                     std::make_unique<ForkProcessRunner>(), log) {}

ProcessSandbox::ProcessSandbox(SandboxConfig cfg,
                               std::unique_ptr<ResourceLimiter> limiter,
                               std::unique_ptr<ProcessRunner> runner,
                               JsonlLogger* log)
    : cfg_(std::move(cfg)),
      log_(log),
      validator_(validator_options(cfg_), log),
      injector_(cfg_.scratch_dir, log),
      limiter_(limiter ? std::move(limiter) : std::make_unique<NullResourceLimiter>()),
      runner_(runner ? std::move(runner) : std::make_unique<ForkProcessRunner>()) {
    std::string err = validate_config(cfg_);
    if (err.empty()) err = ensure_scratch_dir(cfg_.scratch_dir);

    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "scratch_dir", json_object_new_string(cfg_.scratch_dir.c_str()));
        json_object_object_add(p, "interpreter", json_object_new_string(cfg_.interpreter.c_str()));
        json_object_object_add(p, "timeout_s", json_object_new_int64(cfg_.timeout_seconds));
        json_object_object_add(p, "limits", json_object_new_string(limiter_->describe().c_str()));
        if (!err.empty()) json_object_object_add(p, "error", json_object_new_string(err.c_str()));
        log_->event(err.empty() ? LogLevel::INFO : LogLevel::ERROR, "sandbox.init", p);
    }
    if (err.empty()) (void)sweep();
}

ProcessSandbox::~ProcessSandbox() {
    injector_.clear();
}

SweepStats ProcessSandbox::sweep() {
    std::vector<std::string> keep;
    if (injector_.current()) keep.push_back(injector_.current()->blob_path);
    SweepStats st = sweep_scratch_dir(cfg_.scratch_dir, cfg_.sweep_max_age_seconds,
                                      kScratchPrefixes, keep);
    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "scanned", json_object_new_int64((int64_t)st.scanned));
        json_object_object_add(p, "removed", json_object_new_int64((int64_t)st.removed));
        json_object_object_add(p, "failed", json_object_new_int64((int64_t)st.failed));
        log_->event(LogLevel::DEBUG, "sandbox.sweep", p);
    }
    return st;
}

std::string ProcessSandbox::inject(const Dataset& ds) {
    std::string err = injector_.inject(ds);
    if (!err.empty()) {
        if (log_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "error", json_object_new_string(err.c_str()));
            log_->event(LogLevel::ERROR, "dataset.inject_failed", p);
        }
        return err;
    }
    limiter_->grant_access(injector_.current()->blob_path);
    return "";
}

void ProcessSandbox::clear() {
    injector_.clear();
}

ExecutionResult ProcessSandbox::execute(const std::string& code) {
    return execute(code, cfg_.timeout_seconds);
}

ExecutionResult ProcessSandbox::execute(const std::string& code, uint32_t timeout_seconds) {
    if (timeout_seconds == 0) timeout_seconds = cfg_.timeout_seconds;
    try {
        ValidationVerdict verdict = validator_.validate(code);
        if (!verdict.allowed) {
            ExecutionResult r;
            r.status = ExecStatus::REJECTED;
            r.stderr_text = "CODE REJECTED BY SECURITY: ";
            for (size_t i = 0; i < verdict.violations.size(); i++) {
                if (i) r.stderr_text += "; ";
                r.stderr_text += verdict.violations[i].detail;
            }
            r.violations = std::move(verdict.violations);
            return r;
        }
        return run_validated(code, timeout_seconds);
    } catch (const std::exception& e) {
        ExecutionResult r;
        r.status = ExecStatus::SPAWN_FAILED;
        r.stderr_text = std::string("Error executing code: ") + e.what();
        if (log_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "error", json_object_new_string(e.what()));
            log_->event(LogLevel::ERROR, "exec.error", p);
        }
        return r;
    }
}

ExecutionResult ProcessSandbox::run_validated(const std::string& code, uint32_t timeout_seconds) {
    ExecutionResult r;

    const std::string script = injector_.build_prelude() + "\n" + code;
    ScratchFile file;
    std::string err = ScratchFile::create(cfg_.scratch_dir, "script_", ".py", script, &file);
    if (!err.empty()) {
        r.status = ExecStatus::SPAWN_FAILED;
        r.stderr_text = "Error executing code: " + err;
        if (log_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "error", json_object_new_string(err.c_str()));
            log_->event(LogLevel::ERROR, "exec.spawn_failed", p);
        }
        return r;
    }
    r.script_path = file.path();
    limiter_->grant_access(file.path());

    ProcLimits lim;
    lim.timeout_ms = (int)std::min<uint64_t>((uint64_t)timeout_seconds * 1000ULL, 0x7fffffffULL);
    lim.output_max_bytes = cfg_.output_max_bytes;

    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "script", json_object_new_string(file.path().c_str()));
        json_object_object_add(p, "timeout_s", json_object_new_int64(timeout_seconds));
        json_object_object_add(p, "dataset", json_object_new_boolean(injector_.current() ? 1 : 0));
        log_->event(LogLevel::DEBUG, "exec.start", p);
    }

    ProcResult pr;
    const bool started = runner_->run({cfg_.interpreter, file.path()}, cfg_.scratch_dir,
                                      lim, *limiter_, &pr);
    file.remove();
    r.duration_ms = pr.duration_ms;

    if (!started) {
        r.status = ExecStatus::SPAWN_FAILED;
        r.stderr_text = "Error executing code: " + pr.error;
        if (log_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "error", json_object_new_string(pr.error.c_str()));
            log_->event(LogLevel::ERROR, "exec.spawn_failed", p);
        }
        return r;
    }

    r.exit_code = pr.exit_code;
    if (pr.timed_out) {
        r.status = ExecStatus::TIMED_OUT;
        r.stderr_text = "Timeout after " + std::to_string(timeout_seconds) + " seconds";
        if (log_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "timeout_s", json_object_new_int64(timeout_seconds));
            json_object_object_add(p, "duration_ms", json_object_new_int64(pr.duration_ms));
            log_->event(LogLevel::WARN, "exec.timeout", p);
        }
        return r;
    }

    r.status = ExecStatus::COMPLETED;
    r.stdout_text = sanitize_utf8(pr.out);
    r.stderr_text = sanitize_utf8(pr.err);
    r.output_truncated = pr.output_truncated;
    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "exit_code", json_object_new_int(pr.exit_code));
        json_object_object_add(p, "duration_ms", json_object_new_int64(pr.duration_ms));
        json_object_object_add(p, "stdout_bytes", json_object_new_int64((int64_t)r.stdout_text.size()));
        json_object_object_add(p, "stderr_bytes", json_object_new_int64((int64_t)r.stderr_text.size()));
        if (pr.output_truncated) json_object_object_add(p, "truncated", json_object_new_boolean(1));
        log_->event(LogLevel::INFO, "exec.done", p);
    }
    return r;
}

} // namespace tabula
