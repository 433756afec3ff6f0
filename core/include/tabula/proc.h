#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tabula {

class ResourceLimiter;

struct ProcLimits {
    int timeout_ms{5000};                   // <= 0: no wall-clock bound
    size_t output_max_bytes{1024 * 1024};   // per stream

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{-1};          // 128+N when killed by signal N
    bool timed_out{false};
    bool output_truncated{false};
    std::string out;            // child stdout
    std::string err;            // child stderr
    std::string error;          // internal runner error, not child stderr
    int64_t duration_ms{0};
};

// Spawns one child and waits for it. Implementations must not leave the
// child running when run() returns.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // argv[0] is looked up on PATH. stdin is /dev/null. The limiter is
    // applied in the child just before exec. Returns true if the process
    // started; res->error explains a false return.
    virtual bool run(const std::vector<std::string>& argv,
                     const std::string& cwd,
                     const ProcLimits& lim,
                     const ResourceLimiter& limiter,
                     ProcResult* res) = 0;
};

// fork/exec with separate stdout/stderr pipes, its own process group, and a
// poll loop that enforces the timeout by killing the whole group.
class ForkProcessRunner : public ProcessRunner {
public:
    bool run(const std::vector<std::string>& argv,
             const std::string& cwd,
             const ProcLimits& lim,
             const ResourceLimiter& limiter,
             ProcResult* res) override;
};

// Replace every byte that is not part of a well-formed UTF-8 sequence with
// U+FFFD.
std::string sanitize_utf8(const std::string& in);

} // namespace tabula
