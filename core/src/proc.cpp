#include "tabula/proc.h"
#include "tabula/limiter.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif

extern char** environ;
#endif

namespace tabula {

std::string sanitize_utf8(const std::string& in) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(in.size());
    const size_t n = in.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = (unsigned char)in[i];
        if (c < 0x80) { out.push_back((char)c); i++; continue; }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }

        bool ok = len > 0 && i + len <= n;
        for (size_t k = 1; ok && k < len; k++) {
            const unsigned char cc = (unsigned char)in[i + k];
            if ((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong, surrogate, out of range
        if (ok && (cp < min || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)) ok = false;

        if (ok) {
            out.append(in, i, len);
            i += len;
        } else {
            out.append(kReplacement);
            i++;
        }
    }
    return out;
}

#ifndef _WIN32
static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
}

namespace {

struct Capture {
    std::string data;
    size_t max_bytes;
    bool* truncated;

    void append(const char* buf, ssize_t n) {
        size_t can = max_bytes > data.size() ? (max_bytes - data.size()) : 0;
        if (can > 0) {
            size_t take = (size_t)n;
            if (take > can) { take = can; *truncated = true; }
            data.append(buf, buf + take);
        } else {
            *truncated = true;
        }
    }

    // Read until EAGAIN. Returns false on EOF.
    bool drain(int fd) {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) { append(buf, n); continue; }
            if (n == -1 && errno == EINTR) continue;
            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            return false;
        }
    }
};

} // namespace
#endif

bool ForkProcessRunner::run(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const ProcLimits& lim,
                            const ResourceLimiter& limiter,
                            ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    (void)argv; (void)cwd; (void)lim; (void)limiter;
    res->error = "ForkProcessRunner: not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Everything the child touches is prepared here; between fork and exec
    // it only makes async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    // scrub loader env vars
    std::vector<char*> cenv;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "LD_PRELOAD=", 11) == 0) continue;
        if (std::strncmp(*e, "LD_LIBRARY_PATH=", 16) == 0) continue;
        cenv.push_back(*e);
    }
    cenv.push_back(nullptr);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        res->error = std::string("open /dev/null failed: ") + std::strerror(errno);
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // child reports exec errno here
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        close(null_fd);
        return false;
    }
    (void)fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);
    set_nonblock(out_pipe[0]);
    set_nonblock(err_pipe[0]);

    const pid_t parent_pid = getpid();
    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        close(null_fd);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(null_fd, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);
        const int report_fd = exec_pipe[1];

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);

        // tighten default file permissions for any files created by the child
        (void)umask(077);

        // best-effort: close inherited fds beyond stdin/stdout/stderr
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != report_fd) (void)close(fd);
        }

        if (!cwd.empty()) {
            (void)chdir(cwd.c_str());
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
#endif

        limiter.apply_in_child();

#ifdef __linux__
        // A credential change clears the death signal, so it goes after the
        // limiter's setuid.
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (getppid() != parent_pid) _exit(127);
#endif

        environ = cenv.data();
        execvp(cargv[0], cargv.data());

        int e = errno;
        ssize_t wr = write(report_fd, &e, sizeof(e));
        (void)wr;
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(null_fd);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    // exec_pipe closes on successful exec; a payload means exec failed.
    int exec_errno = 0;
    while (true) {
        ssize_t n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        if (n == -1 && errno == EINTR) continue;
        if (n != (ssize_t)sizeof(exec_errno)) exec_errno = 0;
        break;
    }
    close(exec_pipe[0]);
    if (exec_errno != 0) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        res->error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        return false;
    }

    Capture out{std::string(), lim.output_max_bytes, &res->output_truncated};
    Capture err{std::string(), lim.output_max_bytes, &res->output_truncated};
    bool out_open = true;
    bool err_open = true;

    int status = 0;

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) {
            out_idx = (int)nfds;
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (err_open) {
            err_idx = (int)nfds;
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                // kill process group first (best-effort), then the direct pid
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                break;
            }
            slice = std::max(1, std::min(slice, remaining));
        }

        if (nfds > 0) {
            int pr = poll(fds, nfds, slice);
            if (pr < 0 && errno == EINTR) continue;
            if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
                out_open = out.drain(out_pipe[0]);
            }
            if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
                err_open = err.drain(err_pipe[0]);
            }
        } else {
            // both streams closed, only waiting for exit
            (void)poll(nullptr, 0, slice);
        }

        // Peek without reaping so the group id stays reserved while strays
        // that inherited the pipes are killed.
        siginfo_t si;
        std::memset(&si, 0, sizeof(si));
        if (waitid(P_PID, (id_t)pid, &si, WEXITED | WNOHANG | WNOWAIT) == 0 && si.si_pid == pid) {
            (void)kill(-pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }
    }

    if (out_open) (void)out.drain(out_pipe[0]);
    if (err_open) (void)err.drain(err_pipe[0]);
    close(out_pipe[0]);
    close(err_pipe[0]);

    res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    res->out = std::move(out.data);
    res->err = std::move(err.data);

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
#endif
}

} // namespace tabula
