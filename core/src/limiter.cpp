#include "tabula/limiter.h"
#include "tabula/config.h"
#include "tabula/log.h"

#include <json-c/json.h>

#include <cstdlib>
#include <iostream>

#ifndef _WIN32
  #include <grp.h>
  #include <pwd.h>
  #include <sys/resource.h>
  #include <sys/types.h>
  #include <unistd.h>
#endif

namespace tabula {

#ifndef _WIN32

static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

PosixResourceLimiter::PosixResourceLimiter(uint32_t cpu_seconds, uint64_t memory_bytes,
                                           long uid, long gid)
    : cpu_seconds_(cpu_seconds), memory_bytes_(memory_bytes), uid_(uid), gid_(gid) {
#ifdef __APPLE__
    // RLIMIT_AS above this is rejected or breaks the interpreter on macOS.
    const uint64_t kAppleCap = 100ULL * 1024 * 1024;
    if (memory_bytes_ == 0 || memory_bytes_ > kAppleCap) memory_bytes_ = kAppleCap;
    // Identity switch needs privileges macOS rarely grants here.
    uid_ = -1;
    gid_ = -1;
#endif
}

void PosixResourceLimiter::apply_in_child() const noexcept {
    if (cpu_seconds_ > 0) {
        set_rlimit(RLIMIT_CPU, (rlim_t)cpu_seconds_, (rlim_t)cpu_seconds_);
    }
    if (memory_bytes_ > 0) {
        set_rlimit(RLIMIT_AS, (rlim_t)memory_bytes_, (rlim_t)memory_bytes_);
    }
    if (uid_ >= 0) {
        // Group first: after setuid we may no longer be allowed to.
        (void)setgroups(0, nullptr);
        if (gid_ >= 0) (void)setgid((gid_t)gid_);
        (void)setuid((uid_t)uid_);
    }
}

void PosixResourceLimiter::grant_access(const std::string& path) const {
    if (uid_ < 0 || path.empty()) return;
    if (chown(path.c_str(), (uid_t)uid_, gid_ >= 0 ? (gid_t)gid_ : (gid_t)-1) != 0) {
        // Typical when the parent is not root; the child then fails to read
        // the file and reports it on stderr.
        std::cerr << "[limiter] chown " << path << " to uid " << uid_ << " failed\n";
    }
}

std::string PosixResourceLimiter::describe() const {
    std::string s = "cpu=" + std::to_string(cpu_seconds_) + "s mem=" +
                    std::to_string(memory_bytes_) + "B";
    if (uid_ >= 0) s += " uid=" + std::to_string(uid_);
    return s;
}

bool resolve_run_as(const std::string& user, long* uid, long* gid, std::string* why) {
    auto no = [&](const std::string& reason) {
        if (why) *why = reason;
        return false;
    };
    if (user.empty() || user == "current") return no("current user requested");

    const char* env_user = std::getenv("USER");
    if (env_user && user == env_user) return no("requested user is the current user");

    struct passwd pw;
    struct passwd* found = nullptr;
    char buf[16384];
    if (getpwnam_r(user.c_str(), &pw, buf, sizeof(buf), &found) != 0 || !found) {
        return no("user '" + user + "' not found");
    }
    if (found->pw_uid == getuid()) return no("requested user is the current user");
    if (found->pw_uid >= 65534) {
        return no("uid " + std::to_string(found->pw_uid) + " for '" + user + "' is too high");
    }
    *uid = (long)found->pw_uid;
    *gid = (long)found->pw_gid;
    return true;
}

#endif

std::unique_ptr<ResourceLimiter> make_resource_limiter(const SandboxConfig& cfg, JsonlLogger* log) {
#ifdef _WIN32
    (void)cfg;
    if (log) log->event(LogLevel::DEBUG, "sandbox.limiter", std::string("{\"kind\":\"none\",\"reason\":\"platform\"}"));
    return std::make_unique<NullResourceLimiter>();
#else
    if (!cfg.enable_limits) {
        if (log) log->event(LogLevel::DEBUG, "sandbox.limiter", std::string("{\"kind\":\"none\",\"reason\":\"disabled\"}"));
        return std::make_unique<NullResourceLimiter>();
    }

    long uid = -1, gid = -1;
    std::string why;
    const bool switch_id = resolve_run_as(cfg.run_as_user, &uid, &gid, &why);
    if (!switch_id && log && !cfg.run_as_user.empty() && cfg.run_as_user != "current") {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "user", json_object_new_string(cfg.run_as_user.c_str()));
        json_object_object_add(p, "reason", json_object_new_string(why.c_str()));
        log->event(LogLevel::WARN, "sandbox.identity_skipped", p);
    }

    auto lim = std::make_unique<PosixResourceLimiter>(cfg.cpu_time_seconds, cfg.memory_bytes, uid, gid);
    if (log) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "kind", json_object_new_string("posix"));
        json_object_object_add(p, "limits", json_object_new_string(lim->describe().c_str()));
        log->event(LogLevel::DEBUG, "sandbox.limiter", p);
    }
    return lim;
#endif
}

} // namespace tabula
