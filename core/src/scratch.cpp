#include "tabula/scratch.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <random>
#include <sstream>

#ifndef _WIN32
  #include <fcntl.h>
  #include <sys/stat.h>
  #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace tabula {

static std::string rand_hex8() {
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<uint32_t> dist(0, 0xffffffffu);
    uint32_t v = dist(rng);
    std::ostringstream oss;
    oss << std::hex;
    oss.width(8);
    oss.fill('0');
    oss << v;
    return oss.str();
}

std::string make_scratch_token() {
    static std::atomic<uint64_t> seq{0};
    std::ostringstream oss;
#ifdef _WIN32
    oss << 0;
#else
    oss << (long)getpid();
#endif
    oss << "_" << seq.fetch_add(1) << "_" << rand_hex8();
    return oss.str();
}

std::string ensure_scratch_dir(const std::string& dir) {
    if (dir.empty()) return "scratch dir is empty";
    std::error_code ec;
    const bool created = fs::create_directories(dir, ec);
    if (ec) return "cannot create scratch dir " + dir + ": " + ec.message();
    if (!fs::is_directory(dir, ec)) return "scratch path is not a directory: " + dir;
    // Only a directory we made gets our mode: traversable by a run-as
    // identity, not listable. An existing one (possibly shared) is left as is.
    if (created) {
        fs::permissions(dir,
                        fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
        if (ec) return "cannot set mode on scratch dir " + dir + ": " + ec.message();
    }
    return "";
}

std::string write_new_file(const std::string& path, const std::string& data) {
#ifdef _WIN32
    if (fs::exists(path)) return "file exists: " + path;
    std::FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) return "cannot create " + path;
    size_t n = std::fwrite(data.data(), 1, data.size(), f);
    std::fclose(f);
    if (n != data.size()) {
        std::error_code ec;
        fs::remove(path, ec);
        return "write failed: " + path;
    }
    return "";
#else
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) return "cannot create " + path + ": " + std::strerror(errno);

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        std::string err = "write failed: " + path + ": " + std::strerror(errno);
        ::close(fd);
        ::unlink(path.c_str());
        return err;
    }
    if (::close(fd) != 0) {
        std::string err = "close failed: " + path + ": " + std::strerror(errno);
        ::unlink(path.c_str());
        return err;
    }
    return "";
#endif
}

ScratchFile::~ScratchFile() {
    remove();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::string ScratchFile::create(const std::string& dir,
                                const std::string& prefix,
                                const std::string& suffix,
                                const std::string& content,
                                ScratchFile* out) {
    out->remove();
    // A collision with another writer only costs a retry.
    std::string last_err;
    for (int attempt = 0; attempt < 3; attempt++) {
        std::string path = (fs::path(dir) / (prefix + make_scratch_token() + suffix)).string();
        last_err = write_new_file(path, content);
        if (last_err.empty()) {
            out->path_ = path;
            return "";
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) break;
    }
    return last_err;
}

void ScratchFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    path_.clear();
}

SweepStats sweep_scratch_dir(const std::string& dir,
                             uint32_t max_age_seconds,
                             const std::vector<std::string>& prefixes,
                             const std::vector<std::string>& keep) {
    SweepStats st;
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) return st;

    const auto now = fs::file_time_type::clock::now();
    const auto max_age = std::chrono::seconds(max_age_seconds);

    fs::directory_iterator it(dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& e = *it;
        std::error_code fec;
        if (!e.is_regular_file(fec)) continue;

        const std::string name = e.path().filename().string();
        bool owned = false;
        for (const auto& p : prefixes) {
            if (name.compare(0, p.size(), p) == 0) { owned = true; break; }
        }
        if (!owned) continue;
        bool kept = false;
        for (const auto& k : keep) {
            if (fs::path(k).filename() == e.path().filename()) { kept = true; break; }
        }
        if (kept) continue;
        st.scanned++;

        auto mtime = e.last_write_time(fec);
        if (fec) { st.failed++; continue; }
        if (now - mtime <= max_age) continue;

        if (fs::remove(e.path(), fec) && !fec) st.removed++;
        else st.failed++;
    }
    return st;
}

} // namespace tabula
