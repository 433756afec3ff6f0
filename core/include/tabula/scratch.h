#pragma once

// Scratch directory helpers: unique names, exclusive creation, cleanup.

#include <cstdint>
#include <string>
#include <vector>

namespace tabula {

// "<pid>_<seq>_<8 hex>", unique per call within a process and unlikely to
// repeat across processes sharing a scratch directory.
std::string make_scratch_token();

// Create the directory (and parents) if missing, mode 0711 on the leaf.
// An existing directory keeps its mode. Returns empty on success.
std::string ensure_scratch_dir(const std::string& dir);

// Create `path` exclusively (fails if it exists), mode 0600, write `data`.
// On failure nothing is left behind. Returns empty on success.
std::string write_new_file(const std::string& path, const std::string& data);

// Owns one file on disk; the destructor removes it.
class ScratchFile {
public:
    ScratchFile() = default;
    ~ScratchFile();

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;
    ScratchFile(ScratchFile&& other) noexcept;
    ScratchFile& operator=(ScratchFile&& other) noexcept;

    // Writes `content` to dir/<prefix><token><suffix>. Returns empty on success.
    static std::string create(const std::string& dir,
                              const std::string& prefix,
                              const std::string& suffix,
                              const std::string& content,
                              ScratchFile* out);

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Remove now. Safe to call repeatedly.
    void remove();

private:
    std::string path_;
};

struct SweepStats {
    size_t scanned{0};
    size_t removed{0};
    size_t failed{0};
};

// Remove regular files in `dir` whose name starts with one of `prefixes`
// and whose mtime is older than max_age_seconds. Paths listed in `keep` are
// skipped. Best-effort.
SweepStats sweep_scratch_dir(const std::string& dir,
                             uint32_t max_age_seconds,
                             const std::vector<std::string>& prefixes,
                             const std::vector<std::string>& keep = {});

} // namespace tabula
