#pragma once
#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace tabula {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* log_level_name(LogLevel lvl);

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown strings map to `def`.
LogLevel log_level_from_str(const std::string& s, LogLevel def = LogLevel::INFO);

// JSON-lines event log. One canonical (sorted-key) object per line:
//   {"event":..., "level":..., "payload":{...}, "seq":N, "ts":"..."}
// Empty path writes to stderr; otherwise appends to the file.
class JsonlLogger {
public:
    explicit JsonlLogger(const std::string& path = "", LogLevel min_level = LogLevel::INFO);

    JsonlLogger(const JsonlLogger&) = delete;
    JsonlLogger& operator=(const JsonlLogger&) = delete;

    // Takes ownership of payload (may be nullptr).
    void event(LogLevel lvl, const std::string& name, json_object* payload);

    // payload_json that fails to parse is logged as a JSON string.
    void event(LogLevel lvl, const std::string& name, const std::string& payload_json);

    bool enabled(LogLevel lvl) const { return lvl >= min_level_; }
    const std::string& path() const { return path_; }
    uint64_t lines_written() const;

private:
    std::string path_;
    LogLevel min_level_;
    std::ofstream out_;
    mutable std::mutex mu_;
    uint64_t seq_{0};
};

// Logger from TABULA_LOG_PATH / TABULA_LOG_LEVEL.
std::unique_ptr<JsonlLogger> make_env_logger();

} // namespace tabula
