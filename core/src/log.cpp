#include "tabula/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace tabula {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
        << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

// Serialize with sorted object keys so identical events produce identical lines.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

LogLevel log_level_from_str(const std::string& s, LogLevel def) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return def;
}

JsonlLogger::JsonlLogger(const std::string& path, LogLevel min_level)
    : path_(path), min_level_(min_level) {
    if (!path_.empty()) {
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            std::cerr << "[log] cannot open " << path_ << ", falling back to stderr\n";
        }
    }
}

void JsonlLogger::event(LogLevel lvl, const std::string& name, json_object* payload) {
    if (!enabled(lvl)) {
        if (payload) json_object_put(payload);
        return;
    }

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "level", json_object_new_string(log_level_name(lvl)));
    json_object_object_add(rec, "payload", payload ? payload : json_object_new_object());
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)seq_));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    if (out_.is_open() && out_.good()) {
        out_ << line.str() << "\n";
        out_.flush();
    } else {
        std::cerr << line.str() << "\n";
    }
    seq_++;
}

void JsonlLogger::event(LogLevel lvl, const std::string& name, const std::string& payload_json) {
    if (!enabled(lvl)) return;
    json_object* p = json_tokener_parse(payload_json.c_str());
    if (!p) p = json_object_new_string(payload_json.c_str());
    event(lvl, name, p);
}

uint64_t JsonlLogger::lines_written() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

std::unique_ptr<JsonlLogger> make_env_logger() {
    std::string path;
    if (const char* v = std::getenv("TABULA_LOG_PATH")) path = v;
    LogLevel lvl = LogLevel::INFO;
    if (const char* v = std::getenv("TABULA_LOG_LEVEL")) lvl = log_level_from_str(v);
    return std::make_unique<JsonlLogger>(path, lvl);
}

} // namespace tabula
