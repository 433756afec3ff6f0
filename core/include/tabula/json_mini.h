#pragma once

// json_mini.h
//
// Small RAII + parsing helpers over json-c.

#include <json-c/json.h>

#include <climits>
#include <cstdio>
#include <sstream>
#include <string>

namespace tabula::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be exactly one JSON value (surrounding
// whitespace allowed). Returns false on any error or trailing garbage.
// Note that a valid "null" document yields ok=true with out->root == nullptr.
inline bool parse_complete(const std::string& json, Doc* out) {
    *out = Doc{};
    if (json.size() >= static_cast<size_t>(INT_MAX)) return false;
    json_tokener* tok = json_tokener_new();
    if (!tok) return false;
    // Include the terminating NUL so that a bare number at end of input is
    // finished rather than reported as json_tokener_continue.
    const int len = static_cast<int>(json.size()) + 1;
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return false;
    }
    for (size_t i = end; i < json.size(); i++) {
        unsigned char c = static_cast<unsigned char>(json[i]);
        if (!(c == ' ' || c == '\t' || c == '\n' || c == '\r')) {
            if (obj) json_object_put(obj);
            return false;
        }
    }
    out->root = obj;
    return true;
}

inline std::string to_string(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

// Double-quoted literal. Also a valid Python string literal.
inline std::string json_quote(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

} // namespace tabula::json_mini
