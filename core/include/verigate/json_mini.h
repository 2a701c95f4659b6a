#pragma once

// json_mini.h
//
// Small read helpers over json-c for request documents, plus a string
// escaper for hand-built payloads.

#include <json-c/json.h>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace verigate::json_mini {

// Owning handle for a parsed document.
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

// Parse failure yields an empty Doc.
inline Doc parse(const std::string& json) {
    return Doc{json_tokener_parse(json.c_str())};
}

inline json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// Strings of an array value; nullopt if arr is not an array or holds a
// non-string element.
inline std::optional<std::vector<std::string>> array_strings(json_object* arr) {
    if (!arr || !json_object_is_type(arr, json_type_array)) return std::nullopt;
    std::vector<std::string> out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!el || !json_object_is_type(el, json_type_string)) return std::nullopt;
        out.emplace_back(json_object_get_string(el), (size_t)json_object_get_string_len(el));
    }
    return out;
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

} // namespace verigate::json_mini
