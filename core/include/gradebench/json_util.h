#pragma once

// json-c helpers shared by serialization, the sandbox reply parser and the
// grading log. Doc owns one reference to a parsed root.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace gradebench::json_util {

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

    // Hand ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline std::string to_string(json_object* o, bool pretty = false) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN);
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

// Field access on an already-parsed object. Return false when the key is
// absent or has the wrong JSON type; *out is left untouched then.
inline bool get_string(json_object* o, const char* k, std::string* out) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
    return true;
}

inline bool get_bool(json_object* o, const char* k, bool* out) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_boolean)) return false;
    *out = json_object_get_boolean(v) != 0;
    return true;
}

inline bool get_double(json_object* o, const char* k, double* out) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return false;
    *out = json_object_get_double(v);
    return true;
}

// Borrowed reference; nullptr when absent or not of type t.
inline json_object* get_typed(json_object* o, const char* k, json_type t) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v) return nullptr;
    if (!json_object_is_type(v, t)) return nullptr;
    return v;
}

inline std::vector<std::string> get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* arr = get_typed(o, k, json_type_array);
    if (!arr) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) out.emplace_back(json_object_get_string(el));
    }
    return out;
}

// Escape for embedding inside a JSON string literal (no surrounding quotes).
inline std::string escape(const std::string& s) {
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

inline std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

} // namespace gradebench::json_util
