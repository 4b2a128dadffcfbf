#include "gradebench/value.h"
#include "gradebench/json_util.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace gradebench {

const char* kind_name(Value::Kind k) {
    switch (k) {
        case Value::Kind::NUL:   return "null";
        case Value::Kind::BOOL:  return "bool";
        case Value::Kind::INT:   return "int";
        case Value::Kind::FLOAT: return "float";
        case Value::Kind::TEXT:  return "text";
        case Value::Kind::LIST:  return "list";
        case Value::Kind::MAP:   return "map";
    }
    return "unknown";
}

static std::string render_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    std::string s = buf;
    // keep floats visibly distinct from ints in issue text
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

static void render_into(const Value& v, std::ostringstream& out) {
    switch (v.kind()) {
        case Value::Kind::NUL:   out << "null"; break;
        case Value::Kind::BOOL:  out << (v.as_bool() ? "true" : "false"); break;
        case Value::Kind::INT:   out << v.as_int(); break;
        case Value::Kind::FLOAT: out << render_float(v.as_float()); break;
        case Value::Kind::TEXT:  out << '"' << json_util::escape(v.as_text()) << '"'; break;
        case Value::Kind::LIST: {
            out << "[";
            bool first = true;
            for (const auto& e : v.as_list()) {
                if (!first) out << ", ";
                first = false;
                render_into(e, out);
            }
            out << "]";
            break;
        }
        case Value::Kind::MAP: {
            out << "{";
            bool first = true;
            for (const auto& kv : v.as_map()) {
                if (!first) out << ", ";
                first = false;
                out << '"' << json_util::escape(kv.first) << "\": ";
                render_into(kv.second, out);
            }
            out << "}";
            break;
        }
    }
}

std::string Value::render() const {
    std::ostringstream out;
    render_into(*this, out);
    return out.str();
}

json_object* value_to_json(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::NUL:   return nullptr;
        case Value::Kind::BOOL:  return json_object_new_boolean(v.as_bool() ? 1 : 0);
        case Value::Kind::INT:   return json_object_new_int64(v.as_int());
        case Value::Kind::FLOAT: return json_object_new_double(v.as_float());
        case Value::Kind::TEXT:
            return json_object_new_string_len(v.as_text().c_str(), (int)v.as_text().size());
        case Value::Kind::LIST: {
            json_object* arr = json_object_new_array();
            for (const auto& e : v.as_list()) json_object_array_add(arr, value_to_json(e));
            return arr;
        }
        case Value::Kind::MAP: {
            json_object* obj = json_object_new_object();
            for (const auto& kv : v.as_map()) json_object_object_add(obj, kv.first.c_str(), value_to_json(kv.second));
            return obj;
        }
    }
    return nullptr;
}

Value value_from_json(json_object* o) {
    if (!o) return Value{};
    switch (json_object_get_type(o)) {
        case json_type_null:    return Value{};
        case json_type_boolean: return Value(json_object_get_boolean(o) != 0);
        case json_type_int:     return Value((int64_t)json_object_get_int64(o));
        case json_type_double:  return Value(json_object_get_double(o));
        case json_type_string:
            return Value(std::string(json_object_get_string(o), (size_t)json_object_get_string_len(o)));
        case json_type_array: {
            ValueList l;
            const size_t n = json_object_array_length(o);
            l.reserve(n);
            for (size_t i = 0; i < n; i++) l.push_back(value_from_json(json_object_array_get_idx(o, i)));
            return Value(std::move(l));
        }
        case json_type_object: {
            ValueMap m;
            json_object_object_foreach(o, k, val) {
                m[k] = value_from_json(val);
            }
            return Value(std::move(m));
        }
    }
    return Value{};
}

bool value_parse_json(const std::string& text, Value* out) {
    if (!out) return false;
    // json_tokener rejects a bare top-level null with a null object, which is
    // indistinguishable from failure, so handle it up front.
    std::string trimmed = json_util::trim_ws(text);
    if (trimmed == "null") {
        *out = Value{};
        return true;
    }
    json_util::Doc d = json_util::parse(trimmed);
    if (!d) return false;
    *out = value_from_json(d.root);
    return true;
}

} // namespace gradebench
