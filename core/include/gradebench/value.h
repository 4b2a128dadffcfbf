#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gradebench {

class Value;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

// Plain data that crosses the sandbox boundary in either direction.
// Closed set: null, boolean, integer, float, text, sequence, mapping.
// No live object references ever cross; everything is copied by value.
class Value {
public:
    enum class Kind { NUL, BOOL, INT, FLOAT, TEXT, LIST, MAP };

    Value() = default;
    Value(bool b) : v_(b) {}
    Value(int i) : v_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : v_(i) {}
    Value(double d) : v_(d) {}
    Value(const char* s) : v_(std::string(s ? s : "")) {}
    Value(std::string s) : v_(std::move(s)) {}
    Value(ValueList l) : v_(std::move(l)) {}
    Value(ValueMap m) : v_(std::move(m)) {}

    Kind kind() const { return static_cast<Kind>(v_.index()); }

    bool is_null() const { return kind() == Kind::NUL; }
    bool is_number() const { return kind() == Kind::INT || kind() == Kind::FLOAT; }

    bool as_bool() const { return std::get<bool>(v_); }
    int64_t as_int() const { return std::get<int64_t>(v_); }
    double as_float() const { return std::get<double>(v_); }
    const std::string& as_text() const { return std::get<std::string>(v_); }
    const ValueList& as_list() const { return std::get<ValueList>(v_); }
    const ValueMap& as_map() const { return std::get<ValueMap>(v_); }

    // Integer or float widened to double. Caller checks is_number().
    double number() const { return kind() == Kind::INT ? (double)as_int() : as_float(); }

    // Literal rendering for diagnostics: null, true, 3, 2.5, "s", [1, 2], {"k": 1}
    std::string render() const;

    // Strict structural equality (no tolerance, INT 1 != FLOAT 1.0).
    bool operator==(const Value& o) const { return v_ == o.v_; }
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, ValueList, ValueMap> v_;
};

const char* kind_name(Value::Kind k);

// json-c conversion. value_to_json returns a new reference owned by the caller.
json_object* value_to_json(const Value& v);
Value value_from_json(json_object* o);

// Parse a JSON literal ("[1, 2]", "3", "\"x\""). Returns false on parse error.
bool value_parse_json(const std::string& text, Value* out);

} // namespace gradebench
