#include "gradebench/problem.h"
#include "gradebench/json_util.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace gradebench {

FunctionPrototype FunctionPrototype::genericize() const {
    FunctionPrototype g;
    g.function_name = "function";
    for (size_t i = 0; i < parameters.size(); i++) {
        Parameter p;
        // a..z, then a1, b1, ... for very wide signatures
        p.name = std::string(1, (char)('a' + (i % 26)));
        if (i >= 26) p.name += std::to_string(i / 26);
        p.type = parameters[i].type;
        g.parameters.push_back(std::move(p));
    }
    g.return_values = return_values;
    return g;
}

std::string FunctionPrototype::to_string() const {
    std::ostringstream oss;
    oss << function_name << "(";
    for (size_t i = 0; i < parameters.size(); i++) {
        if (i) oss << ", ";
        oss << parameters[i].name << ": " << parameters[i].type;
    }
    oss << ") -> ";
    for (size_t i = 0; i < return_values.size(); i++) {
        if (i) oss << ", ";
        oss << return_values[i].type;
    }
    return oss.str();
}

std::string TestCase::describe_input() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : input) {
        if (!first) oss << ", ";
        first = false;
        oss << kv.first << " = " << kv.second.render();
    }
    return oss.str();
}

const Prompt* ProblemDefinition::find_prompt(const std::string& prompt_id) const {
    for (const auto& p : prompts) {
        if (p.prompt_id == prompt_id) return &p;
    }
    return nullptr;
}

static std::string strip_optional(std::string t) {
    t = json_util::trim_ws(t);
    const std::string pre = "Optional[";
    if (t.size() > pre.size() + 1 && t.compare(0, pre.size(), pre) == 0 && t.back() == ']') {
        return json_util::trim_ws(t.substr(pre.size(), t.size() - pre.size() - 1));
    }
    return t;
}

static std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '\'' && s.back() == '\'') || (s.front() == '"' && s.back() == '"'))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

Value coerce_declared(const std::string& declared_type, const Value& v) {
    if (v.kind() != Value::Kind::TEXT) return v;

    const std::string type = strip_optional(declared_type);
    const std::string raw = json_util::trim_ws(strip_quotes(v.as_text()));

    if (type == "int") {
        errno = 0;
        char* end = nullptr;
        long long n = std::strtoll(raw.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0' && !raw.empty()) return Value((int64_t)n);
        return v;
    }
    if (type == "float") {
        errno = 0;
        char* end = nullptr;
        double d = std::strtod(raw.c_str(), &end);
        if (errno == 0 && end && *end == '\0' && !raw.empty()) return Value(d);
        return v;
    }
    if (type == "bool") {
        const std::string b = lower_ascii(raw);
        if (b == "true") return Value(true);
        if (b == "false") return Value(false);
        return v;
    }
    if (type == "str") {
        return Value(strip_quotes(v.as_text()));
    }
    if (type.find('[') != std::string::npos) {
        Value parsed;
        if (value_parse_json(raw, &parsed)) return parsed;
        return v;
    }
    return v;
}

bool ordered_arguments(const FunctionPrototype& proto,
                       const TestCase& tc,
                       ValueList* out,
                       std::string* err) {
    if (!out) return false;
    out->clear();
    out->reserve(proto.parameters.size());
    for (const auto& p : proto.parameters) {
        auto it = tc.input.find(p.name);
        if (it == tc.input.end()) {
            if (err) *err = "test case input has no value for parameter '" + p.name + "'";
            out->clear();
            return false;
        }
        out->push_back(coerce_declared(p.type, it->second));
    }
    return true;
}

Value expected_value(const FunctionPrototype& proto, const TestCase& tc) {
    const auto& exp = tc.expected_output;
    auto type_at = [&](size_t i) -> std::string {
        return i < proto.return_values.size() ? proto.return_values[i].type : std::string();
    };

    if (exp.size() == 1 && proto.return_values.size() <= 1) {
        return coerce_declared(type_at(0), exp[0]);
    }
    ValueList l;
    l.reserve(exp.size());
    for (size_t i = 0; i < exp.size(); i++) l.push_back(coerce_declared(type_at(i), exp[i]));
    return Value(std::move(l));
}

} // namespace gradebench
