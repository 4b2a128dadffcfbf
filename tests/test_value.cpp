#include "test_common.h"
#include "gradebench/json_util.h"
#include "gradebench/value.h"

using namespace gradebench;

int main() {
    // Rendering
    expect_eq_str(Value().render(), "null", "null renders");
    expect_eq_str(Value(true).render(), "true", "bool renders");
    expect_eq_str(Value(-3).render(), "-3", "int renders");
    expect_eq_str(Value(2.5).render(), "2.5", "float renders");
    expect_eq_str(Value(3.0).render(), "3.0", "integral float keeps a decimal point");
    expect_eq_str(Value("a\"b").render(), "\"a\\\"b\"", "text is quoted and escaped");
    expect_eq_str(Value(ValueList{1, 2}).render(), "[1, 2]", "list renders");
    expect_eq_str(Value(ValueMap{{"k", Value(1)}}).render(), "{\"k\": 1}", "map renders");

    // Kinds
    expect_true(Value(1).kind() == Value::Kind::INT, "int kind");
    expect_true(Value(int64_t(1) << 40).kind() == Value::Kind::INT, "int64 kind");
    expect_true(Value(1.0).is_number() && Value(1).is_number(), "numbers");
    expect_true(!Value(true).is_number(), "bool is not a number");
    expect_true(Value(1) != Value(1.0), "strict equality separates int and float");
    expect_eq_str(kind_name(Value::Kind::MAP), "map", "kind name");

    // JSON parsing keeps int vs float apart
    Value v;
    expect_true(value_parse_json("[1, 2.5, \"x\", null, true, {\"a\": [3]}]", &v), "parse list");
    const auto& l = v.as_list();
    expect_eq_ll((long long)l.size(), 6, "list size");
    expect_true(l[0].kind() == Value::Kind::INT, "1 is int");
    expect_true(l[1].kind() == Value::Kind::FLOAT, "2.5 is float");
    expect_true(l[3].is_null(), "null element");
    expect_eq_ll(l[5].as_map().at("a").as_list()[0].as_int(), 3, "nested map");

    expect_true(value_parse_json(" null ", &v) && v.is_null(), "bare null parses");
    expect_true(!value_parse_json("[1, 2", &v), "truncated JSON rejected");

    // json-c conversion back and forth
    json_util::Doc doc{value_to_json(Value(ValueMap{{"xs", Value(ValueList{1, 2})}, {"s", Value("t")}}))};
    expect_eq_str(json_util::to_string(doc.root), "{\"s\":\"t\",\"xs\":[1,2]}", "map to json");
    Value back = value_from_json(doc.root);
    expect_eq_ll(back.as_map().at("xs").as_list()[1].as_int(), 2, "json back to value");

    std::cerr << "test_value: ALL PASSED" << std::endl;
    return 0;
}
