#pragma once
#include "value.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gradebench {

struct Parameter {
    std::string name;
    std::string type; // advisory, e.g. "int", "List[str]", "Optional[float]"
};

struct ReturnValue {
    std::string type;
};

struct FunctionPrototype {
    std::string function_name;
    std::vector<Parameter> parameters;
    std::vector<ReturnValue> return_values;

    // Prototype shown for a genericized prompt: "function(a, b, ...)".
    FunctionPrototype genericize() const;

    // "add(a: int, b: int) -> int"
    std::string to_string() const;
};

struct TestCase {
    ValueMap input;               // parameter name -> literal
    ValueList expected_output;    // index = return value position

    // "a = 4, b = 7"
    std::string describe_input() const;
};

struct Prompt {
    std::string prompt_id;
    std::string prompt;
    bool genericize{false};
    std::vector<TestCase> sample_inputs_outputs;
    std::optional<std::string> input_code;
};

struct ProblemDefinition {
    std::string identifier;
    std::vector<Prompt> prompts;
    FunctionPrototype function_prototype;
    std::vector<TestCase> correctness_test_suite;
    std::optional<std::string> optimal_solution;
    std::optional<std::vector<std::string>> tags;
    // Unknown top-level fields, kept as raw JSON text for round-tripping.
    std::map<std::string, std::string> additional_fields;

    const Prompt* find_prompt(const std::string& prompt_id) const;
};

struct LLMSolution {
    std::string problem_identifier;
    std::string model_identifier;
    std::string prompt_identifier;
    std::string solution_code;
    std::optional<std::string> feedback; // raw JSON text
};

// Parse a literal according to its declared type when it arrived as text
// ("5" for an int, "[1, 2]" for a List[int]). Non-text values and values that
// do not parse are returned unchanged. "Optional[T]" is treated as T.
Value coerce_declared(const std::string& declared_type, const Value& v);

// Positional arguments for a test case, in prototype parameter order.
// Returns false (and sets *err) when a parameter is missing from the input.
bool ordered_arguments(const FunctionPrototype& proto,
                       const TestCase& tc,
                       ValueList* out,
                       std::string* err);

// The value the function is expected to return for a test case: the single
// expected element for one declared return value, else the whole sequence.
Value expected_value(const FunctionPrototype& proto, const TestCase& tc);

} // namespace gradebench
