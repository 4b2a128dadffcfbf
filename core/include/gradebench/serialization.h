#pragma once

#include "grade.h"
#include "problem.h"
#include "report.h"

#include <json-c/json.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace gradebench {

// Malformed problem/solution/grade input. The message names the offending
// field path, e.g. "prompts[0].prompt_id: expected string".
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- parsing (throw SchemaError) ---

TestCase test_case_from_json(json_object* o, const std::string& where = "test_case");
FunctionPrototype prototype_from_json(json_object* o, const std::string& where = "function_prototype");
ProblemDefinition problem_from_json(json_object* o);
LLMSolution solution_from_json(json_object* o);
SolutionGrade grade_from_json(json_object* o, const std::string& where = "grade");
GradingOutput grading_output_from_json(json_object* o);
ProblemSetMemberships memberships_from_json(json_object* o);

// --- emitting (new references owned by the caller) ---

json_object* test_case_to_json(const TestCase& tc);
json_object* problem_to_json(const ProblemDefinition& p);
json_object* solution_to_json(const LLMSolution& s);
json_object* grade_to_json(const SolutionGrade& g);
json_object* grading_output_to_json(const GradingOutput& out);
json_object* report_to_json(const Report& r);

// --- files ---

// Throws std::runtime_error when the file cannot be read.
std::string read_text_file(const std::string& path);

// A file holds one object or an array of objects. Throws SchemaError with
// the path prefixed on malformed content.
std::vector<ProblemDefinition> load_problems_file(const std::string& path);
std::vector<LLMSolution> load_solutions_file(const std::string& path);
std::vector<GradingOutput> load_grading_outputs_file(const std::string& path);

// Regular *.json files below dir (recursive when asked), sorted, hidden
// entries skipped.
std::vector<std::string> list_json_files(const std::string& dir, bool recursive);

} // namespace gradebench
