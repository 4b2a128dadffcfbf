#pragma once

#include "gradebench/problem.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace gradebench {

std::string gen_run_id();

// Print a json-c document to stdout (pretty) and release it.
void print_json(json_object* o);

// Every problem file directly under dir. Files that fail validation are
// reported on stderr and skipped; *failures counts them.
std::vector<ProblemDefinition> load_problem_dir(const std::string& dir, int* failures);

// Every solution file below dir (<model>/<problem>/<prompt>.json or flat).
std::vector<LLMSolution> load_solution_dir(const std::string& dir, int* failures);

std::vector<std::string> split_csv(const std::string& s);

} // namespace gradebench
