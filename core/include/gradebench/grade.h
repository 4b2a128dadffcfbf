#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gradebench {

// Issue categories emitted by the built-in graders.
namespace issue {
inline constexpr const char* WRONG_OUTPUT = "wrong_output";
inline constexpr const char* RUNTIME_FAILURE = "runtime_failure";
inline constexpr const char* SYNTAX_FAILURE = "syntax_failure";
inline constexpr const char* TIMEOUT = "timeout";
inline constexpr const char* REFERENCE_FAILURE = "reference_failure";
} // namespace issue

struct Issue {
    std::string category;
    std::string description;

    bool operator==(const Issue& o) const { return category == o.category && description == o.description; }
};

using SubCriteriaScores = std::map<std::string, double>;

struct SolutionGrade {
    std::string problem_identifier;
    std::string prompt_identifier;
    std::string model_identifier;
    double score{0.0}; // [0, 1]
    std::optional<SubCriteriaScores> sub_criteria_scores;
    std::vector<Issue> issues;
};

struct GradingOutput {
    std::string grader_identifier;
    std::vector<SolutionGrade> solution_grades;

    // Mean of all grade scores; 0.0 when there are none.
    double overall_score() const;
};

} // namespace gradebench
