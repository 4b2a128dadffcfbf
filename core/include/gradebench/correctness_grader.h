#pragma once
#include "comparator.h"
#include "config.h"
#include "grader.h"
#include "sandbox.h"

namespace gradebench {

// Score = fraction of test cases whose output matches. Each failing case
// adds one issue; a candidate that does not parse gets a single
// syntax_failure issue and no further cases are run.
class CorrectnessGrader : public Grader {
public:
    static constexpr const char* kIdentifier = "correctness";

    explicit CorrectnessGrader(const GradingConfig& cfg);

    std::string identifier() const override { return kIdentifier; }
    bool can_grade(const std::vector<ProblemDefinition>& problems) const override;
    GradingOutput grade(const std::vector<ProblemDefinition>& problems,
                        const std::vector<LLMSolution>& solutions) override;

private:
    SolutionGrade grade_one(const GradingJob& job) const;

    GradingConfig cfg_;
    Sandbox sandbox_;
    Comparator cmp_;
};

} // namespace gradebench
