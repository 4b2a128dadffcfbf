#pragma once

#include "comparator.h"
#include "config.h"
#include "grader.h"
#include "sandbox.h"

namespace gradebench {

// Compares peak traced allocations of the candidate with the optimal
// solution's over cases the candidate answers correctly:
// m = min(1, sum(optimal peaks) / sum(candidate peaks)).
// score = m * pass_fraction under the performance failure cap.
class MemoryGrader : public Grader {
public:
    static constexpr const char* kIdentifier = "memory";

    explicit MemoryGrader(const GradingConfig& cfg);

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

// Memory factor from summed peaks; 1 when the candidate allocates nothing.
double memory_ratio_score(double optimal_bytes, double candidate_bytes);

} // namespace gradebench
