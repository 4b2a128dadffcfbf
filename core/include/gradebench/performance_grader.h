#pragma once
#include "comparator.h"
#include "config.h"
#include "grader.h"
#include "sandbox.h"

#include <cstdint>
#include <vector>

namespace gradebench {

// Times the candidate against the problem's optimal solution on the same
// inputs. r = sum(candidate medians) / sum(optimal medians) over cases both
// ran correctly; speed = 1 for r <= 1, else r^-decay_exponent.
// score = speed * pass_fraction, capped at failure_cap when pass_fraction is
// below failure_threshold.
class PerformanceGrader : public Grader {
public:
    static constexpr const char* kIdentifier = "performance";

    explicit PerformanceGrader(const GradingConfig& cfg);

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

// Median of per-repetition durations; 0 for an empty set.
double median_ns(std::vector<int64_t> samples);

// Speed factor for a candidate/optimal time ratio.
double speed_score(double ratio, double decay_exponent);

// Combine speed and correctness under the failure cap.
double performance_score(double speed, double pass_fraction, const PerformanceConfig& cfg);

} // namespace gradebench
