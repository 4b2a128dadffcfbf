#include "test_common.h"
#include "gradebench/correctness_grader.h"
#include "gradebench/grader.h"
#include "gradebench/memory_grader.h"
#include "gradebench/performance_grader.h"

#include <algorithm>
#include <stdexcept>

using namespace gradebench;

namespace {

// Scores every solution by the length of its code, capped at 1.
class LengthGrader : public Grader {
public:
    std::string identifier() const override { return "length"; }
    bool can_grade(const std::vector<ProblemDefinition>&) const override { return true; }
    GradingOutput grade(const std::vector<ProblemDefinition>& problems,
                        const std::vector<LLMSolution>& solutions) override {
        require_prototypes(problems);
        GradingOutput out;
        out.grader_identifier = identifier();
        for (const auto& job : match_jobs(problems, solutions)) {
            SolutionGrade g = make_grade(job);
            g.score = std::min(1.0, job.solution->solution_code.size() / 100.0);
            out.solution_grades.push_back(g);
        }
        return out;
    }
};

} // namespace

int main() {
    GraderRegistry reg = GraderRegistry::with_builtins();
    expect_true(reg.contains("correctness"), "correctness built in");
    expect_true(reg.contains("performance"), "performance built in");
    expect_true(reg.contains("memory"), "memory built in");
    expect_true(!reg.contains("length"), "not registered yet");

    GradingConfig cfg;
    auto c = reg.create("correctness", cfg);
    expect_true(c != nullptr && c->identifier() == CorrectnessGrader::kIdentifier, "create correctness");
    auto p = reg.create("performance", cfg);
    expect_true(p != nullptr && p->identifier() == PerformanceGrader::kIdentifier, "create performance");
    auto m = reg.create("memory", cfg);
    expect_true(m != nullptr && m->identifier() == MemoryGrader::kIdentifier, "create memory");
    expect_true(reg.create("nope", cfg) == nullptr, "unknown id gives nullptr");

    // duplicates are rejected unless overriding
    bool threw = false;
    try {
        reg.register_grader("correctness", [](const GradingConfig&) { return std::make_unique<LengthGrader>(); });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect_true(threw, "duplicate id rejected");

    threw = false;
    try {
        reg.register_grader("", [](const GradingConfig&) { return std::make_unique<LengthGrader>(); });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect_true(threw, "empty id rejected");

    threw = false;
    try {
        reg.register_grader("null", GraderFactory{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect_true(threw, "null factory rejected");

    // a new strategy plugs in without touching the others
    reg.register_grader("length", [](const GradingConfig&) { return std::make_unique<LengthGrader>(); });
    auto ids = reg.identifiers();
    expect_eq_ll((long long)ids.size(), 4, "four graders");
    expect_eq_str(ids[0], "correctness", "sorted ids");
    expect_eq_str(ids[1], "length", "sorted ids");
    expect_eq_str(ids[2], "memory", "sorted ids");

    ProblemDefinition prob;
    prob.identifier = "add";
    prob.function_prototype.function_name = "add";
    prob.prompts.push_back(Prompt{"p1", "Add.", false, {}, std::nullopt});
    auto lg = reg.create("length", cfg);
    GradingOutput out = lg->grade({prob}, {LLMSolution{"add", "m1", "p1", std::string(50, 'x'), std::nullopt},
                                           LLMSolution{"other", "m1", "p1", "x", std::nullopt}});
    expect_eq_ll((long long)out.solution_grades.size(), 1, "unknown problem skipped");
    expect_near(out.solution_grades[0].score, 0.5, 1e-12, "plugged-in grader ran");

    // override replaces the factory
    reg.register_grader("correctness", [](const GradingConfig&) { return std::make_unique<LengthGrader>(); }, true);
    expect_eq_str(reg.create("correctness", cfg)->identifier(), "length", "override took effect");

    std::cerr << "test_grader_registry: ALL PASSED" << std::endl;
    return 0;
}
