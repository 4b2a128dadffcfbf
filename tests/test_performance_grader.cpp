#include "test_common.h"
#include "gradebench/performance_grader.h"

#include <cmath>

using namespace gradebench;

static ProblemDefinition sum_problem() {
    ProblemDefinition p;
    p.identifier = "sum_to";
    p.function_prototype.function_name = "sum_to";
    p.function_prototype.parameters = {{"n", "int"}};
    p.function_prototype.return_values = {{"int"}};
    Prompt pr;
    pr.prompt_id = "p1";
    pr.prompt = "Sum the integers 1..n.";
    p.prompts.push_back(pr);
    for (int64_t n : {1000, 2000}) {
        TestCase tc;
        tc.input = {{"n", Value(n)}};
        tc.expected_output = {Value(n * (n + 1) / 2)};
        p.correctness_test_suite.push_back(tc);
    }
    p.optimal_solution = "def sum_to(n):\n    return n * (n + 1) // 2\n";
    return p;
}

int main() {
    // pure scoring pieces
    expect_near(median_ns({}), 0.0, 0.0, "empty median");
    expect_near(median_ns({5, 1, 3}), 3.0, 0.0, "odd median");
    expect_near(median_ns({4, 1, 3, 2}), 2.5, 0.0, "even median");

    expect_near(speed_score(0.5, 1.0), 1.0, 0.0, "faster than optimal is 1");
    expect_near(speed_score(1.0, 1.0), 1.0, 0.0, "equal is 1");
    expect_near(speed_score(4.0, 1.0), 0.25, 1e-12, "4x slower");
    expect_near(speed_score(4.0, 0.5), 0.5, 1e-12, "gentler decay");
    expect_near(speed_score(INFINITY, 1.0), 0.0, 0.0, "infinitely slow");

    PerformanceConfig pc;
    expect_near(performance_score(0.8, 1.0, pc), 0.8, 1e-12, "all correct");
    expect_near(performance_score(1.0, 0.5, pc), 0.5, 1e-12, "at the threshold, no cap");
    expect_near(performance_score(1.0, 0.4, pc), 0.1, 1e-12, "below threshold, capped");
    expect_near(performance_score(0.05, 0.4, pc), 0.02, 1e-12, "cap only lowers");
    expect_near(performance_score(2.0, 1.0, pc), 1.0, 0.0, "clamped to 1");

    GradingConfig cfg;
    cfg.case_timeout_ms = 5000;
    cfg.performance.repetitions = 3;
    cfg.sandbox.calibrate_min_ns = 200000;
    {
        Sandbox probe(cfg.sandbox);
        SKIP_WITHOUT_INTERPRETER(probe, "test_performance_grader");
    }

    const std::vector<ProblemDefinition> problems = {sum_problem()};
    PerformanceGrader grader(cfg);
    expect_eq_str(grader.identifier(), "performance", "identifier");
    expect_true(grader.can_grade(problems), "optimal solution present");

    // same algorithm as the optimal: speed near 1, full correctness
    {
        GradingOutput out = grader.grade(problems, {LLMSolution{"sum_to", "m1", "p1",
            "def sum_to(n):\n    return (n * (n + 1)) // 2\n", std::nullopt}});
        const SolutionGrade& g = out.solution_grades[0];
        expect_true(g.issues.empty(), "no issues");
        expect_near(g.sub_criteria_scores->at("correctness"), 1.0, 1e-12, "all cases correct");
        expect_true(g.score > 0.2 && g.score <= 1.0, "comparable speed scores well: " + std::to_string(g.score));
    }

    // linear loop against a closed form: clearly slower
    {
        GradingOutput out = grader.grade(problems, {LLMSolution{"sum_to", "m1", "p1",
            "def sum_to(n):\n    t = 0\n    for i in range(n + 1):\n        t += i\n    return t\n", std::nullopt}});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.sub_criteria_scores->at("correctness"), 1.0, 1e-12, "still correct");
        expect_true(g.sub_criteria_scores->at("speed") < 0.5, "loop is slower: " +
                    std::to_string(g.sub_criteria_scores->at("speed")));
        expect_near(g.score, g.sub_criteria_scores->at("speed"), 1e-12, "score = speed * 1.0");
    }

    // wrong answers cap the score
    {
        GradingOutput out = grader.grade(problems, {LLMSolution{"sum_to", "m1", "p1",
            "def sum_to(n):\n    return 500500\n", std::nullopt}});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.sub_criteria_scores->at("correctness"), 0.5, 1e-12, "one of two correct");
        expect_eq_ll((long long)g.issues.size(), 1, "one wrong output");
        expect_true(g.score <= 0.5, "score bounded by correctness");
    }

    // a broken reference skips its cases instead of blaming the candidate
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].optimal_solution = "def sum_to(n):\n    raise RuntimeError('broken')\n";
        GradingOutput out = grader.grade(ps, {LLMSolution{"sum_to", "m1", "p1",
            "def sum_to(n):\n    return n * (n + 1) // 2\n", std::nullopt}});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.0, 0.0, "nothing timed");
        expect_eq_ll((long long)g.issues.size(), 2, "one reference issue per case");
        expect_eq_str(g.issues[0].category, issue::REFERENCE_FAILURE, "reference category");
    }

    // no optimal solution
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].optimal_solution.reset();
        expect_true(!grader.can_grade(ps), "not gradable without an optimal solution");
        GradingOutput out = grader.grade(ps, {LLMSolution{"sum_to", "m1", "p1", "def sum_to(n): return 0", std::nullopt}});
        expect_eq_str(out.solution_grades[0].issues[0].category, issue::REFERENCE_FAILURE, "reported");
        expect_near(out.solution_grades[0].score, 0.0, 0.0, "scores 0");
    }

    std::cerr << "test_performance_grader: ALL PASSED" << std::endl;
    return 0;
}
