#include "test_common.h"
#include "gradebench/correctness_grader.h"
#include "gradebench/log.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace gradebench;

static TestCase make_case(int64_t a, int64_t b, int64_t sum) {
    TestCase tc;
    tc.input = {{"a", Value(a)}, {"b", Value(b)}};
    tc.expected_output = {Value(sum)};
    return tc;
}

static ProblemDefinition add_problem() {
    ProblemDefinition p;
    p.identifier = "add";
    p.function_prototype.function_name = "add";
    p.function_prototype.parameters = {{"a", "int"}, {"b", "int"}};
    p.function_prototype.return_values = {{"int"}};
    Prompt pr;
    pr.prompt_id = "p1";
    pr.prompt = "Return the sum of a and b.";
    pr.sample_inputs_outputs.push_back(make_case(1, 1, 2));
    p.prompts.push_back(pr);
    Prompt gen = pr;
    gen.prompt_id = "generic";
    gen.genericize = true;
    p.prompts.push_back(gen);
    p.correctness_test_suite = {make_case(4, 7, 11), make_case(-5, -2, -7)};
    p.tags = std::vector<std::string>{"basic", "arithmetic"};
    return p;
}

static LLMSolution solution(const std::string& model, const std::string& prompt, const std::string& code) {
    return LLMSolution{"add", model, prompt, code, std::nullopt};
}

int main() {
    GradingConfig cfg;
    cfg.case_timeout_ms = 5000;
    {
        Sandbox probe(cfg.sandbox);
        SKIP_WITHOUT_INTERPRETER(probe, "test_correctness_grader");
    }

    const std::vector<ProblemDefinition> problems = {add_problem()};
    CorrectnessGrader grader(cfg);
    expect_eq_str(grader.identifier(), "correctness", "identifier");
    expect_true(grader.can_grade(problems), "problem with a suite is gradable");

    // perfect candidate
    {
        GradingOutput out = grader.grade(problems, {solution("m1", "p1", "def add(a, b):\n    return a + b\n")});
        expect_eq_str(out.grader_identifier, "correctness", "output grader id");
        expect_eq_ll((long long)out.solution_grades.size(), 1, "one grade");
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 1.0, 1e-12, "all cases pass");
        expect_true(g.issues.empty(), "no issues");
        expect_true(g.sub_criteria_scores && g.sub_criteria_scores->at("basic") == 1.0, "tags mirror score");
        expect_eq_str(g.model_identifier, "m1", "model carried over");
    }

    // wrong output on the positive case only
    {
        GradingOutput out = grader.grade(problems, {solution("m1", "p1",
            "def add(a, b):\n    return a - b if a > 0 else a + b\n")});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.5, 1e-12, "one of two cases passes");
        expect_eq_ll((long long)g.issues.size(), 1, "one issue per failing case");
        expect_eq_str(g.issues[0].category, issue::WRONG_OUTPUT, "wrong output category");
        expect_true(contains(g.issues[0].description, "expected: 11") &&
                    contains(g.issues[0].description, "observed: -3"), "issue cites expected and observed");
    }

    // 4 - 7 and -5 - (-2) both come out as -3
    {
        GradingOutput out = grader.grade(problems, {solution("m1", "p1", "def add(a, b):\n    return a - b\n")});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.0, 1e-12, "no case passes");
        expect_eq_ll((long long)g.issues.size(), 2, "two wrong outputs");
        for (const auto& is : g.issues) {
            expect_eq_str(is.category, issue::WRONG_OUTPUT, "category");
            expect_true(contains(is.description, "observed: -3"), "observed value: " + is.description);
        }
    }

    // grading twice gives the same grades
    {
        const std::vector<LLMSolution> sols = {
            solution("m1", "p1", "def add(a, b):\n    return a - b\n"),
            solution("m2", "p1", "def add(a, b):\n    return a + b\n"),
        };
        GradingOutput first = grader.grade(problems, sols);
        GradingOutput second = grader.grade(problems, sols);
        expect_eq_ll((long long)first.solution_grades.size(), (long long)second.solution_grades.size(), "same count");
        for (size_t i = 0; i < first.solution_grades.size(); i++) {
            const SolutionGrade& a = first.solution_grades[i];
            const SolutionGrade& b = second.solution_grades[i];
            expect_eq_str(a.model_identifier, b.model_identifier, "same order");
            expect_near(a.score, b.score, 0.0, "same score");
            expect_eq_ll((long long)a.issues.size(), (long long)b.issues.size(), "same issue count");
            for (size_t k = 0; k < a.issues.size(); k++) {
                expect_eq_str(a.issues[k].category, b.issues[k].category, "same category");
                expect_eq_str(a.issues[k].description, b.issues[k].description, "same description");
            }
            expect_true(a.sub_criteria_scores == b.sub_criteria_scores, "same sub-criteria");
        }
    }

    // unparsable candidate: one issue, score 0
    {
        GradingOutput out = grader.grade(problems, {solution("m1", "p1", "def add(a, b)\n    return a + b\n")});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.0, 1e-12, "syntax failure scores 0");
        expect_eq_ll((long long)g.issues.size(), 1, "single syntax issue");
        expect_eq_str(g.issues[0].category, issue::SYNTAX_FAILURE, "syntax category");
    }

    // runtime failure and timeout are issues, not errors
    {
        GradingConfig tight = cfg;
        tight.case_timeout_ms = 300;
        CorrectnessGrader fast(tight);
        GradingOutput out = fast.grade(problems, {solution("m1", "p1",
            "def add(a, b):\n    if a < 0:\n        raise ValueError('negative')\n    while True:\n        pass\n")});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.0, 1e-12, "nothing passes");
        expect_eq_ll((long long)g.issues.size(), 2, "two issues");
        expect_eq_str(g.issues[0].category, issue::TIMEOUT, "loop times out");
        expect_eq_str(g.issues[1].category, issue::RUNTIME_FAILURE, "raise is a runtime failure");
        expect_true(contains(g.issues[1].description, "ValueError"), "runtime issue names the exception");
    }

    // genericized prompt binds "function" with a, b, ...
    {
        GradingOutput out = grader.grade(problems, {solution("m1", "generic", "def function(a, b):\n    return a + b\n")});
        expect_near(out.solution_grades[0].score, 1.0, 1e-12, "genericized binding");
    }

    // samples stand in for an empty suite
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].correctness_test_suite.clear();
        GradingOutput out = grader.grade(ps, {solution("m1", "p1", "def add(a, b):\n    return 2\n")});
        expect_near(out.solution_grades[0].score, 1.0, 1e-12, "sample case add(1, 1) == 2");
    }

    // a case missing a parameter is reported against that case only
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].correctness_test_suite[1].input.erase("b");
        GradingOutput out = grader.grade(ps, {solution("m1", "p1", "def add(a, b):\n    return a + b\n")});
        const SolutionGrade& g = out.solution_grades[0];
        expect_near(g.score, 0.5, 1e-12, "other case still runs");
        expect_eq_str(g.issues[0].category, issue::RUNTIME_FAILURE, "missing parameter category");
        expect_true(contains(g.issues[0].description, "'b'"), "names the parameter");
    }

    // solutions for unknown problems are skipped; order follows the solutions
    {
        GradingConfig par = cfg;
        par.workers = 3;
        CorrectnessGrader pool(par);
        std::vector<LLMSolution> sols = {
            solution("m1", "p1", "def add(a, b):\n    return a + b\n"),
            LLMSolution{"missing", "m1", "p1", "def f(): pass", std::nullopt},
            solution("m2", "p1", "def add(a, b):\n    return 0\n"),
            solution("m3", "p1", "def add(a, b):\n    return a + b\n"),
            solution("m4", "p1", "def add(a, b):\n    return a - b\n"),
        };
        GradingOutput out = pool.grade(problems, sols);
        expect_eq_ll((long long)out.solution_grades.size(), 4, "unknown problem skipped");
        expect_eq_str(out.solution_grades[0].model_identifier, "m1", "order 0");
        expect_eq_str(out.solution_grades[1].model_identifier, "m2", "order 1");
        expect_eq_str(out.solution_grades[2].model_identifier, "m3", "order 2");
        expect_eq_str(out.solution_grades[3].model_identifier, "m4", "order 3");
        expect_near(out.solution_grades[2].score, 1.0, 1e-12, "m3 correct");
        expect_near(out.overall_score(), 0.5, 1e-12, "overall mean");
    }

    // events go to the grading log
    {
        const std::string path = "test_correctness_grader.jsonl";
        std::remove(path.c_str());
        {
            JsonlLogger log(LogHeader{"run-1", "DEV"}, path);
            expect_true(log.ok(), "log opens");
            grader.set_logger(&log);
            grader.grade(problems, {solution("m1", "p1", "def add(a, b):\n    return a + b\n")});
            grader.set_logger(nullptr);
        }
        std::ifstream in(path);
        std::string line, all;
        int lines = 0;
        while (std::getline(in, line)) { all += line + "\n"; lines++; }
        expect_eq_ll(lines, 5, "grade_begin, two case_result, solution_graded, grade_end");
        expect_true(contains(all, "\"case_result\"") && contains(all, "\"grade_end\""), "event names");
        std::string err;
        expect_true(verify_log_chain(path, &err), "log chain verifies: " + err);
        std::remove(path.c_str());
    }

    // problems without a prototype are rejected before anything runs
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].function_prototype.function_name.clear();
        expect_true(!grader.can_grade(ps), "no prototype, not gradable");
        bool threw = false;
        try {
            grader.grade(ps, {solution("m1", "p1", "def add(a, b):\n    return a + b\n")});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "invalid_argument for missing prototype");
    }

    // no tests at all
    {
        std::vector<ProblemDefinition> ps = problems;
        ps[0].correctness_test_suite.clear();
        ps[0].prompts[1].sample_inputs_outputs.clear();
        expect_true(!grader.can_grade(ps), "a prompt without samples and no suite");
    }

    std::cerr << "test_correctness_grader: ALL PASSED" << std::endl;
    return 0;
}
