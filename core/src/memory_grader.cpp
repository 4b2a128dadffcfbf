#include "gradebench/memory_grader.h"
#include "gradebench/json_util.h"
#include "gradebench/performance_grader.h"

#include <algorithm>
#include <iostream>

namespace gradebench {

double memory_ratio_score(double optimal_bytes, double candidate_bytes) {
    if (candidate_bytes <= 0.0) return 1.0;
    return std::min(1.0, std::max(0.0, optimal_bytes) / candidate_bytes);
}

MemoryGrader::MemoryGrader(const GradingConfig& cfg)
    : cfg_(cfg), sandbox_(cfg.sandbox), cmp_(cfg.tolerance) {}

bool MemoryGrader::can_grade(const std::vector<ProblemDefinition>& problems) const {
    for (const auto& p : problems) {
        if (!has_gradable_tests(p)) return false;
        if (!p.optimal_solution || p.optimal_solution->empty()) return false;
    }
    return true;
}

GradingOutput MemoryGrader::grade(const std::vector<ProblemDefinition>& problems,
                                  const std::vector<LLMSolution>& solutions) {
    require_prototypes(problems);

    json_object* begin = json_object_new_object();
    json_object_object_add(begin, "grader", json_util::new_string(kIdentifier));
    json_object_object_add(begin, "problems", json_object_new_int((int)problems.size()));
    json_object_object_add(begin, "solutions", json_object_new_int((int)solutions.size()));
    log_event(logger_, "grade_begin", begin);

    GradingOutput out;
    out.grader_identifier = kIdentifier;
    out.solution_grades = run_jobs(match_jobs(problems, solutions), cfg_.workers,
                                   [this](const GradingJob& job) { return grade_one(job); });

    json_object* end = json_object_new_object();
    json_object_object_add(end, "grader", json_util::new_string(kIdentifier));
    json_object_object_add(end, "grades", json_object_new_int((int)out.solution_grades.size()));
    json_object_object_add(end, "overall_score", json_object_new_double(out.overall_score()));
    log_event(logger_, "grade_end", end);
    return out;
}

SolutionGrade MemoryGrader::grade_one(const GradingJob& job) const {
    SolutionGrade g = make_grade(job);
    const FunctionPrototype& proto = job.problem->function_prototype;
    const FunctionPrototype bound = bound_prototype(job);
    const std::vector<TestCase>& cases = test_set(job);

    if (!job.problem->optimal_solution || job.problem->optimal_solution->empty()) {
        g.issues.push_back(Issue{issue::REFERENCE_FAILURE, "problem has no optimal solution"});
        g.sub_criteria_scores = SubCriteriaScores{{"correctness", 0.0}, {"memory", 0.0}};
        return g;
    }
    const std::string& optimal = *job.problem->optimal_solution;

    ExecuteOptions opts;
    opts.collect_memory = true;
    // one timed call plus one traced call
    const int budget_ms = cfg_.case_timeout_ms * 2;

    size_t evaluated = 0;
    size_t passed = 0;
    size_t measured = 0;
    double candidate_bytes = 0.0;
    double optimal_bytes = 0.0;
    bool unparsable = false;

    for (size_t i = 0; i < cases.size(); i++) {
        const TestCase& tc = cases[i];
        const Value expected = expected_value(proto, tc);
        std::string verdict = "pass";

        ValueList args;
        std::string err;
        if (!ordered_arguments(proto, tc, &args, &err)) {
            evaluated++;
            g.issues.push_back(Issue{issue::RUNTIME_FAILURE, "input: " + tc.describe_input() + "; " + err});
            verdict = issue::RUNTIME_FAILURE;
        } else {
            ExecutionOutcome ref = sandbox_.execute(optimal, proto, args, budget_ms, opts);
            const auto* rs = std::get_if<Success>(&ref);
            if (!rs || !rs->peak_memory_bytes) {
                g.issues.push_back(Issue{issue::REFERENCE_FAILURE,
                                         "input: " + tc.describe_input() + "; reference " + describe_outcome(ref)});
                verdict = issue::REFERENCE_FAILURE;
            } else {
                evaluated++;
                ExecutionOutcome o = sandbox_.execute(job.solution->solution_code, bound, args, budget_ms, opts);
                const auto* s = std::get_if<Success>(&o);
                if (s && cmp_.matches(expected, s->value)) {
                    passed++;
                    if (s->peak_memory_bytes) {
                        measured++;
                        candidate_bytes += (double)*s->peak_memory_bytes;
                        optimal_bytes += (double)*rs->peak_memory_bytes;
                    }
                } else if (const auto* y = std::get_if<SyntaxFailure>(&o)) {
                    g.issues.push_back(Issue{issue::SYNTAX_FAILURE, "candidate does not parse: " + y->message});
                    unparsable = true;
                    verdict = issue::SYNTAX_FAILURE;
                } else {
                    g.issues.push_back(case_issue(tc, expected, o));
                    verdict = g.issues.back().category;
                }
            }
        }

        json_object* ev = grade_ids_json(kIdentifier, g);
        json_object_object_add(ev, "case", json_object_new_int((int)i));
        json_object_object_add(ev, "verdict", json_util::new_string(verdict));
        log_event(logger_, "case_result", ev);

        if (unparsable) break;
    }

    const double pass_fraction = (evaluated == 0 || unparsable) ? 0.0 : (double)passed / (double)evaluated;
    const double memory = (measured > 0 && !unparsable) ? memory_ratio_score(optimal_bytes, candidate_bytes) : 0.0;
    g.score = measured > 0 ? performance_score(memory, pass_fraction, cfg_.performance) : 0.0;
    g.sub_criteria_scores = SubCriteriaScores{{"correctness", pass_fraction}, {"memory", memory}};

    json_object* ev = grade_ids_json(kIdentifier, g);
    json_object_object_add(ev, "score", json_object_new_double(g.score));
    json_object_object_add(ev, "issues", json_object_new_int((int)g.issues.size()));
    json_object_object_add(ev, "candidate_bytes", json_object_new_double(candidate_bytes));
    json_object_object_add(ev, "optimal_bytes", json_object_new_double(optimal_bytes));
    log_event(logger_, "solution_graded", ev);

    std::cerr << "[grade] " << kIdentifier << " " << g.problem_identifier << "/" << g.prompt_identifier
              << " " << g.model_identifier << ": score " << g.score << "\n";
    return g;
}

} // namespace gradebench
