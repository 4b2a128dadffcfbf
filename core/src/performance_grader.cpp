#include "gradebench/performance_grader.h"
#include "gradebench/json_util.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace gradebench {

double median_ns(std::vector<int64_t> samples) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    const size_t n = samples.size();
    if (n % 2 == 1) return (double)samples[n / 2];
    return ((double)samples[n / 2 - 1] + (double)samples[n / 2]) / 2.0;
}

double speed_score(double ratio, double decay_exponent) {
    if (!(ratio > 1.0)) return 1.0;
    if (std::isinf(ratio)) return 0.0;
    return std::pow(ratio, -decay_exponent);
}

double performance_score(double speed, double pass_fraction, const PerformanceConfig& cfg) {
    double score = speed * pass_fraction;
    if (pass_fraction < cfg.failure_threshold) score = std::min(score, cfg.failure_cap);
    return std::max(0.0, std::min(1.0, score));
}

PerformanceGrader::PerformanceGrader(const GradingConfig& cfg)
    : cfg_(cfg), sandbox_(cfg.sandbox), cmp_(cfg.tolerance) {}

bool PerformanceGrader::can_grade(const std::vector<ProblemDefinition>& problems) const {
    for (const auto& p : problems) {
        if (!has_gradable_tests(p)) return false;
        if (!p.optimal_solution || p.optimal_solution->empty()) return false;
    }
    return true;
}

GradingOutput PerformanceGrader::grade(const std::vector<ProblemDefinition>& problems,
                                       const std::vector<LLMSolution>& solutions) {
    require_prototypes(problems);

    json_object* begin = json_object_new_object();
    json_object_object_add(begin, "grader", json_util::new_string(kIdentifier));
    json_object_object_add(begin, "problems", json_object_new_int((int)problems.size()));
    json_object_object_add(begin, "solutions", json_object_new_int((int)solutions.size()));
    json_object_object_add(begin, "repetitions", json_object_new_int(cfg_.performance.repetitions));
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

SolutionGrade PerformanceGrader::grade_one(const GradingJob& job) const {
    SolutionGrade g = make_grade(job);
    const FunctionPrototype& proto = job.problem->function_prototype;
    const FunctionPrototype bound = bound_prototype(job);
    const std::vector<TestCase>& cases = test_set(job);

    if (!job.problem->optimal_solution || job.problem->optimal_solution->empty()) {
        g.issues.push_back(Issue{issue::REFERENCE_FAILURE, "problem has no optimal solution"});
        g.sub_criteria_scores = SubCriteriaScores{{"correctness", 0.0}, {"speed", 0.0}};
        return g;
    }
    const std::string& optimal = *job.problem->optimal_solution;

    ExecuteOptions opts;
    opts.repetitions = cfg_.performance.repetitions;
    opts.calibrate = true;
    // budget covers calibration plus every repetition of the batch
    const int budget_ms = cfg_.case_timeout_ms * (cfg_.performance.repetitions + 1);

    size_t evaluated = 0;
    size_t passed = 0;
    size_t timed = 0;
    double candidate_ns = 0.0;
    double optimal_ns = 0.0;
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
            if (!rs) {
                g.issues.push_back(Issue{issue::REFERENCE_FAILURE,
                                         "input: " + tc.describe_input() + "; reference " + describe_outcome(ref)});
                verdict = issue::REFERENCE_FAILURE;
            } else {
                evaluated++;
                ExecutionOutcome o = sandbox_.execute(job.solution->solution_code, bound, args, budget_ms, opts);
                const auto* s = std::get_if<Success>(&o);
                if (s && cmp_.matches(expected, s->value)) {
                    passed++;
                    timed++;
                    candidate_ns += median_ns(s->durations_ns);
                    optimal_ns += median_ns(rs->durations_ns);
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
    double speed = 0.0;
    if (timed > 0 && !unparsable) {
        double ratio = 1.0;
        if (optimal_ns > 0.0) ratio = candidate_ns / optimal_ns;
        else if (candidate_ns > 0.0) ratio = INFINITY;
        speed = speed_score(ratio, cfg_.performance.decay_exponent);
    }
    g.score = timed > 0 ? performance_score(speed, pass_fraction, cfg_.performance) : 0.0;
    g.sub_criteria_scores = SubCriteriaScores{{"correctness", pass_fraction}, {"speed", speed}};

    json_object* ev = grade_ids_json(kIdentifier, g);
    json_object_object_add(ev, "score", json_object_new_double(g.score));
    json_object_object_add(ev, "issues", json_object_new_int((int)g.issues.size()));
    json_object_object_add(ev, "candidate_ns", json_object_new_double(candidate_ns));
    json_object_object_add(ev, "optimal_ns", json_object_new_double(optimal_ns));
    log_event(logger_, "solution_graded", ev);

    std::cerr << "[grade] " << kIdentifier << " " << g.problem_identifier << "/" << g.prompt_identifier
              << " " << g.model_identifier << ": score " << g.score << "\n";
    return g;
}

} // namespace gradebench
