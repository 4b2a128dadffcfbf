#include "gradebench/correctness_grader.h"
#include "gradebench/json_util.h"

#include <iostream>

namespace gradebench {

CorrectnessGrader::CorrectnessGrader(const GradingConfig& cfg)
    : cfg_(cfg), sandbox_(cfg.sandbox), cmp_(cfg.tolerance) {}

bool CorrectnessGrader::can_grade(const std::vector<ProblemDefinition>& problems) const {
    for (const auto& p : problems) {
        if (!has_gradable_tests(p)) return false;
    }
    return true;
}

GradingOutput CorrectnessGrader::grade(const std::vector<ProblemDefinition>& problems,
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

SolutionGrade CorrectnessGrader::grade_one(const GradingJob& job) const {
    SolutionGrade g = make_grade(job);
    const FunctionPrototype& proto = job.problem->function_prototype;
    const FunctionPrototype bound = bound_prototype(job);
    const std::vector<TestCase>& cases = test_set(job);

    size_t passed = 0;
    bool unparsable = false;
    for (size_t i = 0; i < cases.size(); i++) {
        const TestCase& tc = cases[i];
        const Value expected = expected_value(proto, tc);
        std::string verdict = "pass";

        ValueList args;
        std::string err;
        if (!ordered_arguments(proto, tc, &args, &err)) {
            g.issues.push_back(Issue{issue::RUNTIME_FAILURE, "input: " + tc.describe_input() + "; " + err});
            verdict = issue::RUNTIME_FAILURE;
        } else {
            ExecutionOutcome o = sandbox_.execute(job.solution->solution_code, bound, args, cfg_.case_timeout_ms);
            const auto* s = std::get_if<Success>(&o);
            if (s && cmp_.matches(expected, s->value)) {
                passed++;
            } else if (const auto* y = std::get_if<SyntaxFailure>(&o)) {
                g.issues.push_back(Issue{issue::SYNTAX_FAILURE, "candidate does not parse: " + y->message});
                unparsable = true;
                verdict = issue::SYNTAX_FAILURE;
            } else {
                g.issues.push_back(case_issue(tc, expected, o));
                verdict = g.issues.back().category;
            }
        }

        json_object* ev = grade_ids_json(kIdentifier, g);
        json_object_object_add(ev, "case", json_object_new_int((int)i));
        json_object_object_add(ev, "verdict", json_util::new_string(verdict));
        log_event(logger_, "case_result", ev);

        if (unparsable) break;
    }

    g.score = (cases.empty() || unparsable) ? 0.0 : (double)passed / (double)cases.size();
    if (job.problem->tags && !job.problem->tags->empty()) {
        SubCriteriaScores sub;
        for (const auto& tag : *job.problem->tags) sub[tag] = g.score;
        g.sub_criteria_scores = sub;
    }

    json_object* ev = grade_ids_json(kIdentifier, g);
    json_object_object_add(ev, "score", json_object_new_double(g.score));
    json_object_object_add(ev, "issues", json_object_new_int((int)g.issues.size()));
    log_event(logger_, "solution_graded", ev);

    std::cerr << "[grade] " << kIdentifier << " " << g.problem_identifier << "/" << g.prompt_identifier
              << " " << g.model_identifier << ": " << passed << "/" << cases.size() << "\n";
    return g;
}

} // namespace gradebench
