#include "gradebench/grader.h"
#include "gradebench/correctness_grader.h"
#include "gradebench/json_util.h"
#include "gradebench/log.h"
#include "gradebench/memory_grader.h"
#include "gradebench/performance_grader.h"
#include "gradebench/work_queue.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace gradebench {

double GradingOutput::overall_score() const {
    if (solution_grades.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& g : solution_grades) sum += g.score;
    return sum / (double)solution_grades.size();
}

// ---------- registry ----------

GraderRegistry GraderRegistry::with_builtins() {
    GraderRegistry r;
    r.register_grader(CorrectnessGrader::kIdentifier, [](const GradingConfig& cfg) -> std::unique_ptr<Grader> {
        return std::make_unique<CorrectnessGrader>(cfg);
    });
    r.register_grader(PerformanceGrader::kIdentifier, [](const GradingConfig& cfg) -> std::unique_ptr<Grader> {
        return std::make_unique<PerformanceGrader>(cfg);
    });
    r.register_grader(MemoryGrader::kIdentifier, [](const GradingConfig& cfg) -> std::unique_ptr<Grader> {
        return std::make_unique<MemoryGrader>(cfg);
    });
    return r;
}

void GraderRegistry::register_grader(const std::string& id, GraderFactory factory, bool override_existing) {
    if (id.empty()) throw std::invalid_argument("grader id must not be empty");
    if (!factory) throw std::invalid_argument("grader '" + id + "': null factory");
    if (!override_existing && factories_.count(id)) {
        throw std::invalid_argument("grader '" + id + "' is already registered");
    }
    factories_[id] = std::move(factory);
}

std::unique_ptr<Grader> GraderRegistry::create(const std::string& id, const GradingConfig& cfg) const {
    auto it = factories_.find(id);
    if (it == factories_.end()) return nullptr;
    return it->second(cfg);
}

std::vector<std::string> GraderRegistry::identifiers() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
}

// ---------- plumbing ----------

void require_prototypes(const std::vector<ProblemDefinition>& problems) {
    for (const auto& p : problems) {
        if (p.function_prototype.function_name.empty()) {
            throw std::invalid_argument("problem '" + p.identifier + "' has no function prototype");
        }
    }
}

std::vector<GradingJob> match_jobs(const std::vector<ProblemDefinition>& problems,
                                   const std::vector<LLMSolution>& solutions) {
    std::unordered_map<std::string, const ProblemDefinition*> by_id;
    for (const auto& p : problems) by_id.emplace(p.identifier, &p);

    std::vector<GradingJob> jobs;
    jobs.reserve(solutions.size());
    for (const auto& s : solutions) {
        auto it = by_id.find(s.problem_identifier);
        if (it == by_id.end()) {
            std::cerr << "[warn] no problem '" << s.problem_identifier << "' for solution from "
                      << s.model_identifier << "; skipped\n";
            continue;
        }
        GradingJob job;
        job.problem = it->second;
        job.prompt = it->second->find_prompt(s.prompt_identifier);
        job.solution = &s;
        jobs.push_back(job);
    }
    return jobs;
}

const std::vector<TestCase>& test_set(const GradingJob& job) {
    if (!job.problem->correctness_test_suite.empty() || !job.prompt) {
        return job.problem->correctness_test_suite;
    }
    return job.prompt->sample_inputs_outputs;
}

FunctionPrototype bound_prototype(const GradingJob& job) {
    if (job.prompt && job.prompt->genericize) return job.problem->function_prototype.genericize();
    return job.problem->function_prototype;
}

bool has_gradable_tests(const ProblemDefinition& p) {
    if (p.identifier.empty() || p.function_prototype.function_name.empty() || p.prompts.empty()) return false;
    if (!p.correctness_test_suite.empty()) return true;
    for (const auto& pr : p.prompts) {
        if (pr.sample_inputs_outputs.empty()) return false;
    }
    return true;
}

Issue case_issue(const TestCase& tc, const Value& expected, const ExecutionOutcome& outcome) {
    Issue is;
    std::string observed;
    if (const auto* s = std::get_if<Success>(&outcome)) {
        is.category = issue::WRONG_OUTPUT;
        observed = s->value.render();
    } else if (std::holds_alternative<RuntimeFailure>(outcome)) {
        is.category = issue::RUNTIME_FAILURE;
        observed = describe_outcome(outcome);
    } else if (std::holds_alternative<SyntaxFailure>(outcome)) {
        is.category = issue::SYNTAX_FAILURE;
        observed = describe_outcome(outcome);
    } else {
        is.category = issue::TIMEOUT;
        observed = describe_outcome(outcome);
    }
    is.description = "input: " + tc.describe_input() + "; expected: " + expected.render() + "; observed: " + observed;
    return is;
}

SolutionGrade make_grade(const GradingJob& job) {
    SolutionGrade g;
    g.problem_identifier = job.solution->problem_identifier;
    g.prompt_identifier = job.solution->prompt_identifier;
    g.model_identifier = job.solution->model_identifier;
    return g;
}

void log_event(JsonlLogger* logger, const std::string& name, json_object* payload) {
    json_util::Doc doc{payload};
    if (!logger) return;
    logger->event(name, json_util::to_string(doc.root));
}

json_object* grade_ids_json(const std::string& grader, const SolutionGrade& g) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "grader", json_util::new_string(grader));
    json_object_object_add(o, "problem", json_util::new_string(g.problem_identifier));
    json_object_object_add(o, "prompt", json_util::new_string(g.prompt_identifier));
    json_object_object_add(o, "model", json_util::new_string(g.model_identifier));
    return o;
}

std::vector<SolutionGrade> run_jobs(const std::vector<GradingJob>& jobs,
                                    int workers,
                                    const std::function<SolutionGrade(const GradingJob&)>& grade_one) {
    std::vector<SolutionGrade> out(jobs.size());
    const size_t n_workers = std::min<size_t>(workers > 0 ? (size_t)workers : 1, jobs.size());
    if (n_workers <= 1) {
        for (size_t i = 0; i < jobs.size(); i++) out[i] = grade_one(jobs[i]);
        return out;
    }

    struct Done {
        size_t index{0};
        SolutionGrade grade;
        std::exception_ptr error;
    };

    WorkQueue<size_t> todo;
    for (size_t i = 0; i < jobs.size(); i++) todo.push(i);
    todo.shutdown(); // workers drain, then pop() returns false

    WorkQueue<Done> done;
    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    for (size_t w = 0; w < n_workers; w++) {
        threads.emplace_back([&] {
            size_t i = 0;
            while (todo.pop(i)) {
                Done d;
                d.index = i;
                try {
                    d.grade = grade_one(jobs[i]);
                } catch (...) {
                    d.error = std::current_exception(); // rethrown by the caller
                }
                done.push(std::move(d));
            }
        });
    }

    std::exception_ptr first_error;
    for (size_t k = 0; k < jobs.size(); k++) {
        Done d;
        if (!done.pop(d)) break;
        if (d.error) {
            if (!first_error) first_error = d.error;
            continue;
        }
        out[d.index] = std::move(d.grade);
    }
    for (auto& t : threads) t.join();
    if (first_error) std::rethrow_exception(first_error);
    return out;
}

} // namespace gradebench
