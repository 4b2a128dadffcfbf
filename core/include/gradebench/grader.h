#pragma once
#include "config.h"
#include "grade.h"
#include "problem.h"
#include "sandbox.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gradebench {

class JsonlLogger;

// A grading strategy. Implementations are stateless between grade() calls
// apart from their configuration.
class Grader {
public:
    virtual ~Grader() = default;

    virtual std::string identifier() const = 0;

    // True when every problem carries what this grader needs.
    virtual bool can_grade(const std::vector<ProblemDefinition>& problems) const = 0;

    // One SolutionGrade per solution whose problem is present, in solution
    // order. Throws std::invalid_argument for a problem without a prototype,
    // before anything runs.
    virtual GradingOutput grade(const std::vector<ProblemDefinition>& problems,
                                const std::vector<LLMSolution>& solutions) = 0;

    // Optional; not owned. Events: grade_begin, case_result, solution_graded, grade_end.
    void set_logger(JsonlLogger* logger) { logger_ = logger; }

protected:
    JsonlLogger* logger_{nullptr};
};

using GraderFactory = std::function<std::unique_ptr<Grader>(const GradingConfig&)>;

class GraderRegistry {
public:
    // Registry holding "correctness", "performance" and "memory".
    static GraderRegistry with_builtins();

    // Throws std::invalid_argument on an empty id, a null factory, or an id
    // already present (unless override_existing).
    void register_grader(const std::string& id, GraderFactory factory, bool override_existing = false);

    // nullptr for an unknown id.
    std::unique_ptr<Grader> create(const std::string& id, const GradingConfig& cfg) const;

    bool contains(const std::string& id) const { return factories_.count(id) != 0; }
    std::vector<std::string> identifiers() const;

private:
    std::map<std::string, GraderFactory> factories_;
};

// ---------- shared grading plumbing ----------

struct GradingJob {
    const ProblemDefinition* problem{nullptr};
    const Prompt* prompt{nullptr};    // nullptr when the solution names an unknown prompt
    const LLMSolution* solution{nullptr};
};

// Throws std::invalid_argument if a problem has no function name.
void require_prototypes(const std::vector<ProblemDefinition>& problems);

// Pair each solution with its problem, in solution order. Solutions for
// unknown problems are reported on stderr and skipped.
std::vector<GradingJob> match_jobs(const std::vector<ProblemDefinition>& problems,
                                   const std::vector<LLMSolution>& solutions);

// The correctness suite, or the prompt's samples when the suite is empty.
const std::vector<TestCase>& test_set(const GradingJob& job);

// The prototype the candidate is bound with: "function" for genericized prompts.
FunctionPrototype bound_prototype(const GradingJob& job);

// identifier, prototype, prompts, and tests for every prompt.
bool has_gradable_tests(const ProblemDefinition& p);

// Issue for a test case whose outcome is not a matching Success.
Issue case_issue(const TestCase& tc, const Value& expected, const ExecutionOutcome& outcome);

SolutionGrade make_grade(const GradingJob& job);

// Append one event to the grading log, if any. Takes ownership of payload.
void log_event(JsonlLogger* logger, const std::string& name, json_object* payload);
json_object* grade_ids_json(const std::string& grader, const SolutionGrade& g);

// Run grade_one over all jobs on up to `workers` threads. Workers only
// compute; results come back through a queue and are stored by the calling
// thread, in job order. An exception from grade_one is rethrown here after
// all workers have been joined.
std::vector<SolutionGrade> run_jobs(const std::vector<GradingJob>& jobs,
                                    int workers,
                                    const std::function<SolutionGrade(const GradingJob&)>& grade_one);

} // namespace gradebench
