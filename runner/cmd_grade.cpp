#include "cmd_grade.h"
#include "runner_utils.h"

#include "gradebench/config.h"
#include "gradebench/grader.h"
#include "gradebench/log.h"
#include "gradebench/serialization.h"

#include <iostream>
#include <memory>
#include <stdexcept>

using namespace gradebench;

int cmd_graders(int, char**) {
    for (const auto& id : GraderRegistry::with_builtins().identifiers()) std::cout << id << "\n";
    return 0;
}

int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: gradebench_cli validate <problems.json>...\n";
        return 2;
    }
    int bad = 0;
    for (int i = 2; i < argc; i++) {
        try {
            auto problems = load_problems_file(argv[i]);
            for (const auto& p : problems) {
                std::cout << "OK " << argv[i] << ": " << p.identifier << " " << p.function_prototype.to_string() << "\n";
                if (!has_gradable_tests(p)) {
                    std::cout << "   note: " << p.identifier << " has no test suite and a prompt without samples\n";
                }
            }
        } catch (const std::runtime_error& e) {
            std::cout << "INVALID " << e.what() << "\n";
            bad++;
        }
    }
    return bad == 0 ? 0 : 1;
}

int cmd_grade(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "usage: gradebench_cli grade <problems_dir> <solutions_dir> <grader>[,<grader>...] [--log <path>]\n";
        std::cerr << "env: GRADEBENCH_PROFILE=dev|prod, GRADEBENCH_INTERPRETER, GRADEBENCH_WORKERS, GRADEBENCH_CASE_TIMEOUT_MS\n";
        return 2;
    }
    std::string log_path;
    for (int i = 5; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else {
            std::cerr << "unknown argument: " << a << "\n";
            return 2;
        }
    }

    const GradingConfig cfg = load_grading_config();
    const GraderRegistry registry = GraderRegistry::with_builtins();

    std::vector<std::unique_ptr<Grader>> graders;
    for (const auto& id : split_csv(argv[4])) {
        auto g = registry.create(id, cfg);
        if (!g) {
            std::cerr << "unknown grader: " << id << "\n";
            return 2;
        }
        graders.push_back(std::move(g));
    }
    if (graders.empty()) {
        std::cerr << "no grader selected\n";
        return 2;
    }

    int load_failures = 0;
    std::vector<ProblemDefinition> problems;
    std::vector<LLMSolution> solutions;
    try {
        problems = load_problem_dir(argv[2], &load_failures);
        solutions = load_solution_dir(argv[3], &load_failures);
    } catch (const std::runtime_error& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 2;
    }
    std::cerr << "[grade] " << problems.size() << " problems, " << solutions.size() << " solutions, "
              << cfg.workers << " worker(s), profile " << profile_name(detect_profile()) << "\n";

    std::unique_ptr<JsonlLogger> logger;
    if (!log_path.empty()) {
        logger = std::make_unique<JsonlLogger>(LogHeader{gen_run_id(), profile_name(detect_profile())}, log_path);
        if (!logger->ok()) {
            std::cerr << "[error] cannot write log: " << log_path << "\n";
            return 2;
        }
    }

    json_object* outputs = json_object_new_array();
    int rc = 0;
    for (auto& g : graders) {
        std::vector<ProblemDefinition> gradable;
        for (const auto& p : problems) {
            if (g->can_grade({p})) gradable.push_back(p);
            else std::cerr << "[warn] " << g->identifier() << " cannot grade " << p.identifier << "; skipped\n";
        }
        g->set_logger(logger.get());
        try {
            GradingOutput out = g->grade(gradable, solutions);
            std::cerr << "[grade] " << out.grader_identifier << " overall " << out.overall_score() << "\n";
            json_object_array_add(outputs, grading_output_to_json(out));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[error] " << g->identifier() << ": " << e.what() << "\n";
            rc = 1;
        }
    }
    print_json(outputs);
    if (logger) std::cerr << "[grade] log " << logger->path() << " head " << logger->chain_head() << "\n";
    if (rc == 0 && load_failures > 0) rc = 3;
    return rc;
}
