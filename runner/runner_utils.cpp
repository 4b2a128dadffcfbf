#include "runner_utils.h"

#include "gradebench/json_util.h"
#include "gradebench/serialization.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <sstream>

namespace gradebench {

std::string gen_run_id() {
    const char* det = std::getenv("GRADEBENCH_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        seed = t ^ (((uint64_t)rd() << 32) ^ (uint64_t)rd());
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

void print_json(json_object* o) {
    json_util::Doc doc{o};
    std::cout << json_util::to_string(doc.root, true) << "\n";
}

template <typename T, typename Load>
static std::vector<T> load_all(const std::vector<std::string>& files, int* failures, Load load) {
    std::vector<T> out;
    for (const auto& f : files) {
        try {
            auto items = load(f);
            for (auto& it : items) out.push_back(std::move(it));
        } catch (const SchemaError& e) {
            std::cerr << "[warn] skipping " << e.what() << "\n";
            if (failures) (*failures)++;
        } catch (const std::runtime_error& e) {
            std::cerr << "[warn] skipping " << f << ": " << e.what() << "\n";
            if (failures) (*failures)++;
        }
    }
    return out;
}

std::vector<ProblemDefinition> load_problem_dir(const std::string& dir, int* failures) {
    return load_all<ProblemDefinition>(list_json_files(dir, false), failures,
                                       [](const std::string& f) { return load_problems_file(f); });
}

std::vector<LLMSolution> load_solution_dir(const std::string& dir, int* failures) {
    return load_all<LLMSolution>(list_json_files(dir, true), failures,
                                 [](const std::string& f) { return load_solutions_file(f); });
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, ',')) {
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

} // namespace gradebench
