#include "gradebench/report.h"

namespace gradebench {

namespace {

struct Mean {
    double sum{0.0};
    size_t count{0};

    void add(double v) { sum += v; count++; }
};

template <typename K>
std::map<K, double> finish(const std::map<K, Mean>& cells) {
    std::map<K, double> out;
    for (const auto& kv : cells) {
        if (kv.second.count > 0) out[kv.first] = kv.second.sum / (double)kv.second.count;
    }
    return out;
}

struct ModelCells {
    std::map<std::string, Mean> by_grader;
    std::map<std::string, std::map<std::string, Mean>> by_set_grader;
    std::map<std::string, Mean> by_set;
    std::map<std::string, Mean> by_criterion;
};

} // namespace

Report aggregate(const ProblemSetMemberships& memberships,
                 const std::vector<GradingOutput>& outputs) {
    Report report;
    std::map<std::string, ModelCells> cells;

    for (const auto& out : outputs) {
        for (const auto& g : out.solution_grades) {
            ModelReport& mr = report.models[g.model_identifier];
            mr.grades.push_back(TaggedGrade{out.grader_identifier, g});

            ModelCells& c = cells[g.model_identifier];
            c.by_grader[out.grader_identifier].add(g.score);

            auto set = memberships.find(g.problem_identifier);
            if (set != memberships.end()) {
                c.by_set_grader[set->second][out.grader_identifier].add(g.score);
                c.by_set[set->second].add(g.score);
            }
            if (g.sub_criteria_scores) {
                for (const auto& kv : *g.sub_criteria_scores) c.by_criterion[kv.first].add(kv.second);
            }
        }
    }

    for (auto& kv : report.models) {
        const ModelCells& c = cells[kv.first];
        ModelReport& mr = kv.second;
        mr.grader_averages = finish(c.by_grader);
        for (const auto& s : c.by_set_grader) {
            auto avg = finish(s.second);
            if (!avg.empty()) mr.problem_set_averages[s.first] = std::move(avg);
        }
        mr.problem_set_overall = finish(c.by_set);
        mr.criterion_averages = finish(c.by_criterion);
    }
    return report;
}

} // namespace gradebench
