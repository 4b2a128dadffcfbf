#pragma once
#include "grade.h"

#include <map>
#include <string>
#include <vector>

namespace gradebench {

// problem identifier -> problem-set name
using ProblemSetMemberships = std::map<std::string, std::string>;

struct TaggedGrade {
    std::string grader_identifier;
    SolutionGrade grade;
};

// Everything below is a plain mean over contributing grades. A cell with no
// contributing grade is absent, never 0.
struct ModelReport {
    std::vector<TaggedGrade> grades;
    std::map<std::string, double> grader_averages;                                // grader
    std::map<std::string, std::map<std::string, double>> problem_set_averages;    // set -> grader
    std::map<std::string, double> problem_set_overall;                            // set, all graders
    std::map<std::string, double> criterion_averages;                             // sub-criterion
};

struct Report {
    std::map<std::string, ModelReport> models; // model identifier
};

// Pure function of its inputs. Grades whose problem has no membership count
// toward grader averages only.
Report aggregate(const ProblemSetMemberships& memberships,
                 const std::vector<GradingOutput>& outputs);

} // namespace gradebench
