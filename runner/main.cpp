#include "cmd_grade.h"
#include "cmd_report.h"

#include "gradebench/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "gradebench_cli <graders|validate|grade|report|verify_log> ...\n";
        return 2;
    }
    // before any worker thread exists
    gradebench::apply_profile_defaults(gradebench::detect_profile());

    std::string cmd = argv[1];
    if (cmd == "graders") return cmd_graders(argc, argv);
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "grade") return cmd_grade(argc, argv);
    if (cmd == "report") return cmd_report(argc, argv);
    if (cmd == "verify_log") return cmd_verify_log(argc, argv);

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
