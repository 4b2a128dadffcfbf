#include "cmd_report.h"
#include "runner_utils.h"

#include "gradebench/json_util.h"
#include "gradebench/log.h"
#include "gradebench/report.h"
#include "gradebench/serialization.h"

#include <iostream>
#include <stdexcept>

using namespace gradebench;

int cmd_report(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: gradebench_cli report <memberships.json> <grading_outputs.json>...\n";
        return 2;
    }
    try {
        json_util::Doc m = json_util::parse(read_text_file(argv[2]));
        if (!m) throw SchemaError(std::string(argv[2]) + ": invalid JSON");
        const ProblemSetMemberships memberships = memberships_from_json(m.root);

        std::vector<GradingOutput> outputs;
        for (int i = 3; i < argc; i++) {
            for (auto& o : load_grading_outputs_file(argv[i])) outputs.push_back(std::move(o));
        }
        print_json(report_to_json(aggregate(memberships, outputs)));
    } catch (const std::runtime_error& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int cmd_verify_log(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: gradebench_cli verify_log <grading_log.jsonl>\n";
        return 2;
    }
    std::string err;
    if (!verify_log_chain(argv[2], &err)) {
        std::cout << "VERIFY FAIL: " << err << "\n";
        return 1;
    }
    std::cout << "VERIFY OK\n";
    return 0;
}
