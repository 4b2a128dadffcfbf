#include "test_common.h"
#include "gradebench/hash.h"
#include "gradebench/log.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace gradebench;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

int main() {
    // SHA-256 known answers
    expect_eq_str(hash::sha256_hex(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256(\"\")");
    expect_eq_str(hash::sha256_hex("abc"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256(abc)");
    expect_eq_str(hash::sha256_hex("ab", "c"), hash::sha256_hex("abc"), "concatenation");
    {
        std::string million(1000000, 'a');
        expect_eq_str(hash::sha256_hex(million),
                      "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0", "sha256(a * 10^6)");
    }

    // Canonical form
    expect_eq_str(canonicalize_json("{ \"b\": 1, \"a\": {\"d\": [1, 2], \"c\": null} }"),
                  "{\"a\":{\"c\":null,\"d\":[1,2]},\"b\":1}", "sorted keys, no whitespace");
    expect_eq_str(canonicalize_json("not json"), "not json", "unparsable passes through");

    const std::string path = "test_log.jsonl";
    std::remove(path.c_str());
    std::string head;
    {
        JsonlLogger log(LogHeader{"run-42", "DEV"}, path);
        expect_true(log.ok(), "log opens");
        expect_eq_str(log.chain_head(), std::string(64, '0'), "genesis chain head");
        log.event("grade_begin", "{\"grader\": \"correctness\"}");
        log.event("case_result", "{\"verdict\": \"pass\", \"case\": 0}");
        log.event("note", "plain text payload");
        head = log.chain_head();
        expect_true(head != std::string(64, '0'), "chain advanced");
    }

    auto lines = read_lines(path);
    expect_eq_ll((long long)lines.size(), 3, "one line per event");
    expect_true(contains(lines[0], "\"run_id\":\"run-42\""), "run id recorded");
    expect_true(contains(lines[1], "\"payload\":{\"case\":0,\"verdict\":\"pass\"}"), "payload canonicalized");
    expect_true(contains(lines[2], "\"payload\":\"plain text payload\""), "non-JSON payload kept as text");
    expect_true(contains(lines[2], "\"step\":2"), "steps count up");
    expect_true(contains(lines[2], "\"chain_hash\":\"" + head + "\""), "last hash is the chain head");

    std::string err;
    expect_true(verify_log_chain(path, &err), "intact chain verifies: " + err);

    // tamper: edit a payload
    {
        auto t = lines;
        size_t pos = t[1].find("\"pass\"");
        t[1].replace(pos, 6, "\"fail\"");
        write_lines(path, t);
        err.clear();
        expect_true(!verify_log_chain(path, &err), "edited line detected");
        expect_true(contains(err, "line 2"), "error names the line: " + err);
    }

    // tamper: drop a line
    {
        write_lines(path, {lines[0], lines[2]});
        err.clear();
        expect_true(!verify_log_chain(path, &err), "dropped line detected");
        expect_true(contains(err, "chain_prev"), "prev mismatch: " + err);
    }

    // concurrent writers still produce one valid chain
    {
        {
            JsonlLogger log(LogHeader{"run-43", "PROD"}, path);
            std::vector<std::thread> ts;
            for (int w = 0; w < 4; w++) {
                ts.emplace_back([&log, w] {
                    for (int i = 0; i < 25; i++) {
                        log.event("case_result", "{\"worker\": " + std::to_string(w) + "}");
                    }
                });
            }
            for (auto& t : ts) t.join();
        }
        expect_eq_ll((long long)read_lines(path).size(), 100, "all events written");
        err.clear();
        expect_true(verify_log_chain(path, &err), "concurrent chain verifies: " + err);
    }

    expect_true(!verify_log_chain("does-not-exist.jsonl", &err), "missing file fails");

    std::remove(path.c_str());
    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
