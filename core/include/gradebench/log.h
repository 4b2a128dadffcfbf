#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace gradebench {

struct LogHeader {
    std::string run_id;
    std::string profile_id;
};

// Append-only JSONL grading log. Each line is canonical JSON (sorted keys)
// carrying chain_prev/chain_hash, chain_hash = SHA256(chain_prev || record),
// so editing or dropping a line breaks every hash after it.
// Thread-safe; step numbers are assigned in call order.
class JsonlLogger {
public:
    JsonlLogger(const LogHeader& hdr, const std::string& path);

    bool ok() const { return out_.good(); }
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    std::string chain_head() const;

private:
    LogHeader hdr_;
    std::string path_;
    std::ofstream out_;
    mutable std::mutex mu_;
    std::string chain_prev_;
    int step_{0};
};

// Canonical (sorted-key, compact) rendering of a JSON document. Returns the
// input unchanged when it does not parse.
std::string canonicalize_json(const std::string& raw);

// Re-derive the chain over a log file. Returns false and sets *err at the
// first line whose chain_prev or chain_hash does not match.
bool verify_log_chain(const std::string& path, std::string* err);

} // namespace gradebench
