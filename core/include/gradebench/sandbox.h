#pragma once
#include "problem.h"
#include "value.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gradebench {

// ---------- ExecutionOutcome ----------
// Exactly one alternative per invocation. The sandbox never throws; every
// failure it can observe (parse error, exception, crash, limit, timeout,
// unusable reply) ends up as one of these.

struct Success {
    Value value;
    std::string stdout_text;            // what the candidate printed; diagnostic only
    std::vector<int64_t> durations_ns;  // one entry per repetition, measured in-child
    std::optional<int64_t> peak_memory_bytes; // tracemalloc peak, only when collected
};

struct RuntimeFailure {
    std::string message;
    std::string trace; // candidate frames only, truncated
};

struct SyntaxFailure {
    std::string message;
};

struct Timeout {
    int elapsed_ms{0};
};

using ExecutionOutcome = std::variant<Success, RuntimeFailure, SyntaxFailure, Timeout>;

// One-line summary: "returned 3", "runtime failure: ZeroDivisionError: ...",
// "syntax failure: ...", "timed out after 2000 ms".
std::string describe_outcome(const ExecutionOutcome& o);

// ---------- Sandbox ----------

struct SandboxConfig {
    std::string interpreter{"python3"};
    std::vector<std::string> wrapper;   // operator jail prepended to argv (nsjail, bwrap ...)

    size_t memory_mb{512};              // RLIMIT_AS of the interpreter
    size_t trace_max_bytes{2048};
    size_t stdout_max_bytes{4096};      // candidate output kept per invocation
    size_t reply_max_bytes{8 * 1024 * 1024};
    bool enable_seccomp{false};

    // Calibrated runs grow the batch size by 10x until a batch takes this long.
    int64_t calibrate_min_ns{2000000};

    // Parent of the per-invocation working directories. Empty: $TMPDIR or /tmp.
    std::string temp_root;
};

struct ExecuteOptions {
    int repetitions{1};
    bool calibrate{false};
    // Extra untimed pass per repetition reporting the peak of traced allocations.
    bool collect_memory{false};
};

class Sandbox {
public:
    explicit Sandbox(SandboxConfig cfg = SandboxConfig{});

    // Run proto.function_name from `source` once (or opts.repetitions times)
    // with `args`, in a fresh interpreter process and a fresh private
    // directory, both gone when this returns. time_budget_ms bounds the whole
    // child, interpreter start-up included.
    ExecutionOutcome execute(const std::string& source,
                             const FunctionPrototype& proto,
                             const ValueList& args,
                             int time_budget_ms,
                             const ExecuteOptions& opts = ExecuteOptions{}) const;

    // True when the configured interpreter starts and exits cleanly.
    bool interpreter_available() const;

    const SandboxConfig& config() const { return cfg_; }

private:
    SandboxConfig cfg_;
};

} // namespace gradebench
