#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gradebench {

struct ProcLimits {
    int timeout_ms{2000};           // wall clock; whole process group is SIGKILLed past it
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{1};      // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort, per uid)

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    bool enable_seccomp{false};
    bool seccomp_allow_net{false};

    // Operator-provided jail (nsjail/bwrap/firejail ...) prepended to argv.
    std::vector<std::string> wrapper;
};

// Child environment edits, applied on top of the parent's environment.
struct ProcEnv {
    std::vector<std::pair<std::string, std::string>> set;
    std::vector<std::string> unset;
};

struct ProcResult {
    int exit_code{127};
    int term_signal{0};         // non-zero when the child died from a signal
    bool timed_out{false};
    bool output_truncated{false};
    int elapsed_ms{0};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is resolved through PATH), feed stdin_data, capture
// stdout+stderr (merged), enforce timeout and rlimits. The child gets its own
// process group; on timeout the group is killed and reaped before returning.
// Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      const ProcEnv& env,
                      ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace gradebench
