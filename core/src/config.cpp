#include "gradebench/config.h"
#include "gradebench/proc.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace gradebench {

Profile detect_profile() {
    const char* env = std::getenv("GRADEBENCH_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("GRADEBENCH_SECCOMP_ENABLE",   "0",    NO_OVERWRITE);
            setenv("GRADEBENCH_CASE_TIMEOUT_MS",  "5000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("GRADEBENCH_SECCOMP_ENABLE",   "1",    NO_OVERWRITE);
            setenv("GRADEBENCH_CASE_TIMEOUT_MS",  "2000", NO_OVERWRITE);
            setenv("GRADEBENCH_WORKERS",          "1",    NO_OVERWRITE);
            setenv("GRADEBENCH_MEMORY_MB",        "256",  NO_OVERWRITE);
            break;
    }
}

static bool env_long(const char* name, long* out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0') {
        std::cerr << "[warn] ignoring " << name << "=" << v << " (not an integer)\n";
        return false;
    }
    *out = n;
    return true;
}

static bool env_double(const char* name, double* out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (errno != 0 || end == v || *end != '\0') {
        std::cerr << "[warn] ignoring " << name << "=" << v << " (not a number)\n";
        return false;
    }
    *out = d;
    return true;
}

static bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && std::string(v) == "1";
}

GradingConfig load_grading_config() {
    GradingConfig cfg;
    long n = 0;
    double d = 0.0;

    if (const char* v = std::getenv("GRADEBENCH_INTERPRETER")) {
        if (*v) cfg.sandbox.interpreter = v;
    }
    if (env_long("GRADEBENCH_CASE_TIMEOUT_MS", &n) && n > 0) cfg.case_timeout_ms = (int)n;
    if (env_long("GRADEBENCH_WORKERS", &n) && n > 0) cfg.workers = (int)n;
    if (env_long("GRADEBENCH_MEMORY_MB", &n) && n > 0) cfg.sandbox.memory_mb = (size_t)n;
    if (env_long("GRADEBENCH_TRACE_MAX_BYTES", &n) && n >= 0) cfg.sandbox.trace_max_bytes = (size_t)n;
    cfg.sandbox.enable_seccomp = env_flag("GRADEBENCH_SECCOMP_ENABLE");

    // Operator-provided jail, e.g. GRADEBENCH_PROC_WRAPPER="bwrap --unshare-all --ro-bind / / --"
    if (env_flag("GRADEBENCH_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("GRADEBENCH_PROC_WRAPPER")) {
            cfg.sandbox.wrapper = split_argv_quoted(w);
            if (cfg.sandbox.wrapper.empty()) {
                std::cerr << "[warn] GRADEBENCH_PROC_WRAPPER could not be parsed; running without wrapper\n";
            }
        }
    }

    if (env_double("GRADEBENCH_RTOL", &d) && d >= 0.0) cfg.tolerance.rtol = d;
    if (env_double("GRADEBENCH_ATOL", &d) && d >= 0.0) cfg.tolerance.atol = d;

    if (env_long("GRADEBENCH_PERF_REPETITIONS", &n) && n > 0) cfg.performance.repetitions = (int)n;
    if (env_double("GRADEBENCH_PERF_DECAY_EXPONENT", &d) && d > 0.0) cfg.performance.decay_exponent = d;
    if (env_double("GRADEBENCH_PERF_FAILURE_THRESHOLD", &d) && d >= 0.0 && d <= 1.0) {
        cfg.performance.failure_threshold = d;
    }
    if (env_double("GRADEBENCH_PERF_FAILURE_CAP", &d) && d >= 0.0 && d <= 1.0) cfg.performance.failure_cap = d;

    return cfg;
}

} // namespace gradebench
