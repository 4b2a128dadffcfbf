#pragma once
#include "comparator.h"
#include "sandbox.h"

#include <string>

namespace gradebench {

enum class Profile { DEV, PROD };

// Detect profile from GRADEBENCH_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no seccomp, generous case budget)
// PROD: strict (seccomp on, tighter budget and memory, single worker)
void apply_profile_defaults(Profile p);

struct PerformanceConfig {
    int repetitions{5};
    double decay_exponent{1.0};
    double failure_threshold{0.5}; // pass fraction below this caps the score
    double failure_cap{0.1};
};

struct GradingConfig {
    SandboxConfig sandbox;
    int case_timeout_ms{2000};
    int workers{1};
    Tolerance tolerance;
    PerformanceConfig performance;
};

// Read GRADEBENCH_* variables; unset or unparsable values keep the default.
GradingConfig load_grading_config();

} // namespace gradebench
