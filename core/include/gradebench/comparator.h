#pragma once
#include "value.h"

namespace gradebench {

// Float tolerance: |a - b| <= atol + rtol * |b|, b being the expected value.
// Fixed per run; see GradingConfig.
struct Tolerance {
    double rtol{1e-6};
    double atol{1e-9};
};

// Decides whether an observed value matches an expected one.
// - bool, text, int: exact
// - float (or int vs float): tolerance
// - lists: same length, element-wise, in order
// - maps: same key set, value-wise
// Mismatched shapes are a non-match, never an error.
class Comparator {
public:
    Comparator() = default;
    explicit Comparator(Tolerance tol) : tol_(tol) {}

    bool matches(const Value& expected, const Value& actual) const;

    bool numbers_close(double expected, double actual) const;

    const Tolerance& tolerance() const { return tol_; }

private:
    Tolerance tol_;
};

} // namespace gradebench
