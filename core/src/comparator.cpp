#include "gradebench/comparator.h"

#include <cmath>

namespace gradebench {

bool Comparator::numbers_close(double expected, double actual) const {
    if (std::isnan(expected) || std::isnan(actual)) return std::isnan(expected) && std::isnan(actual);
    if (std::isinf(expected) || std::isinf(actual)) return expected == actual;
    return std::fabs(actual - expected) <= tol_.atol + tol_.rtol * std::fabs(expected);
}

bool Comparator::matches(const Value& expected, const Value& actual) const {
    using K = Value::Kind;
    const K ek = expected.kind();
    const K ak = actual.kind();

    if (ek == K::INT && ak == K::INT) return expected.as_int() == actual.as_int();
    if (expected.is_number() && actual.is_number()) return numbers_close(expected.number(), actual.number());

    if (ek != ak) return false;

    switch (ek) {
        case K::NUL:  return true;
        case K::BOOL: return expected.as_bool() == actual.as_bool();
        case K::TEXT: return expected.as_text() == actual.as_text();
        case K::LIST: {
            const auto& el = expected.as_list();
            const auto& al = actual.as_list();
            if (el.size() != al.size()) return false;
            for (size_t i = 0; i < el.size(); i++) {
                if (!matches(el[i], al[i])) return false;
            }
            return true;
        }
        case K::MAP: {
            const auto& em = expected.as_map();
            const auto& am = actual.as_map();
            if (em.size() != am.size()) return false;
            for (const auto& kv : em) {
                auto it = am.find(kv.first);
                if (it == am.end()) return false;
                if (!matches(kv.second, it->second)) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

} // namespace gradebench
