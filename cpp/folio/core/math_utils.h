#pragma once

#include <algorithm>
#include <cmath>

namespace folio {

// min(hi, max(lo, v)): when lo > hi the upper bound wins.
inline double clampValue(double value, double lo, double hi) noexcept {
    return std::min(hi, std::max(lo, value));
}

inline bool isFinitePositive(double value) noexcept {
    return std::isfinite(value) && value > 0.0;
}

inline double finiteOr(double value, double fallback) noexcept {
    return std::isfinite(value) ? value : fallback;
}

inline bool nearlyEqual(double a, double b, double eps = 1e-9) noexcept {
    return std::abs(a - b) <= eps;
}

} // namespace folio
