#pragma once
/**
 * @file  numeric_guards.hpp
 * @brief Finite-value checks shared by the engine modules.
 *
 * Module:  src/core/
 *
 * Internal header; not installed.  Needs src/ on the include path.
 */

#include <cmath>
#include <span>

namespace nae::detail {

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] inline bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

} // namespace nae::detail
