#pragma once

/// @file include/nae/trend.hpp
/// @brief Trend Estimator — least-squares line through an ordered series and
///        forward extrapolation.
///
/// # Module: Trend Estimator
///
/// ## Model
/// `points[i]` is the observation at x = i.  The fitted line minimises
/// Σ (yᵢ − (slope·i + intercept))²:
///
///     x̄         = (n − 1) / 2
///     slope     = Σ (i − x̄)(yᵢ − ȳ) / Σ (i − x̄)²
///     intercept = ȳ − slope · x̄
///
/// Forecasts evaluate the line at x = n, n + 1, …, n + horizon − 1.
///
/// ## Direction
/// `DirectionRule::ThreeWay` (default) reports Flat for a slope of exactly
/// zero.  `DirectionRule::StrictPositive` reproduces the two-state rule
/// (slope > 0 increasing, anything else decreasing) for callers that depend
/// on it.
///
/// ## Guarantees
/// - O(n), single deterministic fit; no outlier handling or intervals
/// - Fewer than 2 points → InsufficientData
/// - horizon outside [1, config.max_horizon] → Range

#include "nae/constants.hpp"
#include "nae/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nae::trend {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class Direction { Increasing, Decreasing, Flat };

/// "increasing", "decreasing" or "flat".
[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

/// How a slope is turned into a Direction.
enum class DirectionRule {
    ThreeWay,        ///< > 0 increasing, < 0 decreasing, == 0 flat
    StrictPositive,  ///< > 0 increasing, otherwise decreasing
};

struct TrendConfig {
    DirectionRule direction_rule = DirectionRule::ThreeWay;
    std::int64_t  max_horizon    = constants::MAX_FORECAST_HORIZON;
};

/// y = slope · x + intercept
struct LinearFit {
    double slope;
    double intercept;

    [[nodiscard]] double at(double x) const noexcept { return slope * x + intercept; }
};

/// A fitted line and its extrapolation.
struct TrendForecast {
    double              slope;
    double              intercept;
    std::vector<double> predictions;  ///< One value per forecast step
    Direction           direction;

    [[nodiscard]] std::string to_string() const;
};

// ─── TrendEstimator ───────────────────────────────────────────────────────────

class TrendEstimator {
public:
    explicit TrendEstimator(TrendConfig config = TrendConfig{}) noexcept;

    /// Ordinary least-squares line over the implicit x = 0..n−1.
    ///
    /// # Returns
    /// `InsufficientData` for fewer than 2 points, `InvalidInput` if any
    /// point is NaN or ±Inf or the fitted line overflows.
    [[nodiscard]] static Result<LinearFit>
    fit(std::span<const double> points) noexcept;

    /// Fit `points` and forecast the next `horizon` values.
    [[nodiscard]] Result<TrendForecast>
    fit_and_forecast(std::span<const double> points,
                     std::int64_t horizon = constants::DEFAULT_FORECAST_HORIZON) const noexcept;

    /// Apply the configured DirectionRule to a slope.
    [[nodiscard]] Direction classify(double slope) const noexcept;

    [[nodiscard]] const TrendConfig& config() const noexcept { return config_; }

private:
    TrendConfig config_;
};

}  // namespace nae::trend
