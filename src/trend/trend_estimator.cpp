/**
 * @file  trend_estimator.cpp
 * @brief Least-squares trend fit and extrapolation.
 *
 * See trend.hpp for the model.  The fit uses the centred closed form rather
 * than solving XᵀX β = Xᵀy: with x = 0..n−1 the centred sums are exact for
 * the x side, and a constant series yields a slope of exactly 0.
 */

#include "nae/trend.hpp"

#include "../core/numeric_guards.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nae::trend {

// ── Direction ─────────────────────────────────────────────────────────────────

std::string_view to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Increasing: return "increasing";
        case Direction::Decreasing: return "decreasing";
        case Direction::Flat:       return "flat";
    }
    return "unknown";
}

// ── TrendForecast ─────────────────────────────────────────────────────────────

std::string TrendForecast::to_string() const {
    return fmt::format("slope={:.4f}  intercept={:.4f}  trend={}  predictions=[{:.4f}]",
                       slope, intercept, trend::to_string(direction),
                       fmt::join(predictions, ", "));
}

// ── TrendEstimator ────────────────────────────────────────────────────────────

TrendEstimator::TrendEstimator(TrendConfig config) noexcept
    : config_(config)
{}

Result<LinearFit>
TrendEstimator::fit(std::span<const double> points) noexcept {
    if (points.size() < constants::MIN_TREND_POINTS) {
        return Result<LinearFit>::failure(ErrorKind::InsufficientData,
                                          "Need at least 2 data points");
    }
    if (!detail::all_finite(points)) {
        return Result<LinearFit>::failure(ErrorKind::InvalidInput,
                                          "Data points contain NaN or infinite values");
    }

    const auto n = static_cast<Eigen::Index>(points.size());
    const Eigen::Map<const Eigen::ArrayXd> y(points.data(), n);

    // x = 0, 1, …, n−1 (unit step, exact in double).
    const Eigen::ArrayXd x = Eigen::ArrayXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));

    const double x_mean = 0.5 * static_cast<double>(n - 1);
    const double y_mean = y.mean();

    const Eigen::ArrayXd dx = x - x_mean;
    const double sxx = dx.square().sum();          // > 0 for n ≥ 2
    const double sxy = (dx * (y - y_mean)).sum();

    const double slope     = sxy / sxx;
    const double intercept = y_mean - slope * x_mean;
    if (!std::isfinite(slope) || !std::isfinite(intercept)) {
        return Result<LinearFit>::failure(ErrorKind::InvalidInput,
                                          "Values too large to fit");
    }
    return LinearFit{
        .slope     = slope,
        .intercept = intercept,
    };
}

Result<TrendForecast>
TrendEstimator::fit_and_forecast(std::span<const double> points,
                                 std::int64_t horizon) const noexcept {
    auto line = fit(points);
    if (!line) return line.error();

    if (horizon < 1 || horizon > config_.max_horizon) {
        return Result<TrendForecast>::failure(
            ErrorKind::Range,
            fmt::format("Forecast horizon must be between 1 and {}, got {}",
                        config_.max_horizon, horizon));
    }

    const auto first_x = static_cast<double>(points.size());
    std::vector<double> predictions;
    predictions.reserve(static_cast<std::size_t>(horizon));
    for (std::int64_t k = 0; k < horizon; ++k) {
        predictions.push_back(line->at(first_x + static_cast<double>(k)));
    }
    if (!detail::all_finite(predictions)) {
        return Result<TrendForecast>::failure(ErrorKind::InvalidInput,
                                              "Forecast values too large to represent");
    }

    return TrendForecast{
        .slope       = line->slope,
        .intercept   = line->intercept,
        .predictions = std::move(predictions),
        .direction   = classify(line->slope),
    };
}

Direction TrendEstimator::classify(double slope) const noexcept {
    if (slope > 0.0) return Direction::Increasing;
    if (config_.direction_rule == DirectionRule::StrictPositive) {
        return Direction::Decreasing;
    }
    return slope < 0.0 ? Direction::Decreasing : Direction::Flat;
}

}  // namespace nae::trend
