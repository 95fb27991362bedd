#pragma once

/// @file include/nae/statistics.hpp
/// @brief Descriptive Statistics Calculator — central tendency, dispersion and
///        quantiles over an unordered sample.
///
/// # Module: Descriptive Statistics
///
/// ## Formulas
/// For a sample x₁..xₙ sorted ascending as x₍₀₎..x₍ₙ₋₁₎:
///
///     mean     = Σ xᵢ / n
///     variance = Σ (xᵢ − mean)² / n          (population, not n − 1)
///     std_dev  = √variance
///     P(p)     = lerp(x₍ₖ₎, x₍ₖ₊₁₎, r − k),  r = p/100 · (n − 1), k = ⌊r⌋
///     median   = P(50)
///
/// P is the linear-interpolation percentile, so an even-sized sample has the
/// mean of its two middle values as median.
///
/// ## Output Shapes
/// - `describe`                       — StatisticsSummary, no quartiles
/// - `describe_with_quartiles`        — StatisticsSummary with q1/q2/q3
/// - `describe_with_sum_and_variance` — ExtendedStatistics (adds sum, variance)
/// - `describe_sample`                — generated normal sample, with quartiles
///
/// ## Guarantees
/// - Empty input is an error (EmptyInput)
/// - min ≤ median ≤ max and min ≤ mean ≤ max for every accepted sample
/// - const member functions are safe to call concurrently

#include "nae/constants.hpp"
#include "nae/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace nae::generator {
class SampleGenerator;
}

namespace nae::statistics {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Values at percentile ranks 25, 50 and 75.
struct Quartiles {
    double q1;
    double q2;
    double q3;
};

/// Central tendency and dispersion of one sample.
struct StatisticsSummary {
    double                   mean;
    double                   median;
    double                   std_dev;    ///< Population standard deviation
    double                   min;
    double                   max;
    std::size_t              count;
    std::optional<Quartiles> quartiles;  ///< Only set by the quartile-aware entry points

    [[nodiscard]] std::string to_string() const;
};

/// StatisticsSummary plus aggregate totals.
struct ExtendedStatistics {
    StatisticsSummary summary;
    double            sum;
    double            variance;  ///< Population variance, std_dev²

    [[nodiscard]] std::string to_string() const;
};

/// Bounds and distribution used by the generated-sample mode.
struct StatisticsConfig {
    std::int64_t min_sample_count = constants::MIN_SAMPLE_COUNT;
    std::int64_t max_sample_count = constants::MAX_SAMPLE_COUNT;
    double       sample_mean      = constants::DEFAULT_SAMPLE_MEAN;
    double       sample_stddev    = constants::DEFAULT_SAMPLE_STDDEV;

    /// True when 1 ≤ min ≤ max, the mean is finite and stddev > 0.
    [[nodiscard]] bool valid() const noexcept;
};

// ─── StatisticsCalculator ─────────────────────────────────────────────────────

/// Descriptive statistics over numeric samples.
///
/// Holds only its configuration; every call works on a private sorted copy
/// of the input.
class StatisticsCalculator {
public:
    explicit StatisticsCalculator(StatisticsConfig config = StatisticsConfig{}) noexcept;

    /// Mean, median, population std-dev, min, max and count.
    ///
    /// # Returns
    /// `EmptyInput` for an empty sample, `InvalidInput` if any value is NaN
    /// or ±Inf.
    [[nodiscard]] Result<StatisticsSummary>
    describe(std::span<const double> sample) const noexcept;

    /// As `describe`, with `quartiles` populated.
    [[nodiscard]] Result<StatisticsSummary>
    describe_with_quartiles(std::span<const double> sample) const noexcept;

    /// As `describe`, plus sum and population variance.
    [[nodiscard]] Result<ExtendedStatistics>
    describe_with_sum_and_variance(std::span<const double> sample) const noexcept;

    /// Draw `count` values from the configured normal distribution and
    /// describe them with quartiles.
    ///
    /// # Returns
    /// `Range` if `count` lies outside
    /// [config.min_sample_count, config.max_sample_count]; the generator is
    /// not advanced in that case.  `InvalidInput`, checked first, if the
    /// config is not valid().
    [[nodiscard]] Result<StatisticsSummary>
    describe_sample(std::int64_t count, generator::SampleGenerator& gen) const;

    /// Validate a requested generated-sample size.
    [[nodiscard]] Result<std::size_t>
    check_sample_count(std::int64_t count) const noexcept;

    /// Linear-interpolation percentile of an ascending-sorted span.  `p` is
    /// clamped to [0, 100].  NaN for an empty span or a NaN `p`.
    [[nodiscard]] static double
    percentile(std::span<const double> sorted, double p) noexcept;

    [[nodiscard]] const StatisticsConfig& config() const noexcept { return config_; }

private:
    StatisticsConfig config_;
};

}  // namespace nae::statistics
