/// @file src/statistics/descriptive_statistics.cpp
/// @brief Implementation of StatisticsCalculator.
///
/// All entry points funnel through one helper that sorts a private copy of
/// the sample once and derives every order statistic from it.

#include "nae/statistics.hpp"
#include "nae/generator.hpp"

#include "../core/numeric_guards.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <numeric>
#include <vector>

namespace nae::statistics {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Everything the three output shapes are built from.
struct Moments {
    StatisticsSummary summary;
    double            sum;
    double            variance;
};

/// Validate, sort and summarise.  Quartiles only when asked for.
Result<Moments> compute_moments(std::span<const double> sample,
                                bool with_quartiles) noexcept {
    if (sample.empty()) {
        return Result<Moments>::failure(ErrorKind::EmptyInput, "No numbers provided");
    }
    if (!detail::all_finite(sample)) {
        return Result<Moments>::failure(ErrorKind::InvalidInput,
                                        "Sample contains NaN or infinite values");
    }

    std::vector<double> sorted(sample.begin(), sample.end());
    std::sort(sorted.begin(), sorted.end());

    const auto   n   = static_cast<double>(sorted.size());
    const double lo  = sorted.front();
    const double hi  = sorted.back();
    const double sum = std::accumulate(sample.begin(), sample.end(), 0.0);

    // Rounding in sum / n can land one ulp outside [min, max] for samples of
    // identical values.
    const double mean = std::clamp(sum / n, lo, hi);

    // Population variance (divide by n).
    double sq_sum = 0.0;
    for (double x : sample) {
        const double d = x - mean;
        sq_sum += d * d;
    }
    const double variance = sq_sum / n;

    // Finite inputs near the double limit can still overflow the sums.
    if (!std::isfinite(sum) || !std::isfinite(variance)) {
        return Result<Moments>::failure(ErrorKind::InvalidInput,
                                        "Values too large to summarise");
    }

    Moments m{
        .summary = StatisticsSummary{
            .mean      = mean,
            .median    = StatisticsCalculator::percentile(sorted, 50.0),
            .std_dev   = std::sqrt(variance),
            .min       = lo,
            .max       = hi,
            .count     = sorted.size(),
            .quartiles = std::nullopt,
        },
        .sum      = sum,
        .variance = variance,
    };

    if (with_quartiles) {
        m.summary.quartiles = Quartiles{
            .q1 = StatisticsCalculator::percentile(sorted, 25.0),
            .q2 = m.summary.median,
            .q3 = StatisticsCalculator::percentile(sorted, 75.0),
        };
    }
    return m;
}

}  // namespace

// ─── StatisticsSummary / ExtendedStatistics ───────────────────────────────────

std::string StatisticsSummary::to_string() const {
    std::string out = fmt::format(
        "count={}  mean={:.4f}  median={:.4f}  std={:.4f}  min={:.4f}  max={:.4f}",
        count, mean, median, std_dev, min, max);
    if (quartiles) {
        out += fmt::format("  q1={:.4f}  q2={:.4f}  q3={:.4f}",
                           quartiles->q1, quartiles->q2, quartiles->q3);
    }
    return out;
}

std::string ExtendedStatistics::to_string() const {
    return fmt::format("{}  sum={:.4f}  variance={:.4f}",
                       summary.to_string(), sum, variance);
}

// ─── StatisticsConfig ─────────────────────────────────────────────────────────

bool StatisticsConfig::valid() const noexcept {
    return min_sample_count >= 1
        && min_sample_count <= max_sample_count
        && std::isfinite(sample_mean)
        && std::isfinite(sample_stddev)
        && sample_stddev > 0.0;
}

// ─── StatisticsCalculator ─────────────────────────────────────────────────────

StatisticsCalculator::StatisticsCalculator(StatisticsConfig config) noexcept
    : config_(config)
{}

double StatisticsCalculator::percentile(std::span<const double> sorted,
                                        double p) noexcept {
    // Precondition: sorted is ascending.
    if (sorted.empty() || std::isnan(p)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const double clamped = std::clamp(p, 0.0, 100.0);
    const double rank    = clamped / 100.0 * static_cast<double>(sorted.size() - 1);

    const auto   below = static_cast<std::size_t>(std::floor(rank));
    const auto   above = std::min(below + 1, sorted.size() - 1);
    const double frac  = rank - static_cast<double>(below);

    // std::lerp is monotonic and exact at both ends, so the result stays
    // within [sorted[below], sorted[above]].
    return std::lerp(sorted[below], sorted[above], frac);
}

Result<StatisticsSummary>
StatisticsCalculator::describe(std::span<const double> sample) const noexcept {
    auto m = compute_moments(sample, false);
    if (!m) return m.error();
    return m->summary;
}

Result<StatisticsSummary>
StatisticsCalculator::describe_with_quartiles(std::span<const double> sample) const noexcept {
    auto m = compute_moments(sample, true);
    if (!m) return m.error();
    return m->summary;
}

Result<ExtendedStatistics>
StatisticsCalculator::describe_with_sum_and_variance(
        std::span<const double> sample) const noexcept {
    auto m = compute_moments(sample, false);
    if (!m) return m.error();
    return ExtendedStatistics{
        .summary  = m->summary,
        .sum      = m->sum,
        .variance = m->variance,
    };
}

Result<std::size_t>
StatisticsCalculator::check_sample_count(std::int64_t count) const noexcept {
    if (count < config_.min_sample_count || count > config_.max_sample_count) {
        return Result<std::size_t>::failure(
            ErrorKind::Range,
            fmt::format("Count must be between {} and {}",
                        config_.min_sample_count, config_.max_sample_count));
    }
    return static_cast<std::size_t>(count);
}

Result<StatisticsSummary>
StatisticsCalculator::describe_sample(std::int64_t count,
                                      generator::SampleGenerator& gen) const {
    if (!config_.valid()) {
        return Result<StatisticsSummary>::failure(
            ErrorKind::InvalidInput, "Statistics configuration is inconsistent");
    }

    auto n = check_sample_count(count);
    if (!n) return n.error();

    const auto values = gen.normal(*n, config_.sample_mean, config_.sample_stddev);
    return describe_with_quartiles(values);
}

}  // namespace nae::statistics
