/// @file src/core/engine.cpp
/// @brief Engine facade — routes front-end requests to engine components.

#include "nae/engine.hpp"

#include <fmt/core.h>

namespace nae::core {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// One stderr line per call when verbose: "[nae] <op>: ok" / "[nae] <op>: <error>".
template <typename T>
void trace(bool verbose, const char* op, std::size_t n, const Result<T>& result) {
    if (!verbose) return;
    if (result) {
        fmt::print(stderr, "[nae] {} ({} inputs): ok\n", op, n);
    } else {
        fmt::print(stderr, "[nae] {} ({} inputs): {}\n", op, n, result.error().to_string());
    }
}

generator::SampleGenerator make_generator(const EngineConfig& config) {
    if (config.seed) return generator::SampleGenerator{*config.seed};
    return generator::SampleGenerator::from_entropy();
}

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , statistics_(config_.statistics)
    , trend_(config_.trend)
    , generator_(make_generator(config_))
{
    if (config_.verbose && !config_.statistics.valid()) {
        fmt::print(stderr, "[nae] warning: statistics config is inconsistent "
                           "(sample count range [{}, {}], stddev {})\n",
                   config_.statistics.min_sample_count,
                   config_.statistics.max_sample_count,
                   config_.statistics.sample_stddev);
    }
}

// ─── Analysis ─────────────────────────────────────────────────────────────────

Result<aggregate::AggregateSummary>
Engine::analyze_sales(std::span<const LineItem> items) const {
    auto result = aggregate::Aggregator::aggregate(items);
    trace(config_.verbose, "aggregate", items.size(), result);
    return result;
}

Result<statistics::ExtendedStatistics>
Engine::analyze_numbers(std::span<const double> numbers) const {
    auto result = statistics_.describe_with_sum_and_variance(numbers);
    trace(config_.verbose, "describe_with_sum_and_variance", numbers.size(), result);
    return result;
}

Result<statistics::StatisticsSummary>
Engine::sample_statistics(std::int64_t count) {
    auto result = statistics_.describe_sample(count, generator_);
    trace(config_.verbose, "describe_sample", count > 0 ? static_cast<std::size_t>(count) : 0u,
          result);
    return result;
}

Result<trend::TrendForecast>
Engine::predict_trend(std::span<const double> points) const {
    auto result = trend_.fit_and_forecast(points, config_.forecast_horizon);
    trace(config_.verbose, "fit_and_forecast", points.size(), result);
    return result;
}

// ─── Generated data ───────────────────────────────────────────────────────────

std::vector<generator::DemoSale>
Engine::demo_sales(std::chrono::year_month_day as_of) {
    auto sales = generator_.demo_sales(as_of);
    if (config_.verbose) {
        fmt::print(stderr, "[nae] demo_sales: {} records ending {}\n",
                   sales.size(), generator::format_date(as_of));
    }
    return sales;
}

generator::TimeSeries Engine::chart_series() {
    auto series = generator_.random_walk();
    if (config_.verbose) {
        fmt::print(stderr, "[nae] chart_series: {} points\n", series.values.size());
    }
    return series;
}

}  // namespace nae::core
