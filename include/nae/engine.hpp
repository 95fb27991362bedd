#pragma once

/// @file include/nae/engine.hpp
/// @brief Engine facade — one entry point per front-end command.
///
/// # Module: Engine
///
/// ## Responsibility
/// Own the per-deployment configuration and the sample generator, and route
/// each request to the component that serves it:
///
///     analyze_sales      → Aggregator::aggregate
///     analyze_numbers    → StatisticsCalculator::describe_with_sum_and_variance
///     sample_statistics  → StatisticsCalculator::describe_sample
///     predict_trend      → TrendEstimator::fit_and_forecast
///     demo_sales / chart_series → SampleGenerator
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto items = DataLoader::load_line_items_csv("sales.csv");
/// if (items) {
///     auto summary = engine.analyze_sales(*items);
///     if (summary) fmt::print("{}\n", summary->to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Failures are returned, never thrown
/// - Analysis calls are const; only the generator-backed calls mutate
/// - When `verbose` is set, one diagnostic line per call goes to stderr

#include "nae/aggregate.hpp"
#include "nae/constants.hpp"
#include "nae/generator.hpp"
#include "nae/result.hpp"
#include "nae/statistics.hpp"
#include "nae/trend.hpp"
#include "nae/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace nae::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    statistics::StatisticsConfig statistics{};
    trend::TrendConfig           trend{};

    /// Steps forecast by predict_trend().
    std::int64_t forecast_horizon = constants::DEFAULT_FORECAST_HORIZON;

    /// Generator seed.  Unset → seeded from std::random_device.
    std::optional<std::uint64_t> seed;

    /// If true, emit one debug line per call to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    [[nodiscard]] Result<aggregate::AggregateSummary>
    analyze_sales(std::span<const LineItem> items) const;

    [[nodiscard]] Result<statistics::ExtendedStatistics>
    analyze_numbers(std::span<const double> numbers) const;

    [[nodiscard]] Result<statistics::StatisticsSummary>
    sample_statistics(std::int64_t count = constants::DEFAULT_SAMPLE_COUNT);

    [[nodiscard]] Result<trend::TrendForecast>
    predict_trend(std::span<const double> points) const;

    /// A week of generated sales ending at `as_of`.
    [[nodiscard]] std::vector<generator::DemoSale>
    demo_sales(std::chrono::year_month_day as_of);

    /// Generated random-walk chart series.
    [[nodiscard]] generator::TimeSeries chart_series();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig                     config_;
    statistics::StatisticsCalculator statistics_;
    trend::TrendEstimator            trend_;
    generator::SampleGenerator       generator_;
};

}  // namespace nae::core
