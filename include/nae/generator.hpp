#pragma once

/// @file include/nae/generator.hpp
/// @brief Seedable synthetic data for demos, generated-sample statistics and
///        charts.
///
/// # Module: Sample Generator
///
/// ## Responsibility
/// Produce the synthetic inputs the front end offers when the user has no
/// data of their own:
///   - normal samples for describe_sample()
///   - a week of demo sales across four products
///   - a 30-day random walk for charting
///
/// ## Guarantees
/// - Same seed, same calls → same output (std::mt19937_64)
/// - Not thread-safe: each thread owns its own generator

#include "nae/constants.hpp"
#include "nae/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace nae::generator {

// ─── Types ────────────────────────────────────────────────────────────────────

/// A generated sale: a LineItem stamped with its day.
struct DemoSale {
    std::string date;  ///< YYYY-MM-DD
    LineItem    item;

    /// One table row: date, product, quantity, unit price.
    [[nodiscard]] std::string to_string() const;
};

/// Labelled series for charting.
struct TimeSeries {
    std::vector<std::string> labels;  ///< One YYYY-MM-DD label per value
    std::vector<double>      values;
    std::string              kind;    ///< Always "time_series"
};

/// Products cycled through by demo_sales(), in output order.
inline constexpr const char* DEMO_PRODUCTS[] = {"Laptop", "Mouse", "Keyboard", "Monitor"};

/// First label of the chart series unless the caller picks another day.
inline constexpr std::chrono::year_month_day CHART_START_DATE{
    std::chrono::year{2026}, std::chrono::January, std::chrono::day{1}};

/// Format a calendar date as YYYY-MM-DD.
[[nodiscard]] std::string format_date(std::chrono::year_month_day date);

/// Today's UTC date.
[[nodiscard]] std::chrono::year_month_day today_utc() noexcept;

// ─── SampleGenerator ──────────────────────────────────────────────────────────

class SampleGenerator {
public:
    explicit SampleGenerator(std::uint64_t seed = constants::DEFAULT_SEED) noexcept;

    /// Generator seeded from std::random_device.
    [[nodiscard]] static SampleGenerator from_entropy();

    /// `count` draws from N(mean, stddev²).  Precondition: stddev > 0.
    [[nodiscard]] std::vector<double>
    normal(std::size_t count, double mean, double stddev);

    /// One sale per product per day for DEMO_SALES_DAYS days, newest day
    /// first, ending at `as_of`.  Quantities are uniform in
    /// [DEMO_MIN_QUANTITY, DEMO_MAX_QUANTITY], prices uniform in
    /// [DEMO_MIN_PRICE, DEMO_MAX_PRICE).
    [[nodiscard]] std::vector<DemoSale>
    demo_sales(std::chrono::year_month_day as_of);

    /// Cumulative sum of `periods` standard-normal steps, offset by
    /// `origin`, labelled with consecutive days starting at `start`.
    [[nodiscard]] TimeSeries
    random_walk(std::chrono::year_month_day start = CHART_START_DATE,
                std::size_t periods = constants::CHART_PERIODS,
                double origin = constants::CHART_ORIGIN);

    void reseed(std::uint64_t seed) noexcept { engine_.seed(seed); }

private:
    std::mt19937_64 engine_;
};

} // namespace nae::generator
