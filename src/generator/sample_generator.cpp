/**
 * @file  sample_generator.cpp
 * @brief Synthetic samples, demo sales and chart series.
 *
 * See generator.hpp for the module contract.
 */

#include "nae/generator.hpp"

#include <fmt/format.h>

#include <iterator>

namespace nae::generator {

// ── Calendar helpers ──────────────────────────────────────────────────────────

std::string format_date(std::chrono::year_month_day date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::chrono::year_month_day today_utc() noexcept {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(now)};
}

// ── DemoSale ──────────────────────────────────────────────────────────────────

std::string DemoSale::to_string() const {
    return fmt::format("{}  {:<10}  {:>4}  {:>10.2f}",
                       date, item.category, item.quantity, item.unit_price);
}

// ── SampleGenerator ───────────────────────────────────────────────────────────

SampleGenerator::SampleGenerator(std::uint64_t seed) noexcept
    : engine_(seed)
{}

SampleGenerator SampleGenerator::from_entropy() {
    std::random_device rd;
    const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
    return SampleGenerator{seed};
}

std::vector<double>
SampleGenerator::normal(std::size_t count, double mean, double stddev) {
    std::normal_distribution<double> dist(mean, stddev);
    std::vector<double> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(dist(engine_));
    }
    return out;
}

std::vector<DemoSale>
SampleGenerator::demo_sales(std::chrono::year_month_day as_of) {
    std::uniform_int_distribution<std::int64_t> quantity(constants::DEMO_MIN_QUANTITY,
                                                         constants::DEMO_MAX_QUANTITY);
    std::uniform_real_distribution<double> price(constants::DEMO_MIN_PRICE,
                                                 constants::DEMO_MAX_PRICE);

    const std::chrono::sys_days last_day{as_of};

    std::vector<DemoSale> out;
    out.reserve(constants::DEMO_SALES_DAYS * std::size(DEMO_PRODUCTS));

    for (std::size_t d = 0; d < constants::DEMO_SALES_DAYS; ++d) {
        const auto day = std::chrono::year_month_day{
            last_day - std::chrono::days{static_cast<int>(d)}};
        const std::string label = format_date(day);

        for (const char* product : DEMO_PRODUCTS) {
            // Draw order is fixed (quantity, then price) so seeded runs repeat.
            const std::int64_t q = quantity(engine_);
            const double       p = price(engine_);
            out.push_back(DemoSale{
                .date = label,
                .item = LineItem{.category = product, .quantity = q, .unit_price = p},
            });
        }
    }
    return out;
}

TimeSeries
SampleGenerator::random_walk(std::chrono::year_month_day start,
                             std::size_t periods,
                             double origin) {
    std::normal_distribution<double> step(0.0, 1.0);
    const std::chrono::sys_days first_day{start};

    TimeSeries series;
    series.kind = "time_series";
    series.labels.reserve(periods);
    series.values.reserve(periods);

    double level = origin;
    for (std::size_t i = 0; i < periods; ++i) {
        level += step(engine_);
        series.values.push_back(level);
        series.labels.push_back(format_date(std::chrono::year_month_day{
            first_day + std::chrono::days{static_cast<int>(i)}}));
    }
    return series;
}

} // namespace nae::generator
