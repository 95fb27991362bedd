/// @file src/aggregate/aggregator.cpp
/// @brief Grouped revenue/quantity aggregation.

#include "nae/aggregate.hpp"

#include <cmath>
#include <fmt/format.h>
#include <unordered_map>

namespace nae::aggregate {

// ─── AggregateSummary ─────────────────────────────────────────────────────────

const CategoryTotals*
AggregateSummary::find(std::string_view category) const noexcept {
    for (const auto& group : per_category) {
        if (group.category == category) return &group;
    }
    return nullptr;
}

std::string AggregateSummary::to_string() const {
    std::string out = fmt::format(
        "Records: {}   Total quantity: {}   Total revenue: {:.2f}   Avg unit price: {:.2f}\n",
        record_count, total_quantity, total_revenue, average_unit_price);

    out += fmt::format("  {:<20} {:>12} {:>16}\n", "Category", "Quantity", "Revenue");
    for (const auto& group : per_category) {
        out += fmt::format("  {:<20} {:>12} {:>16.2f}\n",
                           group.category, group.quantity_sum, group.revenue_sum);
    }
    return out;
}

// ─── Aggregator ───────────────────────────────────────────────────────────────

Result<AggregateSummary>
Aggregator::aggregate(std::span<const LineItem> items) noexcept {
    if (items.empty()) {
        return Result<AggregateSummary>::failure(
            ErrorKind::EmptyInput, "No sales data provided");
    }

    AggregateSummary summary{
        .total_revenue      = 0.0,
        .total_quantity     = 0,
        .average_unit_price = 0.0,
        .per_category       = {},
        .record_count       = items.size(),
    };

    // category → index into per_category, preserving first-appearance order
    std::unordered_map<std::string, std::size_t> index;
    double price_sum = 0.0;

    for (const auto& item : items) {
        if (!std::isfinite(item.unit_price)) {
            return Result<AggregateSummary>::failure(
                ErrorKind::InvalidInput,
                fmt::format("Non-finite unit price for category '{}'", item.category));
        }

        const double revenue = static_cast<double>(item.quantity) * item.unit_price;

        auto [it, inserted] = index.try_emplace(item.category, summary.per_category.size());
        if (inserted) {
            summary.per_category.push_back(CategoryTotals{
                .category     = item.category,
                .quantity_sum = 0,
                .revenue_sum  = 0.0,
            });
        }

        CategoryTotals& group = summary.per_category[it->second];
        group.quantity_sum += item.quantity;
        group.revenue_sum  += revenue;

        summary.total_quantity += item.quantity;
        summary.total_revenue  += revenue;
        price_sum              += item.unit_price;
    }

    // Unweighted: every record counts once regardless of its quantity.
    summary.average_unit_price = price_sum / static_cast<double>(items.size());

    return summary;
}

}  // namespace nae::aggregate
