#pragma once

/// @file include/nae/aggregate.hpp
/// @brief Aggregator — revenue and quantity totals grouped by category.
///
/// # Module: Aggregator
///
/// ## Responsibility
/// Reduce a batch of LineItem records to global totals plus one subtotal per
/// category:
///
///     revenue_i          = quantity_i × unit_price_i
///     total_revenue      = Σ revenue_i
///     total_quantity     = Σ quantity_i
///     average_unit_price = Σ unit_price_i / n      (per record, unweighted)
///
/// ## Guarantees
/// - Empty input is an error (EmptyInput), never a zero-valued summary
/// - Categories compare by exact string equality
/// - `per_category` lists groups in order of first appearance, so the same
///   input ordering always yields the same summary
/// - Stateless: safe to call concurrently on disjoint inputs
///
/// ## NOT Responsible For
/// - Parsing records (see data_loader.hpp)
/// - Validating that quantities are non-negative

#include "nae/result.hpp"
#include "nae/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nae::aggregate {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Subtotals for one category.
struct CategoryTotals {
    std::string  category;
    std::int64_t quantity_sum;  ///< Σ quantity over the category's records
    double       revenue_sum;   ///< Σ quantity × unit_price over the same records
};

/// Result of one aggregation call.
struct AggregateSummary {
    double                      total_revenue;
    std::int64_t                total_quantity;
    double                      average_unit_price;
    std::vector<CategoryTotals> per_category;  ///< First-appearance order
    std::size_t                 record_count;

    /// Subtotals for `category`, or nullptr if it never appeared.
    [[nodiscard]] const CategoryTotals* find(std::string_view category) const noexcept;

    /// Multi-line human-readable table.
    [[nodiscard]] std::string to_string() const;
};

// ─── Aggregator ───────────────────────────────────────────────────────────────

/// Stateless grouped-sum calculator.
class Aggregator {
public:
    /// Aggregate a batch of line items.
    ///
    /// # Returns
    /// - `EmptyInput` if `items` is empty
    /// - `InvalidInput` if any unit price is NaN or ±Inf
    /// - Otherwise the summary described in the module header
    [[nodiscard]] static Result<AggregateSummary>
    aggregate(std::span<const LineItem> items) noexcept;
};

}  // namespace nae::aggregate
