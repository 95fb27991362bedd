/**
 * @file  prop_aggregate_conservation.cpp
 * @brief Property: ∀ non-empty batch: per-category sums add up to the totals
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_aggregate_conservation
 *
 * Every line item lands in exactly one category, so the category quantity
 * sums must equal the total quantity exactly and the revenue sums must equal
 * total revenue up to summation order.
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <set>
#include <string>
#include <vector>

#include "nae/aggregate.hpp"

using namespace nae;
using namespace nae::aggregate;

namespace {

const char* const kCategories[] = {"Laptop", "Mouse", "Keyboard", "Monitor", "Cable"};

}  // namespace

int main() {
    rc::check(
        "aggregate_conservation: category sums equal totals",
        []() {
            const auto n = *rc::gen::inRange<std::size_t>(1, 200);

            std::vector<LineItem> items;
            std::set<std::string> seen;
            for (std::size_t i = 0; i < n; ++i) {
                const auto c = *rc::gen::inRange<std::size_t>(0, std::size(kCategories));
                const auto q = *rc::gen::inRange<std::int64_t>(-50, 1000);
                const auto p = *rc::gen::inRange<int>(0, 1000000);
                items.push_back(LineItem{kCategories[c], q, static_cast<double>(p) / 100.0});
                seen.insert(kCategories[c]);
            }

            auto r = Aggregator::aggregate(items);
            RC_ASSERT(r.has_value());
            RC_ASSERT(r->record_count == n);
            RC_ASSERT(r->per_category.size() == seen.size());

            std::int64_t quantity = 0;
            double       revenue  = 0.0;
            double       scale    = 1.0;
            for (const auto& c : r->per_category) {
                quantity += c.quantity_sum;
                revenue  += c.revenue_sum;
                scale    += std::abs(c.revenue_sum);
            }
            RC_ASSERT(quantity == r->total_quantity);
            RC_ASSERT(std::abs(revenue - r->total_revenue) <= 1e-9 * scale);

            // First category reported is the first one seen.
            RC_ASSERT(r->per_category.front().category == items.front().category);
        }
    );

    return 0;
}
