#pragma once

/// @file include/nae/types.hpp
/// @brief Shared record types for the Numeric Analytics Engine.
///
/// Every engine module includes this file.  Records are plain aggregates with
/// explicit numeric fields; coercion of loosely typed input happens before a
/// record is built (see data_loader.hpp), so engine code only sees
/// well-formed values.

#include <cstdint>
#include <string>
#include <vector>

namespace nae {

// ─── Records ──────────────────────────────────────────────────────────────────

/// One sold line: how many units of which category at what unit price.
///
/// Revenue (quantity × unit_price) is derived by the Aggregator and is not
/// stored here.  Negative quantities are not rejected by the engine.
struct LineItem {
    std::string  category;    ///< Grouping key, compared exactly (case-sensitive)
    std::int64_t quantity;    ///< Units sold
    double       unit_price;  ///< Price per unit
};

/// A finite sequence of values.  For trend fitting the index of each value
/// is its x-coordinate (0, 1, 2, ...).
using NumericSample = std::vector<double>;

} // namespace nae
