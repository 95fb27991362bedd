#pragma once

/// @file include/nae/data_loader.hpp
/// @brief Text → typed records at the engine boundary.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn loosely formatted user input into LineItem records and numeric
/// samples.  This is the only place where text is coerced into numbers;
/// engine modules receive well-formed values only.
///
/// ## Expected CSV Format
/// ```
/// category,quantity,unit_price
/// Laptop,5,1000
/// Mouse,10,50
/// ```
/// The header decides column positions.  `product` is accepted for
/// `category` and `price` for `unit_price`; other columns (e.g. `date`) are
/// ignored.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when a file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "nae/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nae::core {

/// Column positions resolved from a CSV header row.
struct LineItemColumns {
    std::size_t category;
    std::size_t quantity;
    std::size_t unit_price;
    std::size_t width;  ///< Number of columns in the header
};

class DataLoader {
public:
    /// Load line items from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the header is unusable or no row is valid
    /// - Parsed items otherwise, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<LineItem>>
    load_line_items_csv(const std::string& filepath) noexcept;

    /// Parse line items from CSV text.  Same format as `load_line_items_csv`.
    [[nodiscard]] static std::vector<LineItem>
    parse_line_items_csv(const std::string& csv_content) noexcept;

    /// Resolve column positions from a header row.
    ///
    /// # Returns
    /// `nullopt` unless category/product, quantity and unit_price/price
    /// each appear exactly once (case-insensitive).
    [[nodiscard]] static std::optional<LineItemColumns>
    parse_header(const std::string& line) noexcept;

    /// Extract every finite number from free text.
    ///
    /// Tokens are separated by commas, semicolons, whitespace or square
    /// brackets, so both `1,2,3` and `[1.5, -2, 3e2]` are accepted.  A token
    /// is kept only if it parses completely as a finite double.
    [[nodiscard]] static std::vector<double>
    parse_numbers(std::string_view text) noexcept;

    /// A row is usable if its category is non-empty and its unit price is
    /// finite.
    [[nodiscard]] static bool validate_item(const LineItem& item) noexcept;

private:
    /// Parse one data row using resolved columns.
    [[nodiscard]] static std::optional<LineItem>
    parse_row(const std::string& line, const LineItemColumns& columns) noexcept;
};

}  // namespace nae::core
