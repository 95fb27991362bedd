/// @file src/core/data_loader.cpp
/// @brief CSV and free-text parsing into typed engine inputs.

#include "nae/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <new>
#include <optional>
#include <sstream>
#include <string>

namespace nae::core {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // getline drops a trailing empty field ("a,b,")
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

/// Parse the whole of `token` as T.  Leading '+' is accepted.
template <typename T>
std::optional<T> parse_exact(std::string_view token) noexcept {
    if (!token.empty() && token.front() == '+') token.remove_prefix(1);
    if (token.empty()) return std::nullopt;

    T value{};
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

bool is_number_separator(char c) noexcept {
    return c == ',' || c == ';' || c == '[' || c == ']'
        || std::isspace(static_cast<unsigned char>(c));
}

}  // namespace

// ─── DataLoader::validate_item ────────────────────────────────────────────────

bool DataLoader::validate_item(const LineItem& item) noexcept {
    if (item.category.empty())           return false;
    if (!std::isfinite(item.unit_price)) return false;
    return true;
}

// ─── DataLoader::parse_header ─────────────────────────────────────────────────

std::optional<LineItemColumns>
DataLoader::parse_header(const std::string& line) noexcept {
    try {
        const auto fields = split_fields(line);

        std::optional<std::size_t> category, quantity, unit_price;
        auto claim = [](std::optional<std::size_t>& slot, std::size_t i) {
            if (slot) return false;  // duplicate column
            slot = i;
            return true;
        };

        for (std::size_t i = 0; i < fields.size(); ++i) {
            const std::string name = lowercase(fields[i]);
            bool ok = true;
            if (name == "category" || name == "product") {
                ok = claim(category, i);
            } else if (name == "quantity") {
                ok = claim(quantity, i);
            } else if (name == "unit_price" || name == "price") {
                ok = claim(unit_price, i);
            }
            if (!ok) return std::nullopt;
        }

        if (!category || !quantity || !unit_price) return std::nullopt;

        return LineItemColumns{
            .category   = *category,
            .quantity   = *quantity,
            .unit_price = *unit_price,
            .width      = fields.size(),
        };
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<LineItem>
DataLoader::parse_row(const std::string& line,
                      const LineItemColumns& columns) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    try {
        const auto fields = split_fields(line);
        if (fields.size() != columns.width) {
            return std::nullopt;
        }

        const auto quantity = parse_exact<std::int64_t>(fields[columns.quantity]);
        const auto price    = parse_exact<double>(fields[columns.unit_price]);
        if (!quantity || !price) {
            return std::nullopt;
        }

        LineItem item{
            .category   = fields[columns.category],
            .quantity   = *quantity,
            .unit_price = *price,
        };

        if (!validate_item(item)) {
            return std::nullopt;
        }
        return item;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::parse_line_items_csv ─────────────────────────────────────────

std::vector<LineItem>
DataLoader::parse_line_items_csv(const std::string& csv_content) noexcept {
    std::vector<LineItem> items;
    try {
        std::istringstream stream(csv_content);
        std::string line;
        std::optional<LineItemColumns> columns;

        while (std::getline(stream, line)) {
            // Trim carriage return.
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (!columns) {
                // First non-empty, non-comment line is the header.
                if (line.empty() || line[0] == '#') continue;
                columns = parse_header(line);
                if (!columns) return {};
                continue;
            }

            auto item = parse_row(line, *columns);
            if (item) {
                items.push_back(std::move(*item));
            }
        }
    } catch (const std::bad_alloc&) {
        items.clear();
    }
    return items;
}

// ─── DataLoader::load_line_items_csv ──────────────────────────────────────────

std::optional<std::vector<LineItem>>
DataLoader::load_line_items_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_line_items_csv(contents);
}

// ─── DataLoader::parse_numbers ────────────────────────────────────────────────

std::vector<double>
DataLoader::parse_numbers(std::string_view text) noexcept {
    std::vector<double> values;

    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_number_separator(text[pos])) ++pos;
        const std::size_t start = pos;
        while (pos < text.size() && !is_number_separator(text[pos])) ++pos;
        if (pos == start) break;

        const auto value = parse_exact<double>(text.substr(start, pos - start));
        if (value && std::isfinite(*value)) {
            values.push_back(*value);
        }
    }
    return values;
}

}  // namespace nae::core
