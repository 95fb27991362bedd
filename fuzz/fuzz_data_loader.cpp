/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader CSV and number parsing
 *
 * Build:
 *   cmake -DNAE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed LineItem passes validate_item (non-empty category,
 *      finite unit price).
 *   3. Every number returned by parse_numbers is finite.
 *   4. A header that resolves has all three columns inside its width.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "nae/data_loader.hpp"

using namespace nae::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    // Invariant 2
    for (const auto& item : DataLoader::parse_line_items_csv(input)) {
        assert(DataLoader::validate_item(item));
        assert(!item.category.empty());
        assert(std::isfinite(item.unit_price));
    }

    // Invariant 3
    for (double v : DataLoader::parse_numbers(std::string_view{input})) {
        assert(std::isfinite(v));
    }

    // Invariant 4
    const auto eol = input.find('\n');
    if (const auto cols = DataLoader::parse_header(input.substr(0, eol))) {
        assert(cols->category   < cols->width);
        assert(cols->quantity   < cols->width);
        assert(cols->unit_price < cols->width);
        assert(cols->category != cols->quantity);
        assert(cols->quantity != cols->unit_price);
        assert(cols->category != cols->unit_price);
    }

    return 0;
}
