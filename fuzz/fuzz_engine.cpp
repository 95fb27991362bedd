/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the Engine analysis paths (end-to-end)
 *
 * Build:
 *   cmake -DNAE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Input is treated as free text, parsed with DataLoader::parse_numbers and
 * fed to analyze_numbers and predict_trend.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Empty parse → EmptyInput from analyze_numbers.
 *   3. Fewer than 2 values → InsufficientData from predict_trend.
 *   4. On success: min ≤ median ≤ max, count matches, variance ≥ 0,
 *      forecast has the configured horizon.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "nae/data_loader.hpp"
#include "nae/engine.hpp"

using namespace nae;
using namespace nae::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    EngineConfig cfg;
    cfg.seed = 1;
    const Engine engine(cfg);

    const auto numbers = DataLoader::parse_numbers(input);

    const auto stats = engine.analyze_numbers(numbers);
    if (numbers.empty()) {
        // Invariant 2
        assert(!stats.has_value());
        assert(stats.error().kind == ErrorKind::EmptyInput);
    } else if (stats.has_value()) {
        // Invariant 4
        assert(stats->summary.count == numbers.size());
        assert(stats->summary.min <= stats->summary.median);
        assert(stats->summary.median <= stats->summary.max);
        assert(!(stats->variance < 0.0));
    }

    const auto forecast = engine.predict_trend(numbers);
    if (numbers.size() < 2) {
        // Invariant 3
        assert(!forecast.has_value());
        assert(forecast.error().kind == ErrorKind::InsufficientData);
    } else if (forecast.has_value()) {
        assert(forecast->predictions.size()
               == static_cast<std::size_t>(cfg.forecast_horizon));
    }

    return 0;
}
