/**
 * @file  bench/bench_engine.cpp
 * @brief Google Benchmark suite for the analysis engine.
 *
 * Benchmarks
 * ----------
 *   BM_Aggregate            — category grouping over N line items
 *   BM_Describe             — sort-based summary statistics
 *   BM_DescribeQuartiles    — summary plus q1/q2/q3
 *   BM_TrendFit             — least-squares fit and 3-step forecast
 *   BM_ParseNumbers         — free-text number extraction
 *
 * Build (CMake):
 *   cmake -DNAE_BENCH=ON ..
 *   cmake --build build --target bench_engine
 *   ./build/bench_engine --benchmark_format=json
 *
 * Throughput units: items/second.
 */

#include "benchmark/benchmark.h"

#include "nae/aggregate.hpp"
#include "nae/data_loader.hpp"
#include "nae/generator.hpp"
#include "nae/statistics.hpp"
#include "nae/trend.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <fmt/format.h>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::vector<double> make_sample(std::size_t n) {
    nae::generator::SampleGenerator gen(0xbe7c);
    return gen.normal(n, 100.0, 15.0);
}

static std::vector<nae::LineItem> make_items(std::size_t n) {
    static const char* const names[] = {"Laptop", "Mouse", "Keyboard", "Monitor",
                                        "Cable", "Dock", "Webcam", "Headset"};
    std::vector<nae::LineItem> items;
    items.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back(nae::LineItem{names[i % 8], static_cast<std::int64_t>(i % 19 + 1),
                                      10.0 + static_cast<double>(i % 990)});
    }
    return items;
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_Aggregate(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto items = make_items(n);
    for (auto _ : state) {
        auto r = nae::aggregate::Aggregator::aggregate(items);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Aggregate)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Describe(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto sample = make_sample(n);
    const nae::statistics::StatisticsCalculator calc;
    for (auto _ : state) {
        auto r = calc.describe(sample);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Describe)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_DescribeQuartiles(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto sample = make_sample(n);
    const nae::statistics::StatisticsCalculator calc;
    for (auto _ : state) {
        auto r = calc.describe_with_quartiles(sample);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_DescribeQuartiles)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_TrendFit(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto series = make_sample(n);
    const nae::trend::TrendEstimator estimator;
    for (auto _ : state) {
        auto r = estimator.fit_and_forecast(series);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_TrendFit)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_ParseNumbers(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    std::string text;
    for (double v : make_sample(n)) text += fmt::format("{:.6f}, ", v);
    for (auto _ : state) {
        auto r = nae::core::DataLoader::parse_numbers(text);
        benchmark::DoNotOptimize(r.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_ParseNumbers)->RangeMultiplier(8)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
