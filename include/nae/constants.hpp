#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/nae/constants.hpp
/// @brief Engine-wide defaults for the Numeric Analytics Engine.
///
/// These are defaults only. Every bound that callers may want to change per
/// deployment is copied into a config struct (StatisticsConfig, TrendConfig,
/// EngineConfig) and read from there, never from this header directly.

namespace nae::constants {

// ─── Generated Samples ────────────────────────────────────────────────────────

/// Smallest generated-sample size accepted by describe_sample().
static constexpr std::int64_t MIN_SAMPLE_COUNT = 1;

/// Largest generated-sample size accepted by describe_sample().
/// Caps computation and rendered output size.
static constexpr std::int64_t MAX_SAMPLE_COUNT = 10000;

/// Sample size used by the CLI when no count is given.
static constexpr std::int64_t DEFAULT_SAMPLE_COUNT = 100;

/// Location of the normal distribution used for generated samples.
static constexpr double DEFAULT_SAMPLE_MEAN = 100.0;

/// Scale of the normal distribution used for generated samples.
static constexpr double DEFAULT_SAMPLE_STDDEV = 15.0;

// ─── Trend Forecasting ────────────────────────────────────────────────────────

/// Number of future steps forecast when the caller does not choose one.
static constexpr std::int64_t DEFAULT_FORECAST_HORIZON = 3;

/// Largest forecast horizon accepted by the Trend Estimator.
static constexpr std::int64_t MAX_FORECAST_HORIZON = 10000;

/// A line needs two points.
static constexpr std::size_t MIN_TREND_POINTS = 2;

// ─── Demo Data ────────────────────────────────────────────────────────────────

/// Number of consecutive days covered by generated demo sales.
static constexpr std::size_t DEMO_SALES_DAYS = 7;

/// Inclusive quantity range of a generated demo sale.
static constexpr std::int64_t DEMO_MIN_QUANTITY = 1;
static constexpr std::int64_t DEMO_MAX_QUANTITY = 19;

/// Half-open unit-price range [min, max) of a generated demo sale.
static constexpr double DEMO_MIN_PRICE = 10.0;
static constexpr double DEMO_MAX_PRICE = 1000.0;

/// Length and origin of the generated chart series.
static constexpr std::size_t CHART_PERIODS = 30;
static constexpr double CHART_ORIGIN = 100.0;

/// Seed used when neither the caller nor the CLI supplies one.
static constexpr std::uint64_t DEFAULT_SEED = 0x5eed'2026'0101ULL;

} // namespace nae::constants
