/// @file tests/trend/test_trend_estimator.cpp
/// @brief Tests for TrendEstimator — least-squares fit and forecast.

#include "nae/trend.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace nae;
using namespace nae::trend;

// ─── fit ─────────────────────────────────────────────────────────────────────

TEST(TrendEstimator_Fit, PerfectLineRecovered) {
    std::vector<double> points = {10, 20, 30, 40, 50};
    auto fit = TrendEstimator::fit(points);
    ASSERT_TRUE(fit.has_value());
    EXPECT_DOUBLE_EQ(fit->slope, 10.0);
    EXPECT_DOUBLE_EQ(fit->intercept, 10.0);
}

TEST(TrendEstimator_Fit, TwoPointsDefineTheLine) {
    std::vector<double> points = {3.0, 1.0};
    auto fit = TrendEstimator::fit(points);
    ASSERT_TRUE(fit.has_value());
    EXPECT_DOUBLE_EQ(fit->slope, -2.0);
    EXPECT_DOUBLE_EQ(fit->intercept, 3.0);
}

TEST(TrendEstimator_Fit, NoisyDataMatchesClosedForm) {
    // x = 0..4, y = {1, 3, 2, 5, 4}
    // x̄ = 2, ȳ = 3, Σdx·dy = (−2)(−2)+(−1)(0)+0+(1)(2)+(2)(1) = 8, Σdx² = 10
    std::vector<double> points = {1, 3, 2, 5, 4};
    auto fit = TrendEstimator::fit(points);
    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->slope, 0.8, 1e-12);
    EXPECT_NEAR(fit->intercept, 3.0 - 0.8 * 2.0, 1e-12);
}

TEST(TrendEstimator_Fit, ZeroAndOnePointAreInsufficient) {
    auto none = TrendEstimator::fit(std::span<const double>{});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().kind, ErrorKind::InsufficientData);

    std::vector<double> one = {10};
    auto single = TrendEstimator::fit(one);
    ASSERT_FALSE(single.has_value());
    EXPECT_EQ(single.error().kind, ErrorKind::InsufficientData);
    EXPECT_EQ(single.error().message, "Need at least 2 data points");
}

TEST(TrendEstimator_Fit, NaNIsInvalidInput) {
    std::vector<double> points = {1.0, std::numeric_limits<double>::quiet_NaN(), 3.0};
    auto fit = TrendEstimator::fit(points);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().kind, ErrorKind::InvalidInput);
}

// ─── fit_and_forecast ────────────────────────────────────────────────────────

TEST(TrendEstimator_Forecast, IncreasingSeries) {
    TrendEstimator est;
    std::vector<double> points = {10, 20, 30, 40, 50};
    auto r = est.fit_and_forecast(points, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->direction, Direction::Increasing);
    ASSERT_EQ(r->predictions.size(), 3u);
    EXPECT_DOUBLE_EQ(r->predictions[0], 60.0);
    EXPECT_DOUBLE_EQ(r->predictions[1], 70.0);
    EXPECT_DOUBLE_EQ(r->predictions[2], 80.0);
}

TEST(TrendEstimator_Forecast, DecreasingSeries) {
    TrendEstimator est;
    std::vector<double> points = {50, 40, 30, 20, 10};
    auto r = est.fit_and_forecast(points, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->direction, Direction::Decreasing);
    EXPECT_DOUBLE_EQ(r->slope, -10.0);
    EXPECT_DOUBLE_EQ(r->predictions[0], 0.0);
}

TEST(TrendEstimator_Forecast, DefaultHorizonIsThree) {
    TrendEstimator est;
    std::vector<double> points = {1, 2};
    auto r = est.fit_and_forecast(points);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->predictions.size(), 3u);
}

TEST(TrendEstimator_Forecast, HorizonOneAndLarger) {
    TrendEstimator est;
    std::vector<double> points = {2, 4, 6};
    auto one = est.fit_and_forecast(points, 1);
    ASSERT_TRUE(one.has_value());
    ASSERT_EQ(one->predictions.size(), 1u);
    EXPECT_DOUBLE_EQ(one->predictions[0], 8.0);

    auto ten = est.fit_and_forecast(points, 10);
    ASSERT_TRUE(ten.has_value());
    ASSERT_EQ(ten->predictions.size(), 10u);
    EXPECT_DOUBLE_EQ(ten->predictions[9], 26.0);
}

TEST(TrendEstimator_Forecast, NonPositiveHorizonIsRangeError) {
    TrendEstimator est;
    std::vector<double> points = {1, 2, 3};
    auto zero = est.fit_and_forecast(points, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, ErrorKind::Range);
    EXPECT_FALSE(est.fit_and_forecast(points, -1).has_value());
}

TEST(TrendEstimator_Forecast, HorizonAboveConfiguredMaxIsRangeError) {
    TrendConfig cfg;
    cfg.max_horizon = 5;
    TrendEstimator est(cfg);
    std::vector<double> points = {1, 2, 3};
    EXPECT_TRUE(est.fit_and_forecast(points, 5).has_value());
    auto r = est.fit_and_forecast(points, 6);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Range);
}

TEST(TrendEstimator_Forecast, InsufficientDataReportedBeforeHorizon) {
    TrendEstimator est;
    std::vector<double> one = {10};
    auto r = est.fit_and_forecast(one, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InsufficientData);
}

// ─── Direction rules ─────────────────────────────────────────────────────────

TEST(TrendEstimator_Direction, ConstantSeriesIsFlatByDefault) {
    TrendEstimator est;
    std::vector<double> points = {5, 5, 5, 5};
    auto r = est.fit_and_forecast(points, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->slope, 0.0);
    EXPECT_EQ(r->direction, Direction::Flat);
    for (double p : r->predictions) EXPECT_DOUBLE_EQ(p, 5.0);
}

TEST(TrendEstimator_Direction, StrictPositiveReportsZeroSlopeAsDecreasing) {
    TrendEstimator est(TrendConfig{.direction_rule = DirectionRule::StrictPositive});
    std::vector<double> points = {5, 5, 5, 5};
    auto r = est.fit_and_forecast(points, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->direction, Direction::Decreasing);
}

TEST(TrendEstimator_Direction, ClassifyBoundaries) {
    TrendEstimator three_way;
    TrendEstimator strict(TrendConfig{.direction_rule = DirectionRule::StrictPositive});

    EXPECT_EQ(three_way.classify(1e-300), Direction::Increasing);
    EXPECT_EQ(three_way.classify(-1e-300), Direction::Decreasing);
    EXPECT_EQ(three_way.classify(0.0), Direction::Flat);
    EXPECT_EQ(three_way.classify(-0.0), Direction::Flat);

    EXPECT_EQ(strict.classify(1e-300), Direction::Increasing);
    EXPECT_EQ(strict.classify(0.0), Direction::Decreasing);
    EXPECT_EQ(strict.classify(-1.0), Direction::Decreasing);
}

TEST(TrendEstimator_Direction, Names) {
    EXPECT_EQ(to_string(Direction::Increasing), "increasing");
    EXPECT_EQ(to_string(Direction::Decreasing), "decreasing");
    EXPECT_EQ(to_string(Direction::Flat), "flat");
}

TEST(TrendEstimator_Format, ToStringContainsTrendAndPredictions) {
    TrendEstimator est;
    std::vector<double> points = {10, 20, 30, 40, 50};
    auto r = est.fit_and_forecast(points, 3);
    ASSERT_TRUE(r.has_value());
    const std::string text = r->to_string();
    EXPECT_NE(text.find("increasing"), std::string::npos);
    EXPECT_NE(text.find("60.0000"), std::string::npos);
}

// ─── Overflow ────────────────────────────────────────────────────────────────

TEST(TrendEstimator_Overflow, OverflowingFitIsInvalidInput) {
    std::vector<double> points = {1e308, 1e308};
    auto fit = TrendEstimator::fit(points);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().kind, ErrorKind::InvalidInput);
    EXPECT_EQ(fit.error().message, "Values too large to fit");

    TrendEstimator estimator;
    auto forecast = estimator.fit_and_forecast(points, 3);
    ASSERT_FALSE(forecast.has_value());
    EXPECT_EQ(forecast.error().kind, ErrorKind::InvalidInput);
}

TEST(TrendEstimator_Overflow, OverflowingForecastIsInvalidInput) {
    // slope 1.5e308 is finite, the next step is not.
    std::vector<double> points = {0.0, 1.5e308};
    ASSERT_TRUE(TrendEstimator::fit(points).has_value());

    TrendEstimator estimator;
    auto forecast = estimator.fit_and_forecast(points, 1);
    ASSERT_FALSE(forecast.has_value());
    EXPECT_EQ(forecast.error().kind, ErrorKind::InvalidInput);
}
