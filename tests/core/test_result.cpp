/// @file tests/core/test_result.cpp
/// @brief Tests for Result<T>, Error and ErrorKind names.

#include "nae/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace nae;

TEST(Result_Value, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(*r, 42);
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.ok(), std::optional<int>(42));
}

TEST(Result_Error, HoldsError) {
    auto r = Result<int>::failure(ErrorKind::Range, "out of bounds");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Range);
    EXPECT_EQ(r.error().message, "out of bounds");
    EXPECT_FALSE(r.ok().has_value());
}

TEST(Result_Error, CheckedAccessThrows) {
    auto r = Result<std::string>::failure(ErrorKind::EmptyInput, "No numbers provided");
    try {
        (void)r.value();
        FAIL() << "value() on an error must throw";
    } catch (const BadResultAccess& e) {
        EXPECT_EQ(e.error().kind, ErrorKind::EmptyInput);
        EXPECT_NE(std::string(e.what()).find("No numbers provided"), std::string::npos);
    }
}

TEST(Result_Value, RvalueValueMovesOut) {
    Result<std::string> r = std::string("payload");
    std::string s = std::move(r).value();
    EXPECT_EQ(s, "payload");
}

TEST(ErrorKind_Names, SnakeCase) {
    EXPECT_EQ(to_string(ErrorKind::EmptyInput), "empty_input");
    EXPECT_EQ(to_string(ErrorKind::InsufficientData), "insufficient_data");
    EXPECT_EQ(to_string(ErrorKind::Range), "range");
    EXPECT_EQ(to_string(ErrorKind::DivisionByZero), "division_by_zero");
    EXPECT_EQ(to_string(ErrorKind::InvalidInput), "invalid_input");
}

TEST(Error_Format, KindThenMessage) {
    const Error e{ErrorKind::InsufficientData, "Need at least 2 data points"};
    EXPECT_EQ(e.to_string(), "insufficient_data: Need at least 2 data points");
}
