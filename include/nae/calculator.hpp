#pragma once

/// @file include/nae/calculator.hpp
/// @brief Two-operand arithmetic with a checked division.

#include "nae/result.hpp"

#include <string>
#include <string_view>

namespace nae::calculator {

enum class Operation { Addition, Subtraction, Multiplication, Division };

/// "addition", "subtraction", "multiplication" or "division".
[[nodiscard]] std::string_view to_string(Operation op) noexcept;

/// Parse "add"/"addition", "sub"/"subtract"/"subtraction", ... .
[[nodiscard]] Result<Operation> parse_operation(std::string_view name);

struct Calculation {
    double    result;
    Operation operation;

    [[nodiscard]] std::string to_string() const;
};

/// Stateless arithmetic.
class Calculator {
public:
    [[nodiscard]] static Result<Calculation> add(double a, double b) noexcept;
    [[nodiscard]] static Result<Calculation> subtract(double a, double b) noexcept;
    [[nodiscard]] static Result<Calculation> multiply(double a, double b) noexcept;

    /// `DivisionByZero` when `b == 0`.
    [[nodiscard]] static Result<Calculation> divide(double a, double b) noexcept;

    /// Dispatch on `op`.
    [[nodiscard]] static Result<Calculation> apply(Operation op, double a, double b) noexcept;
};

}  // namespace nae::calculator
