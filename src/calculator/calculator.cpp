/// @file src/calculator/calculator.cpp
/// @brief Two-operand arithmetic.

#include "nae/calculator.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace nae::calculator {

std::string_view to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Addition:       return "addition";
        case Operation::Subtraction:    return "subtraction";
        case Operation::Multiplication: return "multiplication";
        case Operation::Division:       return "division";
    }
    return "unknown";
}

Result<Operation> parse_operation(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "add" || lower == "addition" || lower == "+")            return Operation::Addition;
    if (lower == "sub" || lower == "subtract" || lower == "subtraction" || lower == "-")
                                                                          return Operation::Subtraction;
    if (lower == "mul" || lower == "multiply" || lower == "multiplication" || lower == "x")
                                                                          return Operation::Multiplication;
    if (lower == "div" || lower == "divide" || lower == "division" || lower == "/")
                                                                          return Operation::Division;

    return Result<Operation>::failure(ErrorKind::InvalidInput,
                                      fmt::format("Unknown operation '{}'", name));
}

std::string Calculation::to_string() const {
    return fmt::format("{} = {}", calculator::to_string(operation), result);
}

Result<Calculation> Calculator::add(double a, double b) noexcept {
    return Calculation{.result = a + b, .operation = Operation::Addition};
}

Result<Calculation> Calculator::subtract(double a, double b) noexcept {
    return Calculation{.result = a - b, .operation = Operation::Subtraction};
}

Result<Calculation> Calculator::multiply(double a, double b) noexcept {
    return Calculation{.result = a * b, .operation = Operation::Multiplication};
}

Result<Calculation> Calculator::divide(double a, double b) noexcept {
    if (b == 0.0) {
        return Result<Calculation>::failure(ErrorKind::DivisionByZero, "Cannot divide by zero");
    }
    return Calculation{.result = a / b, .operation = Operation::Division};
}

Result<Calculation> Calculator::apply(Operation op, double a, double b) noexcept {
    switch (op) {
        case Operation::Addition:       return add(a, b);
        case Operation::Subtraction:    return subtract(a, b);
        case Operation::Multiplication: return multiply(a, b);
        case Operation::Division:       return divide(a, b);
    }
    return Result<Calculation>::failure(ErrorKind::InvalidInput, "Unknown operation");
}

}  // namespace nae::calculator
