/// @file src/core/result.cpp
/// @brief ErrorKind names and BadResultAccess.

#include "nae/result.hpp"

#include <fmt/format.h>

namespace nae {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::EmptyInput:       return "empty_input";
        case ErrorKind::InsufficientData: return "insufficient_data";
        case ErrorKind::Range:            return "range";
        case ErrorKind::DivisionByZero:   return "division_by_zero";
        case ErrorKind::InvalidInput:     return "invalid_input";
    }
    return "unknown";
}

std::string Error::to_string() const {
    return fmt::format("{}: {}", nae::to_string(kind), message);
}

BadResultAccess::BadResultAccess(Error error)
    : std::logic_error("bad result access: " + error.to_string())
    , error_(std::move(error))
{}

}  // namespace nae
