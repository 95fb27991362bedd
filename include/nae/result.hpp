#pragma once

/// @file include/nae/result.hpp
/// @brief Error taxonomy and the Result<T> return type shared by all engine
///        components.
///
/// # Module: Result
///
/// ## Responsibility
/// Every fallible engine operation returns `Result<T>`: either the computed
/// value or an `Error` naming which precondition failed.  The caller decides
/// how each kind is reported; the engine never recovers from, retries, or
/// hides a failure.
///
/// ## Guarantees
/// - Engine operations never throw; failures travel inside the Result
/// - `Result::value()` on a failed result throws `BadResultAccess`
/// - Value semantics: a Result owns its payload

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace nae {

// ─── ErrorKind ────────────────────────────────────────────────────────────────

/// Reason an engine operation refused its input.
enum class ErrorKind {
    EmptyInput,        ///< Operation needs at least one element, got zero
    InsufficientData,  ///< Fewer elements than the computation needs
    Range,             ///< Bounded parameter outside its configured range
    DivisionByZero,    ///< Calculator divisor was exactly zero
    InvalidInput,      ///< Non-finite or otherwise malformed value
};

/// Stable snake_case name, e.g. "empty_input".
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ─── Error ────────────────────────────────────────────────────────────────────

/// A failed operation: what went wrong and a human-readable explanation.
struct Error {
    ErrorKind   kind;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] std::string to_string() const;
};

/// Thrown only by `Result::value()` when the result holds an Error.
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(Error error);

    [[nodiscard]] const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Either a `T` or an `Error`.
///
/// ```cpp
/// auto summary = Aggregator::aggregate(items);
/// if (!summary) {
///     fmt::print(stderr, "{}\n", summary.error().message);
///     return 1;
/// }
/// fmt::print("{}\n", summary->to_string());
/// ```
template <typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    /// Shorthand for building a failed result.
    [[nodiscard]] static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    /// Checked access.  Throws BadResultAccess if this holds an Error.
    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw BadResultAccess(std::get<1>(state_));
        return std::get<0>(state_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw BadResultAccess(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    /// Unchecked access.  Precondition: has_value().
    [[nodiscard]] const T& operator*() const& noexcept { return *std::get_if<0>(&state_); }
    [[nodiscard]] const T* operator->() const noexcept { return std::get_if<0>(&state_); }

    /// The failure.  Precondition: !has_value().
    [[nodiscard]] const Error& error() const& noexcept { return *std::get_if<1>(&state_); }

    /// Drop the error detail and keep only the value, if any.
    [[nodiscard]] std::optional<T> ok() const& {
        if (!has_value()) return std::nullopt;
        return std::get<0>(state_);
    }

private:
    std::variant<T, Error> state_;
};

}  // namespace nae
