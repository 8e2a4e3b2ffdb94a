/**
 * @file result.hpp
 * @brief Monadic error handling type for LabAllocDiag.
 *
 * Result<T, E> is the return type of every fallible operation. Errors carry a
 * coarse ErrorCode so callers (the scheduler loop, the CLI) can tell caller
 * input errors from transient infrastructure errors without parsing messages.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace lab_alloc {

enum class ErrorCode : uint8_t {
    Unknown,
    InvalidArgument,   ///< Malformed caller input
    IllegalState,      ///< Required field missing / object in the wrong state
    NotFound,
    AlreadyExists,
    QueryFailed,       ///< Device inventory query failed
    Interrupted,       ///< Blocking call interrupted
    ParseError         ///< Malformed file or wire record
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:         return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IllegalState:    return "illegal_state";
        case ErrorCode::NotFound:        return "not_found";
        case ErrorCode::AlreadyExists:   return "already_exists";
        case ErrorCode::QueryFailed:     return "query_failed";
        case ErrorCode::Interrupted:     return "interrupted";
        case ErrorCode::ParseError:      return "parse_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "<code>: <message>", for logs.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(code)} + ": " + message;
    }
};

/**
 * @brief Result<T, E> holds either a success value of type T or an error E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace lab_alloc
