#pragma once

/**
 * @file result.hpp
 * @brief Error taxonomy and Result type used by every cliapp operation
 *
 * Binding and resolution never throw: they return Result<T>. Only
 * registration mistakes that the type system cannot catch throw
 * RegistrationError.
 *
 * @example
 * ```cpp
 * auto value = cliapp::coerce("42", cliapp::Kind::Int);
 * if (value.isErr()) {
 *     std::cerr << value.error().message() << "\n";
 * }
 * ```
 */

#include "cliapp/export.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace cliapp {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Coercion
    UNSUPPORTED_TYPE,      ///< Target kind is not one of the five primitives
    MALFORMED_VALUE,       ///< Token does not parse as the target kind

    // Resolution
    UNKNOWN_COMMAND,       ///< No registered path matched and no root handler

    // Binding
    INSUFFICIENT_ARGS,     ///< Ran out of tokens while filling positionals
    ARG_COUNT_MISMATCH,    ///< Positional-mode token count != parameter count
    MISSING_OPTION_VALUE,  ///< Named option needs a value, none follows
    UNKNOWN_OPTION,        ///< Unrecognized named option

    // Registration
    INVALID_REGISTRATION,

    // Reported by handlers themselves
    HANDLER_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE";
        case ErrorCode::MALFORMED_VALUE: return "MALFORMED_VALUE";
        case ErrorCode::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        case ErrorCode::INSUFFICIENT_ARGS: return "INSUFFICIENT_ARGS";
        case ErrorCode::ARG_COUNT_MISMATCH: return "ARG_COUNT_MISMATCH";
        case ErrorCode::MISSING_OPTION_VALUE: return "MISSING_OPTION_VALUE";
        case ErrorCode::UNKNOWN_OPTION: return "UNKNOWN_OPTION";
        case ErrorCode::INVALID_REGISTRATION: return "INVALID_REGISTRATION";
        case ErrorCode::HANDLER_FAILED: return "HANDLER_FAILED";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Thrown by App::add and RecordSchema for registrations that cannot
 * be rejected at compile time (empty handler, bad option spelling, ...).
 */
class CLIAPP_API RegistrationError : public std::logic_error {
public:
    explicit RegistrationError(Error error)
        : std::logic_error(error.message()), error_(std::move(error)) {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

/// True for any Result<T, E> instantiation
template<typename T>
struct is_result : std::false_type {};

template<typename T, typename E>
struct is_result<Result<T, E>> : std::true_type {};

} // namespace cliapp
