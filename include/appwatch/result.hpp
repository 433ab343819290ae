#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types for fallible appwatch operations
 *
 * Platform calls never throw across the library boundary. Every OS failure is
 * converted where it happens into an Error carrying an ErrorCode and a
 * human-readable message.
 */

#include <optional>
#include <string>
#include <utility>

namespace appwatch {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for appwatch operations
 */
enum class ErrorCode {
    // Lookups
    NOT_FOUND,

    // Launching
    ACTIVATION_FAILED,
    SHELL_LAUNCH_FAILED,

    // System / IO
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::ACTIVATION_FAILED: return "activation_failed";
        case ErrorCode::SHELL_LAUNCH_FAILED: return "shell_launch_failed";
        case ErrorCode::IO_ERROR: return "io_error";
        default: return "unknown";
    }
}

/**
 * @brief Error code plus the message shown to the user
 *
 * Messages are built innermost first: the OS detail, then one
 * withContext() per layer that knows what it was trying to do.
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    // Prefix as "context: message".
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

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Either a value or an Error
 *
 * Test isOk() before value() and isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }
    static Result err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<E> error_;
};

// Success carries nothing; only the error side is stored.
template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return !error_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace appwatch
