#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every dotenv component
 *
 * Fallible operations return Result<T>. The error taxonomy is closed:
 * callers switch over ErrorCode instead of inspecting error types.
 *
 * @example
 * ```cpp
 * auto table = dotenv::parse(content);
 * if (table.isErr()) {
 *     std::cerr << table.error().toString() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace dotenv {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for dotenv operations
 */
enum class ErrorCode {
    NOT_FOUND,        // a requested file does not exist
    MALFORMED_ENTRY,  // unterminated quote or dangling continuation
    IO_ERROR,         // any other read or permission failure
    CONFIG_ERROR,     // contradictory invocation state
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::MALFORMED_ENTRY: return "malformed_entry";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::CONFIG_ERROR: return "config_error";
    }
    return "unknown";
}

/**
 * @brief Error type with code, message and optional source line
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, size_t line)
        : code_(code), message_(std::move(message)), line_(line) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // 1-based line number for MALFORMED_ENTRY errors
    std::optional<size_t> line() const { return line_; }

    std::string toString() const {
        if (line_) {
            return message_ + " (line " + std::to_string(*line_) + ")";
        }
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<size_t> line_;
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
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace dotenv
