#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for LureNet
 *
 * Provides a Result<T, E> type in the spirit of C++23's std::expected.
 * Fallible operations return a Result instead of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace lnt {

/**
 * @brief Error codes for LureNet operations
 */
enum class ErrorCode {
    Success = 0,

    // Network errors (100-199)
    NetworkError = 100,
    BindFailed = 101,
    NotRunning = 102,
    SendFailed = 103,
    ReceiveFailed = 104,

    // Storage/Database errors (300-399)
    DatabaseError = 300,
    DatabaseOpenFailed = 301,
    QueryFailed = 302,
    NotFound = 303,

    // Validation errors (400-499)
    InvalidFilter = 400,
    InvalidPagination = 401,

    // Configuration errors (600-699)
    InvalidConfig = 600,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::NotRunning: return "Not running";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::DatabaseOpenFailed: return "Database open failed";
        case ErrorCode::QueryFailed: return "Query failed";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidFilter: return "Invalid filter";
        case ErrorCode::InvalidPagination: return "Invalid pagination";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<int64_t> id = store.recordAttack(event);
 * if (id) {
 *     std::cout << "Stored as " << *id << std::endl;
 * } else {
 *     std::cout << "Error: " << id.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace lnt
