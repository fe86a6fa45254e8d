#pragma once

/**
 * @file Result.h
 * @brief Error handling types shared by every Key Provider component
 *
 * Fallible operations return Result<T> instead of throwing. The error code
 * decides how a failure surfaces at the HTTP boundary, the message is only
 * for logs.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace skp {

/**
 * @brief Error codes for Key Provider operations
 */
enum class ErrorCode {
    Success = 0,

    // Request validation errors (100-199)
    ValidationError = 100,
    InvalidSize = 101,
    Unauthorized = 102,
    NotFound = 103,
    AlreadyConsumed = 104,

    // Sync integrity errors (200-299)
    InvalidSignature = 200,
    ReplayRejected = 201,
    DecryptionFailed = 202,

    // Transport errors (300-399)
    PeerUnreachable = 300,
    PeerRejected = 301,
    ConnectionFailed = 302,
    ConnectionTimeout = 303,
    SendFailed = 304,
    ReceiveFailed = 305,

    // Resource errors (400-499)
    RngUnavailable = 400,
    StorageUnavailable = 401,
    DatabaseError = 402,
    CapacityExceeded = 403,
    DuplicateKey = 404,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,
    MissingConfig = 602,

    // General errors (900-999)
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::InvalidSize: return "Invalid size";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyConsumed: return "Already consumed";
        case ErrorCode::InvalidSignature: return "Invalid signature";
        case ErrorCode::ReplayRejected: return "Replay rejected";
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::PeerUnreachable: return "Peer unreachable";
        case ErrorCode::PeerRejected: return "Peer rejected message";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionTimeout: return "Connection timeout";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::RngUnavailable: return "Random source unavailable";
        case ErrorCode::StorageUnavailable: return "Storage unavailable";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::CapacityExceeded: return "Key store capacity exceeded";
        case ErrorCode::DuplicateKey: return "Duplicate key";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// Client-caused failures: the request itself was wrong or not permitted.
inline bool isClientError(ErrorCode code) {
    return static_cast<int>(code) >= 100 && static_cast<int>(code) < 200;
}

/// Malformed or out-of-range request parameters.
inline bool isValidationError(ErrorCode code) {
    return code == ErrorCode::ValidationError || code == ErrorCode::InvalidSize;
}

/// Failures of a transport attempt that are worth retrying.
inline bool isTransientTransportError(ErrorCode code) {
    switch (code) {
        case ErrorCode::PeerUnreachable:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionTimeout:
        case ErrorCode::SendFailed:
        case ErrorCode::ReceiveFailed:
            return true;
        default:
            return false;
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
 * Usage:
 * @code
 * Result<std::string> id = store.generate("KP_Client", 256);
 * if (!id) {
 *     logger.log(LogLevel::WARN, id.error().message, "KeyStore");
 *     return id.error();
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(E error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Error code, or Success when the result holds a value
    ErrorCode code() const { return ok() ? ErrorCode::Success : error().code; }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for operations without a success value
 */
template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

    ErrorCode code() const { return ok() ? ErrorCode::Success : error_->code; }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace skp
