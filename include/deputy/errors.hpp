#pragma once

/**
 * @file errors.hpp
 * @brief Error values and the Result type used throughout deputy
 *
 * Every fallible operation returns a Result<T>. An Error carries a category,
 * a human-readable message and, when the failure came from the Deputy API,
 * the structured upstream error. Adding context with withContext() keeps the
 * category and the upstream error, so callers can always unwrap them.
 *
 * @example
 * ```cpp
 * auto result = deputy::list_departments(client, {});
 * if (result.isErr()) {
 *     auto err = result.error().withContext("listing departments");
 *     if (const auto* api = err.apiError()) {
 *         // api->status, api->message, ...
 *     }
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace deputy {

// ============================================================================
// Error Kind (machine taxonomy, serialized in JSON error envelopes)
// ============================================================================

enum class ErrorKind {
    AuthRequired,
    AuthForbidden,
    NotFound,
    Validation,
    InvalidInput,
    InvalidFlag,
    Conflict,
    RateLimited,
    ServerError,
    Timeout,
    NetworkError,
    Unknown
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::AuthRequired: return "AUTH_REQUIRED";
        case ErrorKind::AuthForbidden: return "AUTH_FORBIDDEN";
        case ErrorKind::NotFound: return "NOT_FOUND";
        case ErrorKind::Validation: return "VALIDATION_FAILED";
        case ErrorKind::InvalidInput: return "INVALID_INPUT";
        case ErrorKind::InvalidFlag: return "INVALID_FLAG";
        case ErrorKind::Conflict: return "CONFLICT";
        case ErrorKind::RateLimited: return "RATE_LIMITED";
        case ErrorKind::ServerError: return "SERVER_ERROR";
        case ErrorKind::Timeout: return "TIMEOUT";
        case ErrorKind::NetworkError: return "NETWORK_ERROR";
        case ErrorKind::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Parse a wire code (e.g. "NOT_FOUND"). Unrecognized codes map to Unknown.
ErrorKind parse_error_kind(const std::string& code);

// Derive the error kind for an HTTP status code.
ErrorKind error_kind_from_status(int status);

// 408, 429 and 5xx responses are worth retrying.
bool is_retryable_status(int status);

// ============================================================================
// Upstream API Error
// ============================================================================

/**
 * @brief Structured error returned by the Deputy API
 */
struct ApiError {
    std::optional<std::string> code;  // machine code if the API sent one
    int status = 0;                   // HTTP status
    std::string message;
    bool retryable = false;
    int retry_after = 0;              // seconds, 0 when unknown
    std::string field;                // offending field, empty when unknown

    // 401/403 always map to the auth kinds. Otherwise the explicit code when
    // present, else derived from the status.
    ErrorKind kind() const;

    // "API error <status>: <message>"
    std::string toString() const;
};

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error categories
 *
 * API and EMPTY_RESULT are structural. INVALID_INPUT, INVALID_FLAG, NETWORK
 * and TIMEOUT are raised by deputy's own code where the failure class is
 * known. GENERAL is everything else.
 */
enum class ErrorCode {
    GENERAL,
    INVALID_INPUT,
    INVALID_FLAG,
    NETWORK,
    TIMEOUT,
    API,
    EMPTY_RESULT,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(ApiError api)
        : code_(ErrorCode::API), message_(api.toString()), api_(std::move(api)) {}

    // Sentinel returned when --fail-empty is set and a result is empty.
    static Error emptyResult() { return Error(ErrorCode::EMPTY_RESULT, "empty result"); }

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    // Append a parenthesized note, e.g. why a fallback also failed.
    Error& withDetail(const std::string& detail) {
        message_ += " (" + detail + ")";
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

    const ApiError* apiError() const { return api_ ? &*api_ : nullptr; }
    bool isEmptyResult() const { return code_ == ErrorCode::EMPTY_RESULT; }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ApiError> api_;
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

} // namespace deputy
