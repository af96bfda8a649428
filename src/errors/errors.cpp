#include "deputy/errors.hpp"

#include <algorithm>
#include <cctype>

namespace deputy {

// ============================================================================
// Error Kind
// ============================================================================

ErrorKind parse_error_kind(const std::string& code) {
    std::string upper = code;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "AUTH_REQUIRED") return ErrorKind::AuthRequired;
    if (upper == "AUTH_FORBIDDEN") return ErrorKind::AuthForbidden;
    if (upper == "NOT_FOUND") return ErrorKind::NotFound;
    if (upper == "VALIDATION_FAILED") return ErrorKind::Validation;
    if (upper == "INVALID_INPUT") return ErrorKind::InvalidInput;
    if (upper == "INVALID_FLAG") return ErrorKind::InvalidFlag;
    if (upper == "CONFLICT") return ErrorKind::Conflict;
    if (upper == "RATE_LIMITED") return ErrorKind::RateLimited;
    if (upper == "SERVER_ERROR") return ErrorKind::ServerError;
    if (upper == "TIMEOUT") return ErrorKind::Timeout;
    if (upper == "NETWORK_ERROR") return ErrorKind::NetworkError;
    return ErrorKind::Unknown;
}

ErrorKind error_kind_from_status(int status) {
    switch (status) {
        case 401: return ErrorKind::AuthRequired;
        case 403: return ErrorKind::AuthForbidden;
        case 404: return ErrorKind::NotFound;
        case 408: return ErrorKind::Timeout;
        case 409: return ErrorKind::Conflict;
        case 422: return ErrorKind::Validation;
        case 429: return ErrorKind::RateLimited;
        default:
            if (status >= 500) {
                return ErrorKind::ServerError;
            }
            return ErrorKind::InvalidInput;
    }
}

bool is_retryable_status(int status) {
    return status == 408 || status == 429 || status >= 500;
}

// ============================================================================
// ApiError
// ============================================================================

ErrorKind ApiError::kind() const {
    // Authentication failures stay authentication failures whatever code the
    // body carried.
    if (status == 401 || status == 403) {
        return error_kind_from_status(status);
    }
    if (code && !code->empty()) {
        return parse_error_kind(*code);
    }
    return error_kind_from_status(status);
}

std::string ApiError::toString() const {
    return "API error " + std::to_string(status) + ": " + message;
}

} // namespace deputy
