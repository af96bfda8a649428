#include "deputy/exit_codes.hpp"

#include <algorithm>
#include <cctype>

namespace deputy {

namespace {

const char* const kInputErrorPhrases[] = {
    "unknown flag",
    "required flag",
    "missing required argument",
    "invalid --output",
    "too many arguments",
};

const char* const kTempErrorPhrases[] = {
    "connection refused",
    "no such host",
    "timeout",
};

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<size_t N>
bool contains_any(const std::string& msg, const char* const (&phrases)[N]) {
    std::string lower = to_lower(msg);
    for (const char* phrase : phrases) {
        if (lower.find(phrase) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

bool is_input_error_message(const std::string& msg) {
    return contains_any(msg, kInputErrorPhrases);
}

bool is_temp_error_message(const std::string& msg) {
    return contains_any(msg, kTempErrorPhrases);
}

ExitCode exit_code_from_kind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthRequired:
        case ErrorKind::AuthForbidden:
            return ExitCode::AuthError;
        case ErrorKind::NotFound:
            return ExitCode::NotFound;
        case ErrorKind::Validation:
        case ErrorKind::InvalidInput:
        case ErrorKind::InvalidFlag:
        case ErrorKind::Conflict:
            return ExitCode::InputError;
        case ErrorKind::RateLimited:
            return ExitCode::RateLimit;
        case ErrorKind::ServerError:
        case ErrorKind::Timeout:
        case ErrorKind::NetworkError:
            return ExitCode::TempError;
        case ErrorKind::Unknown:
            return ExitCode::General;
    }
    return ExitCode::General;
}

ExitCode exit_code_from_error(const Error& err) {
    // "No rows matched" is reported like "resource does not exist".
    if (err.isEmptyResult()) {
        return ExitCode::NotFound;
    }

    if (const ApiError* api = err.apiError()) {
        return exit_code_from_kind(api->kind());
    }

    switch (err.code()) {
        case ErrorCode::INVALID_INPUT:
        case ErrorCode::INVALID_FLAG:
            return ExitCode::InputError;
        case ErrorCode::NETWORK:
        case ErrorCode::TIMEOUT:
            return ExitCode::TempError;
        default:
            break;
    }

    if (is_input_error_message(err.message())) {
        return ExitCode::InputError;
    }
    if (is_temp_error_message(err.message())) {
        return ExitCode::TempError;
    }

    return ExitCode::General;
}

ExitCode exit_code_from_error(const std::optional<Error>& err) {
    if (!err) {
        return ExitCode::OK;
    }
    return exit_code_from_error(*err);
}

} // namespace deputy
