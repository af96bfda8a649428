#pragma once

#include "deputy/errors.hpp"

#include <optional>

namespace deputy {

// ============================================================================
// Process Exit Codes
// ============================================================================
//
// These values are part of the automation contract. Scripts and agents key
// off them, so a value must never change meaning.

enum class ExitCode : int {
    OK = 0,
    General = 1,
    InputError = 2,
    AuthError = 3,
    NotFound = 4,
    RateLimit = 5,
    TempError = 6,
};

inline int to_int(ExitCode c) { return static_cast<int>(c); }

inline const char* exit_code_to_string(ExitCode c) {
    switch (c) {
        case ExitCode::OK: return "ok";
        case ExitCode::General: return "general";
        case ExitCode::InputError: return "input_error";
        case ExitCode::AuthError: return "auth_error";
        case ExitCode::NotFound: return "not_found";
        case ExitCode::RateLimit: return "rate_limit";
        case ExitCode::TempError: return "temp_error";
    }
    return "general";
}

// Exit code for an upstream error kind.
ExitCode exit_code_from_kind(ErrorKind kind);

// Map an error to its exit code. Checks, in order: no error, the empty-result
// sentinel, a wrapped upstream API error, deputy's own typed categories, and
// finally well-known phrases in the message text.
ExitCode exit_code_from_error(const Error& err);
ExitCode exit_code_from_error(const std::optional<Error>& err);

// Message-text fallbacks (lowercased substring match).
bool is_input_error_message(const std::string& msg);
bool is_temp_error_message(const std::string& msg);

} // namespace deputy
