#pragma once

/**
 * @file error_format.hpp
 * @brief User-facing error rendering
 *
 * Two renderings of the same error: a human string with an actionable hint
 * for text mode, and a structured {"error": {...}} envelope for JSON mode.
 * Both are written to stderr by the top-level command runner.
 */

#include "deputy/errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace deputy {

/**
 * @brief Wire shape of a JSON error body
 */
struct ErrorEnvelope {
    ErrorKind code = ErrorKind::InvalidInput;
    std::optional<int> status;
    std::string message;
    bool retryable = false;
    std::optional<int> retry_after;
    std::optional<std::string> field;
    std::optional<std::string> hint;
};

// {"error": {"code": ..., "status": ..., ...}}; optional members are omitted
// when unset.
void to_json(nlohmann::json& j, const ErrorEnvelope& e);
void from_json(const nlohmann::json& j, ErrorEnvelope& e);

// Hint for an HTTP status, shared by the text and JSON renderings.
std::optional<std::string> hint_for_status(int status);

// Build the envelope for an error. With debug set the message is the raw
// error text and no hint is attached.
ErrorEnvelope make_error_envelope(const Error& err, bool debug = false);

// Human-readable rendering. With debug set, returns the raw message.
// Returns an empty string when there is no error.
std::string format_error(const std::optional<Error>& err, bool debug);

// Compact JSON rendering. Returns an empty string when there is no error.
std::string format_error_json(const std::optional<Error>& err, bool debug = false);

} // namespace deputy
