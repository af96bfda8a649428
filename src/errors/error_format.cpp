#include "deputy/error_format.hpp"

#include <cctype>

namespace deputy {

// ============================================================================
// Envelope Serialization
// ============================================================================

void to_json(nlohmann::json& j, const ErrorEnvelope& e) {
    nlohmann::json detail;
    detail["code"] = error_kind_to_string(e.code);
    if (e.status) detail["status"] = *e.status;
    detail["message"] = e.message;
    detail["retryable"] = e.retryable;
    if (e.retry_after) detail["retryAfter"] = *e.retry_after;
    if (e.field) detail["field"] = *e.field;
    if (e.hint) detail["hint"] = *e.hint;
    j = nlohmann::json{{"error", detail}};
}

void from_json(const nlohmann::json& j, ErrorEnvelope& e) {
    const auto& detail = j.at("error");
    e = ErrorEnvelope{};
    e.code = parse_error_kind(detail.at("code").get<std::string>());
    e.message = detail.at("message").get<std::string>();
    e.retryable = detail.value("retryable", false);
    if (detail.contains("status")) e.status = detail["status"].get<int>();
    if (detail.contains("retryAfter")) e.retry_after = detail["retryAfter"].get<int>();
    if (detail.contains("field")) e.field = detail["field"].get<std::string>();
    if (detail.contains("hint")) e.hint = detail["hint"].get<std::string>();
}

// ============================================================================
// Hints
// ============================================================================

std::optional<std::string> hint_for_status(int status) {
    switch (status) {
        case 400: return std::string("Check field names against the resource schema");
        case 401: return std::string("Re-authenticate: set a valid DEPUTY_TOKEN (env or .env)");
        case 403: return std::string("Check role permissions for this endpoint");
        case 404: return std::string("Resource not found, list the resource to verify IDs (e.g. 'deputy employees list')");
        case 409: return std::string("Conflict with existing data, verify the resource state");
        case 412: return std::string("Precondition failed, verify credentials (DEPUTY_TOKEN, DEPUTY_INSTALL)");
        case 417: return std::string("Data format error, check JSON structure (arrays vs objects)");
        case 422: return std::string("Validation failed, check required fields and formats");
        case 429: return std::string("Rate limited, wait and retry");
        default:
            if (status >= 500) {
                return std::string("Server error, retry later");
            }
            return std::nullopt;
    }
}

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string lowered(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

const char* const kDebugSuffix = "Use --debug for details. Avoid piping stderr into jq (omit 2>&1).";

std::string format_api_error(const ApiError& api) {
    std::string base = api.toString();
    auto hint = hint_for_status(api.status);
    if (!hint) {
        return base + "\nHint: " + kDebugSuffix;
    }
    return base + "\nHint: " + *hint + ". " + kDebugSuffix;
}

} // namespace

// ============================================================================
// Envelope Construction
// ============================================================================

ErrorEnvelope make_error_envelope(const Error& err, bool debug) {
    ErrorEnvelope env;
    env.code = ErrorKind::InvalidInput;
    env.message = err.toString();

    if (const ApiError* api = err.apiError()) {
        env.code = api->kind();
        env.status = api->status;
        if (!debug) {
            env.message = api->message;
            env.hint = hint_for_status(api->status);
        }
        env.retryable = api->retryable;
        if (api->retry_after > 0) env.retry_after = api->retry_after;
        if (!api->field.empty()) env.field = api->field;
        return env;
    }

    if (err.isEmptyResult()) {
        env.code = ErrorKind::NotFound;
        if (!debug) env.hint = "No results matched; drop --fail-empty to accept empty lists";
        return env;
    }

    switch (err.code()) {
        case ErrorCode::INVALID_FLAG:
            env.code = ErrorKind::InvalidFlag;
            break;
        case ErrorCode::NETWORK:
            env.code = ErrorKind::NetworkError;
            env.retryable = true;
            break;
        case ErrorCode::TIMEOUT:
            env.code = ErrorKind::Timeout;
            env.retryable = true;
            break;
        default:
            break;
    }

    if (debug) {
        return env;
    }

    std::string msg = lowered(err.message());
    if (contains(msg, "invalid jq query")) {
        env.code = ErrorKind::InvalidInput;
        env.hint = "Check the --query expression";
    } else if (env.code == ErrorKind::InvalidFlag || contains(msg, "unknown flag")) {
        env.code = ErrorKind::InvalidFlag;
        env.hint = "Run --help to see valid flags";
    } else if (contains(msg, "invalid --output")) {
        env.hint = "Use --output text or --output json";
    } else if (env.code == ErrorKind::NetworkError ||
               contains(msg, "connection refused") || contains(msg, "no such host")) {
        env.code = ErrorKind::NetworkError;
        env.retryable = true;
        env.hint = "Check network connection";
    } else if (env.code == ErrorKind::Timeout || contains(msg, "timeout")) {
        env.code = ErrorKind::Timeout;
        env.retryable = true;
        env.hint = "Request timed out, retry";
    }

    return env;
}

// ============================================================================
// Renderings
// ============================================================================

std::string format_error(const std::optional<Error>& err, bool debug) {
    if (!err) {
        return "";
    }
    if (debug) {
        return err->toString();
    }

    if (const ApiError* api = err->apiError()) {
        return format_api_error(*api);
    }

    const std::string& msg = err->message();
    std::string lower = lowered(msg);
    if (contains(lower, "invalid jq query")) {
        return msg + "\nHint: Check the --query expression or drop it. Use -o json for machine output.";
    }
    if (contains(lower, "unknown flag")) {
        return msg + "\nHint: Run --help to see valid flags for this command.";
    }
    if (contains(lower, "invalid --output")) {
        return msg + "\nHint: Use --output text or --output json.";
    }

    return msg + "\nHint: Use --debug for full details.";
}

std::string format_error_json(const std::optional<Error>& err, bool debug) {
    if (!err) {
        return "";
    }
    nlohmann::json j = make_error_envelope(*err, debug);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace deputy
