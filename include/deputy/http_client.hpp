#pragma once

#include "deputy/api_client.hpp"
#include "deputy/credentials.hpp"

#include <string>

namespace deputy {

/**
 * @brief ApiClient over libcurl
 *
 * Every request carries the Authorization header built from the
 * credentials plus JSON Content-Type and Accept headers. Requests time out
 * after `timeout_seconds`. With `debug` set, HTTP errors are prefixed with
 * "<METHOD> <url>" and unstructured error bodies are included in the
 * message.
 */
class HttpApiClient : public ApiClient {
public:
    HttpApiClient(Credentials credentials, bool debug, long timeout_seconds = 30)
        : credentials_(std::move(credentials)), debug_(debug), timeout_seconds_(timeout_seconds) {}

    Result<nlohmann::json> send(const Request& request) override;

    // Base URL + path, with max= and start= when paging was requested.
    std::string build_url(const std::string& path, const ListOptions& page) const;

private:
    Credentials credentials_;
    bool debug_;
    long timeout_seconds_;
};

/**
 * @brief Decode an HTTP error response into an ApiError
 *
 * The message is taken from {"error": {"message": ...}} or {"message": ...}.
 * Failing that, debug mode uses the body itself (truncated to 500
 * characters); otherwise a generic message for the status is used.
 */
ApiError parse_error_response(int status, const std::string& body, bool debug);

// Seconds from a Retry-After header value; 0 when absent or not a number.
int parse_retry_after(const std::string& value);

} // namespace deputy
