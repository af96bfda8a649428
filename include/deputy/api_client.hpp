#pragma once

#include "deputy/errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace deputy {

// Server-side paging. Zero means "not requested".
struct ListOptions {
    int limit = 0;    // sent as max=
    int offset = 0;   // sent as start=

    bool empty() const { return limit <= 0 && offset <= 0; }
};

struct Request {
    std::string method = "GET";
    std::string path;                     // relative to the API base URL
    std::optional<nlohmann::json> body;
    ListOptions page;
};

/**
 * @brief Transport for Deputy API calls
 *
 * send() returns the decoded JSON response body (null for an empty body).
 * HTTP error statuses come back as errors wrapping an ApiError; transport
 * failures as NETWORK or TIMEOUT errors.
 */
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual Result<nlohmann::json> send(const Request& request) = 0;
};

} // namespace deputy
