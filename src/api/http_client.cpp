#include "deputy/http_client.hpp"
#include "deputy/version.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <map>

namespace deputy {

namespace {

const size_t kMaxErrorBodyLen = 500;

// ============================================================================
// libcurl plumbing
// ============================================================================

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// Collects response headers, keyed by lowercased name.
size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    size_t total = size * nmemb;
    std::string line(ptr, total);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        std::string value = line.substr(colon + 1);
        auto start = value.find_first_not_of(" \t");
        auto end = value.find_last_not_of(" \t\r\n");
        value = start == std::string::npos ? "" : value.substr(start, end - start + 1);
        (*headers)[name] = value;
    }
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void add(const std::string& header) { list_ = curl_slist_append(list_, header.c_str()); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

Error transport_error(CURLcode code, const char* detail) {
    std::string why = detail && detail[0] ? detail : curl_easy_strerror(code);
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return Error(ErrorCode::NETWORK, "request failed: no such host (" + why + ")");
        case CURLE_COULDNT_CONNECT:
            return Error(ErrorCode::NETWORK, "request failed: connection refused (" + why + ")");
        case CURLE_OPERATION_TIMEDOUT:
            return Error(ErrorCode::TIMEOUT, "request failed: timeout (" + why + ")");
        default:
            return Error(ErrorCode::NETWORK, "request failed: " + why);
    }
}

const char* generic_message(int status) {
    switch (status) {
        case 400: return "bad request";
        case 401: return "unauthorized";
        case 403: return "forbidden";
        case 404: return "not found";
        case 405: return "method not allowed";
        case 409: return "conflict";
        case 422: return "unprocessable entity";
        case 429: return "too many requests";
        case 500: return "server error";
        case 502: return "bad gateway";
        case 503: return "service unavailable";
        case 504: return "gateway timeout";
        default:
            return status >= 500 ? "server error" : "request failed";
    }
}

bool has_text(const nlohmann::json& j) {
    if (!j.is_string()) return false;
    const auto& s = j.get_ref<const std::string&>();
    return s.find_first_not_of(" \t\r\n") != std::string::npos;
}

} // namespace

// ============================================================================
// Error Decoding
// ============================================================================

ApiError parse_error_response(int status, const std::string& body, bool debug) {
    ApiError api;
    api.status = status;
    api.retryable = is_retryable_status(status);

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto err = parsed.find("error");
        if (err != parsed.end() && err->is_object() && has_text(err->value("message", nlohmann::json()))) {
            api.message = (*err)["message"].get<std::string>();
        } else if (has_text(parsed.value("message", nlohmann::json()))) {
            api.message = parsed["message"].get<std::string>();
        }
    }

    if (api.message.empty() && debug && !body.empty()) {
        api.message = body.size() > kMaxErrorBodyLen ? body.substr(0, kMaxErrorBodyLen) + "..." : body;
    }

    if (api.message.empty()) {
        api.message = generic_message(status);
    }

    return api;
}

int parse_retry_after(const std::string& value) {
    if (value.empty()) return 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
    }
    long seconds = std::strtol(value.c_str(), nullptr, 10);
    return seconds > 0 && seconds < 86400 * 7 ? static_cast<int>(seconds) : 0;
}

// ============================================================================
// HttpApiClient
// ============================================================================

std::string HttpApiClient::build_url(const std::string& path, const ListOptions& page) const {
    std::string url = credentials_.base_url() + path;

    std::string params;
    if (page.limit > 0) {
        params += "max=" + std::to_string(page.limit);
    }
    if (page.offset > 0) {
        if (!params.empty()) params += "&";
        params += "start=" + std::to_string(page.offset);
    }
    if (!params.empty()) {
        url += (path.find('?') == std::string::npos ? "?" : "&") + params;
    }
    return url;
}

Result<nlohmann::json> HttpApiClient::send(const Request& request) {
    using R = Result<nlohmann::json>;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        return R::err(Error(ErrorCode::GENERAL, "failed to initialize CURL"));
    }

    std::string url = build_url(request.path, request.page);
    std::string payload;
    if (request.body) {
        payload = request.body->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string buffer;
    std::map<std::string, std::string> headers;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    CurlHeaders request_headers;
    request_headers.add("Authorization: " + credentials_.authorization_header());
    request_headers.add("Content-Type: application/json");
    request_headers.add("Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, request_headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    if (request.body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    std::string user_agent = std::string("deputy-cli/") + version();
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());

    spdlog::debug("{} {}", request.method, url);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        spdlog::debug("{} {} failed: {}", request.method, url, curl_easy_strerror(res));
        return R::err(transport_error(res, error_buffer));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    spdlog::debug("{} {} -> {} ({} bytes)", request.method, url, status, buffer.size());

    if (status >= 400) {
        ApiError api = parse_error_response(static_cast<int>(status), buffer, debug_);
        auto retry = headers.find("retry-after");
        if (retry != headers.end()) {
            api.retry_after = parse_retry_after(retry->second);
        }
        Error err(std::move(api));
        if (debug_) {
            err.withContext(request.method + " " + url);
        }
        return R::err(std::move(err));
    }

    if (buffer.find_first_not_of(" \t\r\n") == std::string::npos) {
        return R::ok(nlohmann::json());
    }

    auto parsed = nlohmann::json::parse(buffer, nullptr, false);
    if (parsed.is_discarded()) {
        return R::err(Error(ErrorCode::GENERAL,
            "invalid JSON response from " + request.method + " " + request.path));
    }
    return R::ok(std::move(parsed));
}

} // namespace deputy
