#include <doctest/doctest.h>
#include <deputy/error_format.hpp>

using namespace deputy;

namespace {

Error api_error(int status, const std::string& message = "nope") {
    ApiError api;
    api.status = status;
    api.message = message;
    api.retryable = is_retryable_status(status);
    return Error(std::move(api));
}

} // namespace

TEST_CASE("format_error of no error is empty") {
    CHECK(format_error(std::nullopt, false).empty());
    CHECK(format_error(std::nullopt, true).empty());
    CHECK(format_error_json(std::nullopt).empty());
}

TEST_CASE("debug returns the raw message") {
    Error plain(ErrorCode::GENERAL, "something broke");
    CHECK(format_error(plain, true) == "something broke");

    Error api = api_error(404, "no such employee");
    CHECK(format_error(api, true) == "API error 404: no such employee");
}

TEST_CASE("API errors get the status hint and debug suffix") {
    std::string text = format_error(api_error(404, "gone"), false);
    CHECK(text.rfind("API error 404: gone\nHint: Resource not found", 0) == 0);
    CHECK(text.find("Use --debug for details.") != std::string::npos);
    CHECK(text.find("omit 2>&1") != std::string::npos);
}

TEST_CASE("API errors without a status hint still get the suffix") {
    std::string text = format_error(api_error(418, "teapot"), false);
    CHECK(text == "API error 418: teapot\nHint: Use --debug for details. Avoid piping stderr into jq (omit 2>&1).");
}

TEST_CASE("non-API messages get phrase-specific hints") {
    CHECK(format_error(Error(ErrorCode::INVALID_INPUT, "invalid jq query: bad at position 1"), false)
              .find("Check the --query expression") != std::string::npos);
    CHECK(format_error(Error(ErrorCode::INVALID_FLAG, "unknown flag: --x"), false)
              .find("Run --help") != std::string::npos);
    CHECK(format_error(Error(ErrorCode::INVALID_INPUT, "invalid --output \"xml\""), false)
              .find("--output text or --output json") != std::string::npos);
    CHECK(format_error(Error(ErrorCode::GENERAL, "weird"), false) ==
          "weird\nHint: Use --debug for full details.");
}

TEST_CASE("status hint table") {
    CHECK(hint_for_status(400).has_value());
    CHECK(hint_for_status(401).has_value());
    CHECK(hint_for_status(412).has_value());
    CHECK(hint_for_status(417).has_value());
    CHECK(hint_for_status(599).has_value());
    CHECK_FALSE(hint_for_status(418).has_value());
    CHECK_FALSE(hint_for_status(200).has_value());
}

TEST_CASE("JSON envelope from an API error") {
    ApiError api;
    api.status = 429;
    api.message = "slow down";
    api.retryable = true;
    api.retry_after = 30;
    api.field = "Employee";

    auto j = nlohmann::json::parse(format_error_json(Error(api)));
    const auto& e = j.at("error");
    CHECK(e.at("code") == "RATE_LIMITED");
    CHECK(e.at("status") == 429);
    CHECK(e.at("message") == "slow down");
    CHECK(e.at("retryable") == true);
    CHECK(e.at("retryAfter") == 30);
    CHECK(e.at("field") == "Employee");
    CHECK(e.contains("hint"));
}

TEST_CASE("JSON envelope omits unknown optional members") {
    auto j = nlohmann::json::parse(format_error_json(api_error(404)));
    const auto& e = j.at("error");
    CHECK(e.at("code") == "NOT_FOUND");
    CHECK_FALSE(e.contains("retryAfter"));
    CHECK_FALSE(e.contains("field"));
}

TEST_CASE("JSON envelope for local errors") {
    auto code_of = [](const Error& err) {
        return nlohmann::json::parse(format_error_json(err)).at("error").at("code").get<std::string>();
    };
    CHECK(code_of(Error(ErrorCode::GENERAL, "weird")) == "INVALID_INPUT");
    CHECK(code_of(Error(ErrorCode::GENERAL, "unknown flag: --x")) == "INVALID_FLAG");
    CHECK(code_of(Error(ErrorCode::INVALID_FLAG, "bad flag")) == "INVALID_FLAG");
    CHECK(code_of(Error(ErrorCode::GENERAL, "dial: connection refused")) == "NETWORK_ERROR");
    CHECK(code_of(Error(ErrorCode::NETWORK, "request failed")) == "NETWORK_ERROR");
    CHECK(code_of(Error(ErrorCode::TIMEOUT, "slow")) == "TIMEOUT");
    CHECK(code_of(Error::emptyResult()) == "NOT_FOUND");

    auto net = nlohmann::json::parse(format_error_json(Error(ErrorCode::NETWORK, "x")));
    CHECK(net["error"]["retryable"] == true);
}

TEST_CASE("debug JSON envelope keeps the raw message and drops the hint") {
    auto j = nlohmann::json::parse(format_error_json(api_error(404, "gone"), true));
    CHECK(j["error"]["message"] == "API error 404: gone");
    CHECK_FALSE(j["error"].contains("hint"));
    CHECK(j["error"]["status"] == 404);
}

TEST_CASE("JSON envelope parses back") {
    Error err = api_error(503, "down");
    auto j = nlohmann::json::parse(format_error_json(err));
    ErrorEnvelope env = j.get<ErrorEnvelope>();
    CHECK(env.code == ErrorKind::ServerError);
    CHECK(env.status == 503);
    CHECK(env.message == "down");
    CHECK(env.retryable);
}
