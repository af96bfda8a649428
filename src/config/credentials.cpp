#include "deputy/credentials.hpp"

#include <cctype>

namespace deputy {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string normalize_base_url(const std::string& url) {
    std::string u = trim(url);
    while (!u.empty() && u.back() == '/') u.pop_back();
    if (u.empty()) return "";

    if (!starts_with(u, "http://") && !starts_with(u, "https://")) {
        u = "https://" + u;
    }

    // Replace an existing /api/vN with /api/v1.
    size_t at = u.find("/api/v");
    while (at != std::string::npos) {
        size_t digits = at + 6;
        size_t end = digits;
        while (end < u.size() && std::isdigit(static_cast<unsigned char>(u[end]))) ++end;
        if (end > digits) {
            u.replace(at, end - at, "/api/v1");
            return u;
        }
        at = u.find("/api/v", at + 1);
    }

    return u + "/api/v1";
}

std::string Credentials::base_url() const {
    if (!base_url_override.empty()) {
        return normalize_base_url(base_url_override);
    }
    if (install.empty()) {
        return "";
    }
    if (!geo.empty()) {
        return "https://" + install + "." + geo + ".deputy.com/api/v1";
    }
    return "https://" + install + ".deputy.com/api/v1";
}

std::string Credentials::authorization_header() const {
    std::string scheme = trim(auth_scheme);
    if (scheme.empty()) {
        scheme = "Bearer";
    }
    return scheme + " " + token;
}

Result<Credentials> credentials_from_env(const Environment& env) {
    Credentials creds;
    creds.token = trim(env.get("DEPUTY_TOKEN"));
    if (creds.token.empty()) {
        return Result<Credentials>::err(Error(ErrorCode::GENERAL,
            "not authenticated - set DEPUTY_TOKEN (env or .env)"));
    }

    creds.install = to_lower(trim(env.get("DEPUTY_INSTALL")));
    creds.geo = to_lower(trim(env.get("DEPUTY_GEO")));
    creds.base_url_override = trim(env.get("DEPUTY_BASE_URL"));
    creds.auth_scheme = trim(env.get("DEPUTY_AUTH_SCHEME"));

    if (creds.base_url_override.empty() && creds.install.empty()) {
        return Result<Credentials>::err(Error(ErrorCode::GENERAL,
            "DEPUTY_TOKEN is set, but neither DEPUTY_BASE_URL nor DEPUTY_INSTALL is set"));
    }

    return Result<Credentials>::ok(std::move(creds));
}

} // namespace deputy
