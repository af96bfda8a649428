#pragma once

#include "deputy/environment.hpp"
#include "deputy/errors.hpp"

#include <string>

namespace deputy {

/**
 * @brief API credentials resolved from the environment
 *
 * Either `install` (with an optional `geo`) or `base_url_override` locates
 * the tenant. The override may be a bare host or a full URL; it is always
 * normalized to end in /api/v1.
 */
struct Credentials {
    std::string token;
    std::string install;
    std::string geo;
    std::string base_url_override;
    std::string auth_scheme;

    // https://<install>[.<geo>].deputy.com/api/v1, or the normalized override.
    std::string base_url() const;

    // "<scheme> <token>", scheme defaulting to Bearer.
    std::string authorization_header() const;
};

// Add https:// when no scheme is given and force the /api/v1 suffix.
std::string normalize_base_url(const std::string& url);

/**
 * @brief Read credentials from DEPUTY_TOKEN, DEPUTY_INSTALL, DEPUTY_GEO,
 * DEPUTY_BASE_URL and DEPUTY_AUTH_SCHEME
 *
 * Values are trimmed; install and geo are lowercased. Fails when the token
 * is missing, or when neither DEPUTY_BASE_URL nor DEPUTY_INSTALL is set.
 */
Result<Credentials> credentials_from_env(const Environment& env);

} // namespace deputy
