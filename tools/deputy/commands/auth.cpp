/**
 * deputy CLI - auth commands
 *
 * Credentials come from the environment (DEPUTY_TOKEN and friends, or a
 * .env file). These commands only report on them.
 */

#include "../common.hpp"

#include <deputy/credentials.hpp>
#include <deputy/resources.hpp>

#include <algorithm>
#include <cctype>

namespace deputy::cli::commands {

namespace {

std::string mask_token(const std::string& token) {
    if (token.size() <= 8) return "****";
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Result<void> cmd_auth_status(Session& session) {
    auto creds = credentials_from_env(session.env);
    if (creds.isErr()) {
        if (creds.error().message().find("not authenticated") != std::string::npos) {
            session.out << "Not authenticated. Set DEPUTY_TOKEN (env/.env) to configure." << std::endl;
            return Result<void>::ok();
        }
        return Result<void>::err(creds.error());
    }

    const Credentials& c = creds.value();
    std::string masked = mask_token(c.token);

    Renderer r = session.renderer();
    if (r.options().json()) {
        return r.output(nlohmann::json{
            {"install", c.install},
            {"region", upper(c.geo)},
            {"base_url", c.base_url()},
            {"token_masked", masked},
        });
    }
    print_key_values(session.out, {
        {"Install", c.install},
        {"Region", upper(c.geo)},
        {"Base URL", c.base_url()},
        {"Token", masked},
    });
    return Result<void>::ok();
}

Result<void> cmd_auth_test(Session& session) {
    auto me = fetch<MeInfo>(session, [](ApiClient& c) { return get_me(c); });
    if (me.isErr()) {
        Error err = me.error();
        err.withContext("authentication failed");
        return Result<void>::err(std::move(err));
    }

    const MeInfo& m = me.value();
    Renderer r = session.renderer();
    if (r.options().json()) {
        return r.output(nlohmann::json{
            {"authenticated", true},
            {"name", m.name},
            {"email", m.primary_email},
            {"employee_id", m.employee_id},
        });
    }
    session.out << "Authentication successful!\n"
                << "User: " << m.name << " (" << m.primary_email << ")\n"
                << "ID:   " << m.employee_id << "\n";
    return Result<void>::ok();
}

} // namespace

void setup_auth(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto* status_cmd = app->add_subcommand("status", "Show current authentication status");
    status_cmd->callback([&session]() {
        session.run([&session]() { return cmd_auth_status(session); });
    });

    auto* test_cmd = app->add_subcommand("test", "Test authentication by calling the /me endpoint");
    test_cmd->callback([&session]() {
        session.run([&session]() { return cmd_auth_test(session); });
    });
}

} // namespace deputy::cli::commands
