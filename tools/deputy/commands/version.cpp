/**
 * deputy CLI - version command
 */

#include "../common.hpp"

#include <deputy/version.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_version(Session& session) {
    Renderer r = session.renderer();
    if (r.options().json()) {
        nlohmann::json j = {
            {"version", version()},
            {"commit", commit()},
            {"built", build_date()},
        };
        return r.output(j);
    }

    session.out << "deputy version " << version() << "\n";
    session.out << "  commit: " << commit() << "\n";
    session.out << "  built:  " << build_date() << "\n";
    return Result<void>::ok();
}

} // namespace

void setup_version(CLI::App* app, Session& session) {
    app->callback([&session]() {
        session.run([&session]() { return cmd_version(session); });
    });
}

} // namespace deputy::cli::commands
