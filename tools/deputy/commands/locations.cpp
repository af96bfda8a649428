/**
 * deputy CLI - locations commands
 *
 * Locations are Deputy Company records.
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

const std::string& location_code(const Location& l) {
    return l.code.empty() ? l.company_code : l.code;
}

Result<void> cmd_locations_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Location>>(session, [&](ApiClient& c) {
        return list_locations(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "NAME", "CODE", "ACTIVE"},
        [](const Location& l) {
            return std::vector<std::string>{
                std::to_string(l.id),
                l.company_name,
                location_code(l),
                yes_no(l.active),
            };
        });
}

Result<void> cmd_locations_get(Session& session, const std::string& arg) {
    auto id = parse_id("location", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto location = fetch<Location>(session, [&](ApiClient& c) {
        return get_location(c, id.value());
    });
    if (location.isErr()) return Result<void>::err(location.error());

    return render_one(session, location.value(), [](const Location& l) {
        return Fields{
            {"ID", std::to_string(l.id)},
            {"Name", l.company_name},
            {"Code", location_code(l)},
            {"Address", l.address_string()},
            {"Timezone", l.timezone},
            {"Active", bool_text(l.active)},
        };
    });
}

} // namespace

void setup_locations(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto* list_cmd = app->add_subcommand("list", "List all locations");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags]() {
        session.run([&session, flags]() { return cmd_locations_list(session, *flags); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get location details");
    get_cmd->add_option("id", *id, "Location ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_locations_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
