/**
 * deputy CLI - rosters commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_rosters_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Roster>>(session, [&](ApiClient& c) {
        return list_rosters(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "DATE", "START", "END", "EMPLOYEE", "PUBLISHED"},
        [](const Roster& r) {
            return std::vector<std::string>{
                std::to_string(r.id),
                r.date,
                clock_time(r.start_time),
                clock_time(r.end_time),
                std::to_string(r.employee),
                yes_no(r.published),
            };
        });
}

Result<void> cmd_rosters_get(Session& session, const std::string& arg) {
    auto id = parse_id("roster", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto roster = fetch<Roster>(session, [&](ApiClient& c) {
        return get_roster(c, id.value());
    });
    if (roster.isErr()) return Result<void>::err(roster.error());

    return render_one(session, roster.value(), [](const Roster& r) {
        return Fields{
            {"ID", std::to_string(r.id)},
            {"Date", r.date},
            {"Start", clock_time(r.start_time)},
            {"End", clock_time(r.end_time)},
            {"Employee", std::to_string(r.employee)},
            {"OpUnit", std::to_string(r.operational_unit)},
            {"Published", bool_text(r.published)},
            {"Open", bool_text(r.open)},
        };
    });
}

} // namespace

void setup_rosters(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto* list_cmd = app->add_subcommand("list", "List rosters (last 12h + next 36h)");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags]() {
        session.run([&session, flags]() { return cmd_rosters_list(session, *flags); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get roster details");
    get_cmd->add_option("id", *id, "Roster ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_rosters_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
