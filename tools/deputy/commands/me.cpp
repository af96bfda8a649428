/**
 * deputy CLI - me commands
 *
 * Information about the authenticated user. The /my endpoints ignore paging
 * parameters, so --limit and --offset are applied client-side.
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Fields me_fields(const MeInfo& m) {
    return {
        {"User ID", std::to_string(m.user_id)},
        {"Employee ID", std::to_string(m.employee_id)},
        {"Login", m.login},
        {"Name", m.name},
        {"First Name", m.first_name},
        {"Last Name", m.last_name},
        {"Email", m.primary_email},
        {"Phone", m.primary_phone},
        {"Company", std::to_string(m.company)},
        {"Portfolio", m.portfolio},
    };
}

Result<void> cmd_me_info(Session& session) {
    auto info = fetch<MeInfo>(session, [](ApiClient& c) { return get_me(c); });
    if (info.isErr()) return Result<void>::err(info.error());
    return render_one(session, info.value(), me_fields);
}

Result<void> cmd_me_timesheets(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Timesheet>>(session, [](ApiClient& c) { return list_my_timesheets(c); });
    if (items.isErr()) return Result<void>::err(items.error());

    auto timesheets = apply_pagination(std::move(items.value()), flags.offset, flags.limit);
    return render_list(session, flags, timesheets, {"ID", "DATE", "START", "END", "TOTAL"},
        [](const Timesheet& t) {
            return std::vector<std::string>{
                std::to_string(t.id),
                t.date,
                clock_time(t.start_time),
                t.end_time > 0 ? clock_time(t.end_time) : "-",
                t.total_time_str,
            };
        });
}

Result<void> cmd_me_rosters(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Roster>>(session, [](ApiClient& c) { return list_my_rosters(c); });
    if (items.isErr()) return Result<void>::err(items.error());

    auto rosters = apply_pagination(std::move(items.value()), flags.offset, flags.limit);
    return render_list(session, flags, rosters, {"ID", "DATE", "START", "END"},
        [](const Roster& r) {
            return std::vector<std::string>{
                std::to_string(r.id),
                r.date,
                clock_time(r.start_time),
                clock_time(r.end_time),
            };
        });
}

Result<void> cmd_me_leave(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Leave>>(session, [](ApiClient& c) { return list_my_leave(c); });
    if (items.isErr()) return Result<void>::err(items.error());

    auto leave = apply_pagination(std::move(items.value()), flags.offset, flags.limit);
    return render_list(session, flags, leave, {"ID", "START", "END", "STATUS", "HOURS"},
        [](const Leave& l) {
            return std::vector<std::string>{
                std::to_string(l.id),
                l.date_start,
                l.date_end,
                leave_status_text(l.status),
                fixed(l.hours, 1),
            };
        });
}

} // namespace

void setup_me(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto* info_cmd = app->add_subcommand("info", "Show current user info");
    info_cmd->callback([&session]() {
        session.run([&session]() { return cmd_me_info(session); });
    });

    auto timesheet_flags = std::make_shared<ListFlags>();
    auto* timesheets_cmd = app->add_subcommand("timesheets", "List my timesheets");
    add_list_flags(timesheets_cmd, *timesheet_flags);
    timesheets_cmd->callback([&session, timesheet_flags]() {
        session.run([&session, timesheet_flags]() { return cmd_me_timesheets(session, *timesheet_flags); });
    });

    auto roster_flags = std::make_shared<ListFlags>();
    auto* rosters_cmd = app->add_subcommand("rosters", "List my rosters");
    add_list_flags(rosters_cmd, *roster_flags);
    rosters_cmd->callback([&session, roster_flags]() {
        session.run([&session, roster_flags]() { return cmd_me_rosters(session, *roster_flags); });
    });

    auto leave_flags = std::make_shared<ListFlags>();
    auto* leave_cmd = app->add_subcommand("leave", "List my leave requests");
    add_list_flags(leave_cmd, *leave_flags);
    leave_cmd->callback([&session, leave_flags]() {
        session.run([&session, leave_flags]() { return cmd_me_leave(session, *leave_flags); });
    });
}

} // namespace deputy::cli::commands
