/**
 * deputy CLI - leave commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_leave_list(Session& session, const ListFlags& flags, int64_t employee) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());
    if (employee < 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid --employee " + std::to_string(employee) + ": must be > 0"));
    }

    auto items = fetch<std::vector<Leave>>(session, [&](ApiClient& c) {
        if (employee > 0) {
            return query_leave(c, employee, page.value());
        }
        return list_leave(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "EMPLOYEE", "START", "END", "DAYS", "STATUS"},
        [](const Leave& l) {
            return std::vector<std::string>{
                std::to_string(l.id),
                std::to_string(l.employee),
                l.date_start,
                l.date_end,
                fixed(l.days, 1),
                leave_status_text(l.status),
            };
        });
}

Result<void> cmd_leave_get(Session& session, const std::string& arg) {
    auto id = parse_id("leave", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto leave = fetch<Leave>(session, [&](ApiClient& c) {
        return get_leave(c, id.value());
    });
    if (leave.isErr()) return Result<void>::err(leave.error());

    return render_one(session, leave.value(), [](const Leave& l) {
        Fields fields{
            {"ID", std::to_string(l.id)},
            {"Employee", std::to_string(l.employee)},
            {"Company", std::to_string(l.company)},
            {"Start", l.date_start},
            {"End", l.date_end},
            {"Days", fixed(l.days, 1)},
            {"Hours", fixed(l.hours, 1)},
            {"Status", leave_status_text(l.status)},
        };
        if (!l.comment.empty()) fields.push_back({"Comment", l.comment});
        if (l.leave_rule > 0) fields.push_back({"Leave Rule", std::to_string(l.leave_rule)});
        return fields;
    });
}

} // namespace

void setup_leave(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto employee = std::make_shared<int64_t>(0);
    auto* list_cmd = app->add_subcommand("list", "List leave requests");
    add_list_flags(list_cmd, *flags);
    list_cmd->add_option("--employee", *employee, "Filter by employee ID (uses resource query)");
    list_cmd->callback([&session, flags, employee]() {
        session.run([&session, flags, employee]() { return cmd_leave_list(session, *flags, *employee); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get leave request details");
    get_cmd->add_option("id", *id, "Leave request ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_leave_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
