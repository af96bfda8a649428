/**
 * deputy CLI - employees commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_employees_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Employee>>(session, [&](ApiClient& c) {
        return list_employees(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "NAME", "EMAIL", "ACTIVE"},
        [](const Employee& e) {
            return std::vector<std::string>{
                std::to_string(e.id),
                e.display_name,
                e.email,
                yes_no(e.active),
            };
        });
}

Result<void> cmd_employees_get(Session& session, const std::string& arg) {
    auto id = parse_id("employee", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto employee = fetch<Employee>(session, [&](ApiClient& c) {
        return get_employee(c, id.value());
    });
    if (employee.isErr()) return Result<void>::err(employee.error());

    return render_one(session, employee.value(), [](const Employee& e) {
        return Fields{
            {"ID", std::to_string(e.id)},
            {"Name", e.display_name},
            {"First Name", e.first_name},
            {"Last Name", e.last_name},
            {"Email", e.email},
            {"Mobile", e.mobile},
            {"Active", bool_text(e.active)},
            {"Company", std::to_string(e.company)},
        };
    });
}

} // namespace

void setup_employees(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto* list_cmd = app->add_subcommand("list", "List all employees");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags]() {
        session.run([&session, flags]() { return cmd_employees_list(session, *flags); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get employee details");
    get_cmd->add_option("id", *id, "Employee ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_employees_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
