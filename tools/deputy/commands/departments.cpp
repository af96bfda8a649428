/**
 * deputy CLI - departments commands
 *
 * Departments are Deputy operational units.
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_departments_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Department>>(session, [&](ApiClient& c) {
        return list_departments(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "NAME", "CODE", "COMPANY", "ACTIVE"},
        [](const Department& d) {
            return std::vector<std::string>{
                std::to_string(d.id),
                d.company_name,
                d.company_code,
                std::to_string(d.company),
                yes_no(d.active),
            };
        });
}

Result<void> cmd_departments_get(Session& session, const std::string& arg) {
    auto id = parse_id("department", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto department = fetch<Department>(session, [&](ApiClient& c) {
        return get_department(c, id.value());
    });
    if (department.isErr()) return Result<void>::err(department.error());

    return render_one(session, department.value(), [](const Department& d) {
        return Fields{
            {"ID", std::to_string(d.id)},
            {"Name", d.company_name},
            {"Code", d.company_code},
            {"Company", std::to_string(d.company)},
            {"Parent ID", std::to_string(d.parent_id)},
            {"Sort Order", std::to_string(d.sort_order)},
            {"Active", bool_text(d.active)},
        };
    });
}

} // namespace

void setup_departments(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto* list_cmd = app->add_subcommand("list", "List all departments");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags]() {
        session.run([&session, flags]() { return cmd_departments_list(session, *flags); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get department details");
    get_cmd->add_option("id", *id, "Department ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_departments_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
