/**
 * deputy CLI - sales commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_sales_list(Session& session, const ListFlags& flags, int64_t company) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());
    if (company < 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid --company " + std::to_string(company) + ": must be > 0"));
    }

    auto items = fetch<std::vector<SalesData>>(session, [&](ApiClient& c) {
        return list_sales(c, company);
    });
    if (items.isErr()) return Result<void>::err(items.error());

    // The endpoint ignores paging parameters.
    auto sales = apply_pagination(std::move(items.value()), flags.offset, flags.limit);
    return render_list(session, flags, sales, {"ID", "COMPANY", "TIMESTAMP", "VALUE", "TYPE"},
        [](const SalesData& s) {
            return std::vector<std::string>{
                std::to_string(s.id),
                std::to_string(s.company),
                rfc3339(s.timestamp),
                fixed(s.value, 2),
                s.type,
            };
        });
}

} // namespace

void setup_sales(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto company = std::make_shared<int64_t>(0);
    auto* list_cmd = app->add_subcommand("list", "List sales data");
    list_cmd->add_option("--company", *company, "Filter by company ID");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags, company]() {
        session.run([&session, flags, company]() { return cmd_sales_list(session, *flags, *company); });
    });
}

} // namespace deputy::cli::commands
