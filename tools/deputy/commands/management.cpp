/**
 * deputy CLI - management commands
 *
 * Memos posted to a location and journal entries about an employee. Both
 * endpoints ignore paging parameters, so --limit and --offset are applied
 * client-side.
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

constexpr size_t kPreviewBytes = 50;

struct ScopedListFlags {
    ListFlags list;
    int64_t scope = 0;    // --company for memos, --employee for journals
};

Result<void> cmd_memo_list(Session& session, const ScopedListFlags& flags) {
    auto page = validate_list_flags(flags.list);
    if (page.isErr()) return Result<void>::err(page.error());
    if (flags.scope <= 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "--company is required"));
    }

    auto items = fetch<std::vector<Memo>>(session, [&](ApiClient& c) {
        return list_memos(c, flags.scope);
    });
    if (items.isErr()) return Result<void>::err(items.error());

    auto memos = apply_pagination(std::move(items.value()), flags.list.offset, flags.list.limit);
    return render_list(session, flags.list, memos, {"ID", "CREATED", "CONTENT"},
        [](const Memo& m) {
            return std::vector<std::string>{
                std::to_string(m.id),
                local_date(m.created),
                truncate_text(m.content, kPreviewBytes),
            };
        });
}

Result<void> cmd_journal_list(Session& session, const ScopedListFlags& flags) {
    auto page = validate_list_flags(flags.list);
    if (page.isErr()) return Result<void>::err(page.error());
    if (flags.scope <= 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "--employee is required"));
    }

    auto items = fetch<std::vector<Journal>>(session, [&](ApiClient& c) {
        return list_journals(c, flags.scope);
    });
    if (items.isErr()) return Result<void>::err(items.error());

    auto journals = apply_pagination(std::move(items.value()), flags.list.offset, flags.list.limit);
    return render_list(session, flags.list, journals, {"ID", "CREATED", "COMMENT"},
        [](const Journal& j) {
            return std::vector<std::string>{
                std::to_string(j.id),
                local_date(j.created),
                truncate_text(j.comment, kPreviewBytes),
            };
        });
}

} // namespace

void setup_management(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto* memo = app->add_subcommand("memo", "Location memos");
    setup_group(memo, session);

    auto memo_flags = std::make_shared<ScopedListFlags>();
    auto* memo_list = memo->add_subcommand("list", "List memos for a location");
    memo_list->add_option("--company", memo_flags->scope, "Company ID (required)");
    add_list_flags(memo_list, memo_flags->list);
    memo_list->callback([&session, memo_flags]() {
        session.run([&session, memo_flags]() { return cmd_memo_list(session, *memo_flags); });
    });

    auto* journal = app->add_subcommand("journal", "Employee journal entries");
    setup_group(journal, session);

    auto journal_flags = std::make_shared<ScopedListFlags>();
    auto* journal_list = journal->add_subcommand("list", "List journal entries for an employee");
    journal_list->add_option("--employee", journal_flags->scope, "Employee ID (required)");
    add_list_flags(journal_list, journal_flags->list);
    journal_list->callback([&session, journal_flags]() {
        session.run([&session, journal_flags]() { return cmd_journal_list(session, *journal_flags); });
    });
}

} // namespace deputy::cli::commands
