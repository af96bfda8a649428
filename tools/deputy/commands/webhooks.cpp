/**
 * deputy CLI - webhooks commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

Result<void> cmd_webhooks_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<Webhook>>(session, [&](ApiClient& c) {
        return list_webhooks(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    return render_list(session, flags, items.value(), {"ID", "TOPIC", "URL", "ENABLED"},
        [](const Webhook& w) {
            return std::vector<std::string>{
                std::to_string(w.id),
                w.topic,
                w.url,
                yes_no(w.enabled),
            };
        });
}

Result<void> cmd_webhooks_get(Session& session, const std::string& arg) {
    auto id = parse_id("webhook", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto webhook = fetch<Webhook>(session, [&](ApiClient& c) {
        return get_webhook(c, id.value());
    });
    if (webhook.isErr()) return Result<void>::err(webhook.error());

    return render_one(session, webhook.value(), [](const Webhook& w) {
        return Fields{
            {"ID", std::to_string(w.id)},
            {"Topic", w.topic},
            {"URL", w.url},
            {"Type", w.type},
            {"Enabled", bool_text(w.enabled)},
        };
    });
}

} // namespace

void setup_webhooks(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto flags = std::make_shared<ListFlags>();
    auto* list_cmd = app->add_subcommand("list", "List webhooks");
    add_list_flags(list_cmd, *flags);
    list_cmd->callback([&session, flags]() {
        session.run([&session, flags]() { return cmd_webhooks_list(session, *flags); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get webhook details");
    get_cmd->add_option("id", *id, "Webhook ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_webhooks_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
