/**
 * deputy CLI - pay commands
 *
 * Award library entries and employee agreements. The award library returns
 * free-form objects, so those are rendered from the JSON as-is.
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

std::string value_text(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

// First non-null value among `keys`, as display text.
std::string first_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) return value_text(*it);
    }
    return "";
}

std::string base_rate_text(const Agreement& a) {
    return a.base_rate ? fixed(*a.base_rate, 2) : "";
}

// ============================================================================
// Awards
// ============================================================================

Result<void> cmd_awards_list(Session& session, const ListFlags& flags) {
    auto page = validate_list_flags(flags);
    if (page.isErr()) return Result<void>::err(page.error());

    auto items = fetch<std::vector<nlohmann::json>>(session, [](ApiClient& c) { return list_awards(c); });
    if (items.isErr()) return Result<void>::err(items.error());

    auto awards = apply_pagination(std::move(items.value()), flags.offset, flags.limit);
    return render_list(session, flags, awards, {"CODE", "NAME", "COUNTRY"},
        [](const nlohmann::json& a) {
            return std::vector<std::string>{
                first_field(a, {"AwardCode", "Code", "Id"}),
                first_field(a, {"Name", "AwardName", "Description"}),
                first_field(a, {"CountryCode", "Country"}),
            };
        });
}

Result<void> cmd_awards_get(Session& session, const std::string& code) {
    if (code.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "award code must not be empty"));
    }

    auto award = fetch<nlohmann::json>(session, [&](ApiClient& c) { return get_award(c, code); });
    if (award.isErr()) return Result<void>::err(award.error());

    Renderer r = session.renderer();
    if (r.options().json()) {
        return r.output(award.value());
    }
    // Keys come out sorted.
    for (const auto& item : award.value().items()) {
        session.out << item.key() << ": " << value_text(item.value()) << "\n";
    }
    return Result<void>::ok();
}

// ============================================================================
// Agreements
// ============================================================================

struct AgreementFilter {
    ListFlags list;
    int64_t employee = 0;
    bool active_only = false;
};

Result<void> cmd_agreements_list(Session& session, const AgreementFilter& filter) {
    auto page = validate_list_flags(filter.list);
    if (page.isErr()) return Result<void>::err(page.error());
    if (filter.employee <= 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "--employee is required"));
    }

    auto items = fetch<std::vector<Agreement>>(session, [&](ApiClient& c) {
        return list_agreements(c, filter.employee, filter.active_only);
    });
    if (items.isErr()) return Result<void>::err(items.error());

    auto agreements = apply_pagination(std::move(items.value()), filter.list.offset, filter.list.limit);
    return render_list(session, filter.list, agreements, {"ID", "EMPLOYEE", "ACTIVE", "BASE RATE"},
        [](const Agreement& a) {
            return std::vector<std::string>{
                std::to_string(a.id),
                std::to_string(a.employee),
                yes_no(a.active),
                base_rate_text(a),
            };
        });
}

Result<void> cmd_agreements_get(Session& session, const std::string& arg) {
    auto id = parse_id("agreement", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto agreement = fetch<Agreement>(session, [&](ApiClient& c) {
        return get_agreement(c, id.value());
    });
    if (agreement.isErr()) return Result<void>::err(agreement.error());

    return render_one(session, agreement.value(), [](const Agreement& a) {
        Fields fields{
            {"ID", std::to_string(a.id)},
            {"Employee", std::to_string(a.employee)},
            {"Active", bool_text(a.active)},
        };
        if (a.base_rate) fields.push_back({"Base Rate", base_rate_text(a)});
        if (!a.config.is_null()) fields.push_back({"Config", a.config.dump()});
        return fields;
    });
}

} // namespace

void setup_pay(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto* awards = app->add_subcommand("awards", "Award library pay rates");
    setup_group(awards, session);

    auto award_flags = std::make_shared<ListFlags>();
    auto* awards_list = awards->add_subcommand("list", "List awards from the pay rate library");
    add_list_flags(awards_list, *award_flags);
    awards_list->callback([&session, award_flags]() {
        session.run([&session, award_flags]() { return cmd_awards_list(session, *award_flags); });
    });

    auto code = std::make_shared<std::string>();
    auto* awards_get = awards->add_subcommand("get", "Get details for an award from the library");
    awards_get->add_option("award-code", *code, "Award code")->required();
    awards_get->callback([&session, code]() {
        session.run([&session, code]() { return cmd_awards_get(session, *code); });
    });

    auto* agreements = app->add_subcommand("agreements", "Employee agreements (base rate and area config)");
    setup_group(agreements, session);

    auto filter = std::make_shared<AgreementFilter>();
    auto* agreements_list = agreements->add_subcommand("list", "List agreements for an employee");
    add_list_flags(agreements_list, filter->list);
    agreements_list->add_option("--employee", filter->employee, "Employee ID (required)");
    agreements_list->add_flag("--active-only", filter->active_only, "Only show active agreements");
    agreements_list->callback([&session, filter]() {
        session.run([&session, filter]() { return cmd_agreements_list(session, *filter); });
    });

    auto id = std::make_shared<std::string>();
    auto* agreements_get = agreements->add_subcommand("get", "Get agreement details");
    agreements_get->add_option("id", *id, "Agreement ID")->required();
    agreements_get->callback([&session, id]() {
        session.run([&session, id]() { return cmd_agreements_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
