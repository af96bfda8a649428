/**
 * deputy CLI - timesheets commands
 */

#include "../common.hpp"

#include <deputy/resources.hpp>

namespace deputy::cli::commands {

namespace {

struct TimesheetFilter {
    ListFlags list;
    std::string from;
    std::string to;
    int64_t employee = 0;
};

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Strict YYYY-MM-DD with a real calendar day.
bool is_calendar_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    int year = std::stoi(s.substr(0, 4));
    int month = std::stoi(s.substr(5, 2));
    int day = std::stoi(s.substr(8, 2));
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    int last = kDays[month - 1] + (month == 2 && is_leap(year) ? 1 : 0);
    return day <= last;
}

Result<void> check_date_flag(const std::string& value, const char* flag) {
    if (value.empty() || is_calendar_date(value)) return Result<void>::ok();
    return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
        std::string("invalid ") + flag + " date \"" + value + "\" (expected YYYY-MM-DD)"));
}

// Keep timesheets dated within [from, to]. Undated timesheets are dropped.
Result<std::vector<Timesheet>> filter_by_date(std::vector<Timesheet> items,
                                              const std::string& from, const std::string& to) {
    using R = Result<std::vector<Timesheet>>;
    std::vector<Timesheet> kept;
    for (auto& t : items) {
        if (t.date.empty()) continue;
        if (!is_calendar_date(t.date)) {
            return R::err(Error(ErrorCode::GENERAL,
                "timesheet " + std::to_string(t.id) + " has invalid Date \"" + t.date + "\""));
        }
        // Valid YYYY-MM-DD strings order the same way as the dates.
        if (!from.empty() && t.date < from) continue;
        if (!to.empty() && t.date > to) continue;
        kept.push_back(std::move(t));
    }
    return R::ok(std::move(kept));
}

Result<void> cmd_timesheets_list(Session& session, const TimesheetFilter& filter) {
    auto page = validate_list_flags(filter.list);
    if (page.isErr()) return Result<void>::err(page.error());

    auto from_ok = check_date_flag(filter.from, "--from");
    if (from_ok.isErr()) return from_ok;
    auto to_ok = check_date_flag(filter.to, "--to");
    if (to_ok.isErr()) return to_ok;
    if (!filter.from.empty() && !filter.to.empty() && filter.from > filter.to) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "--from must be on or before --to"));
    }
    if (filter.employee < 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid --employee " + std::to_string(filter.employee) + ": must be > 0"));
    }

    auto items = fetch<std::vector<Timesheet>>(session, [&](ApiClient& c) {
        if (filter.employee > 0) {
            return query_timesheets(c, filter.employee, filter.from, filter.to, page.value());
        }
        return list_timesheets(c, page.value());
    });
    if (items.isErr()) return Result<void>::err(items.error());

    std::vector<Timesheet> timesheets = std::move(items.value());
    if (filter.employee == 0 && (!filter.from.empty() || !filter.to.empty())) {
        auto filtered = filter_by_date(std::move(timesheets), filter.from, filter.to);
        if (filtered.isErr()) return Result<void>::err(filtered.error());
        timesheets = std::move(filtered.value());
    }

    return render_list(session, filter.list, timesheets, {"ID", "DATE", "START", "END", "TOTAL", "STATUS"},
        [](const Timesheet& t) {
            bool done = t.end_time > 0;
            return std::vector<std::string>{
                std::to_string(t.id),
                t.date,
                clock_time(t.start_time),
                done ? clock_time(t.end_time) : "-",
                t.total_time_str,
                done ? "Complete" : "In Progress",
            };
        });
}

Result<void> cmd_timesheets_get(Session& session, const std::string& arg) {
    auto id = parse_id("timesheet", arg);
    if (id.isErr()) return Result<void>::err(id.error());

    auto timesheet = fetch<Timesheet>(session, [&](ApiClient& c) {
        return get_timesheet(c, id.value());
    });
    if (timesheet.isErr()) return Result<void>::err(timesheet.error());

    return render_one(session, timesheet.value(), [](const Timesheet& t) {
        Fields fields{
            {"ID", std::to_string(t.id)},
            {"Employee", std::to_string(t.employee)},
            {"Date", t.date},
            {"Start", clock_time(t.start_time)},
        };
        if (t.end_time > 0) {
            fields.push_back({"End", clock_time(t.end_time)});
        }
        fields.push_back({"Total", t.total_time_str});
        fields.push_back({"Mealbreak", t.mealbreak});
        fields.push_back({"In Progress", bool_text(t.is_in_progress)});
        return fields;
    });
}

} // namespace

void setup_timesheets(CLI::App* app, Session& session) {
    setup_group(app, session);

    auto filter = std::make_shared<TimesheetFilter>();
    auto* list_cmd = app->add_subcommand("list", "List timesheets");
    add_list_flags(list_cmd, filter->list);
    list_cmd->add_option("--from", filter->from, "Start date (YYYY-MM-DD)");
    list_cmd->add_option("--to", filter->to, "End date (YYYY-MM-DD)");
    list_cmd->add_option("--employee", filter->employee, "Filter by employee ID (uses resource query)");
    list_cmd->callback([&session, filter]() {
        session.run([&session, filter]() { return cmd_timesheets_list(session, *filter); });
    });

    auto id = std::make_shared<std::string>();
    auto* get_cmd = app->add_subcommand("get", "Get timesheet details");
    get_cmd->add_option("id", *id, "Timesheet ID")->required();
    get_cmd->callback([&session, id]() {
        session.run([&session, id]() { return cmd_timesheets_get(session, *id); });
    });
}

} // namespace deputy::cli::commands
