#include "deputy/resources.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace deputy {

using json = nlohmann::json;

namespace {

const char* type_name(const json& j) {
    return j.type_name();
}

template<typename T>
Result<T> decode_one(Result<json> response, const char* resource) {
    if (response.isErr()) {
        return Result<T>::err(response.error());
    }
    const json& body = response.value();
    if (!body.is_object()) {
        return Result<T>::err(Error(ErrorCode::GENERAL,
            std::string("failed to decode ") + resource + ": expected object, got " + type_name(body)));
    }
    T value{};
    from_json(body, value);
    return Result<T>::ok(std::move(value));
}

template<typename T>
Result<std::vector<T>> decode_list(Result<json> response, const char* resource) {
    using R = Result<std::vector<T>>;
    if (response.isErr()) {
        return R::err(response.error());
    }
    const json& body = response.value();
    std::vector<T> items;
    if (body.is_null()) {
        return R::ok(std::move(items));
    }
    if (!body.is_array()) {
        return R::err(Error(ErrorCode::GENERAL,
            std::string("failed to decode ") + resource + ": expected array, got " + type_name(body)));
    }
    items.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (!body[i].is_object()) {
            return R::err(Error(ErrorCode::GENERAL,
                std::string("failed to decode ") + resource + ": element " + std::to_string(i) +
                " is " + type_name(body[i])));
        }
        T value{};
        from_json(body[i], value);
        items.push_back(std::move(value));
    }
    return R::ok(std::move(items));
}

Request get(std::string path, const ListOptions& page = {}) {
    Request req;
    req.method = "GET";
    req.path = std::move(path);
    req.page = page;
    return req;
}

Request get_by_id(const std::string& base, int64_t id) {
    return get(base + "/" + std::to_string(id));
}

// POST /resource/<Name>/QUERY with max/start in the body, plus any
// search terms the caller already put there.
Request query(const std::string& resource, const ListOptions& page, json body = json::object()) {
    Request req;
    req.method = "POST";
    req.path = "/resource/" + resource + "/QUERY";
    if (page.limit > 0) body["max"] = page.limit;
    if (page.offset > 0) body["start"] = page.offset;
    req.body = std::move(body);
    return req;
}

json search_term(const char* field, const char* type, json data) {
    return json{{"field", field}, {"type", type}, {"data", std::move(data)}};
}

// Percent-encode a single path segment.
std::string escape_segment(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Current User
// ============================================================================

Result<MeInfo> get_me(ApiClient& client) {
    return decode_one<MeInfo>(client.send(get("/me")), "MeInfo");
}

Result<std::vector<Timesheet>> list_my_timesheets(ApiClient& client) {
    return decode_list<Timesheet>(client.send(get("/my/timesheets")), "Timesheet");
}

Result<std::vector<Roster>> list_my_rosters(ApiClient& client) {
    return decode_list<Roster>(client.send(get("/my/rosters")), "Roster");
}

Result<std::vector<Leave>> list_my_leave(ApiClient& client) {
    return decode_list<Leave>(client.send(get("/my/leave")), "Leave");
}

// ============================================================================
// Departments
// ============================================================================

Result<std::vector<Department>> list_departments(ApiClient& client, const ListOptions& page) {
    if (!page.empty()) {
        return decode_list<Department>(client.send(query("OperationalUnit", page)), "Department");
    }
    return decode_list<Department>(client.send(get("/resource/OperationalUnit")), "Department");
}

Result<Department> get_department(ApiClient& client, int64_t id) {
    return decode_one<Department>(client.send(get_by_id("/resource/OperationalUnit", id)), "Department");
}

// ============================================================================
// Employees
// ============================================================================

Result<std::vector<Employee>> list_employees(ApiClient& client, const ListOptions& page) {
    if (!page.empty()) {
        return decode_list<Employee>(client.send(query("Employee", page)), "Employee");
    }
    return decode_list<Employee>(client.send(get("/supervise/employee")), "Employee");
}

Result<Employee> get_employee(ApiClient& client, int64_t id) {
    return decode_one<Employee>(client.send(get_by_id("/supervise/employee", id)), "Employee");
}

// ============================================================================
// Timesheets, Rosters, Leave
// ============================================================================

Result<std::vector<Timesheet>> list_timesheets(ApiClient& client, const ListOptions& page) {
    return decode_list<Timesheet>(client.send(get("/my/timesheets", page)), "Timesheet");
}

Result<Timesheet> get_timesheet(ApiClient& client, int64_t id) {
    return decode_one<Timesheet>(client.send(get_by_id("/supervise/timesheet", id)), "Timesheet");
}

Result<std::vector<Roster>> list_rosters(ApiClient& client, const ListOptions& page) {
    return decode_list<Roster>(client.send(get("/supervise/roster", page)), "Roster");
}

Result<Roster> get_roster(ApiClient& client, int64_t id) {
    return decode_one<Roster>(client.send(get_by_id("/resource/Roster", id)), "Roster");
}

Result<std::vector<Leave>> list_leave(ApiClient& client, const ListOptions& page) {
    return decode_list<Leave>(client.send(get("/resource/Leave", page)), "Leave");
}

Result<Leave> get_leave(ApiClient& client, int64_t id) {
    return decode_one<Leave>(client.send(get_by_id("/resource/Leave", id)), "Leave");
}

// ============================================================================
// Locations
// ============================================================================

Result<std::vector<Location>> list_locations(ApiClient& client, const ListOptions& page) {
    auto primary = client.send(get("/supervise/location/simplified", page));
    if (primary.isOk()) {
        return decode_list<Location>(std::move(primary), "Location");
    }

    const ApiError* api = primary.error().apiError();
    if (!api || (api->status != 404 && api->status != 403)) {
        return Result<std::vector<Location>>::err(primary.error());
    }

    spdlog::debug("locations list: falling back to /resource/Company after HTTP {}", api->status);

    auto fallback = client.send(get("/resource/Company", page));
    if (fallback.isOk()) {
        return decode_list<Location>(std::move(fallback), "Location");
    }

    Error err = primary.error();
    err.withContext("locations list failed")
       .withDetail("fallback to /resource/Company failed: " + fallback.error().message());
    return Result<std::vector<Location>>::err(std::move(err));
}

Result<Location> get_location(ApiClient& client, int64_t id) {
    return decode_one<Location>(client.send(get_by_id("/resource/Company", id)), "Location");
}

// ============================================================================
// Filtered Queries
// ============================================================================

Result<std::vector<Timesheet>> query_timesheets(ApiClient& client, int64_t employee,
                                                const std::string& from, const std::string& to,
                                                const ListOptions& page) {
    json search = json::object();
    search["f1"] = search_term("Employee", "eq", employee);
    if (!from.empty()) search["f2"] = search_term("Date", "ge", from);
    if (!to.empty()) search["f3"] = search_term("Date", "le", to);
    return decode_list<Timesheet>(client.send(query("Timesheet", page, json{{"search", search}})), "Timesheet");
}

Result<std::vector<Leave>> query_leave(ApiClient& client, int64_t employee, const ListOptions& page) {
    json body{{"search", {{"Employee", employee}}}};
    return decode_list<Leave>(client.send(query("Leave", page, std::move(body))), "Leave");
}

// ============================================================================
// Pay
// ============================================================================

Result<std::vector<json>> list_awards(ApiClient& client) {
    using R = Result<std::vector<json>>;
    auto response = client.send(get("/payroll/listAwardsLibrary"));
    if (response.isErr()) {
        return R::err(response.error());
    }
    const json& body = response.value();
    std::vector<json> awards;
    if (body.is_null()) {
        return R::ok(std::move(awards));
    }
    if (!body.is_array()) {
        return R::err(Error(ErrorCode::GENERAL,
            std::string("failed to decode Award: expected array, got ") + type_name(body)));
    }
    for (const auto& award : body) {
        awards.push_back(award);
    }
    return R::ok(std::move(awards));
}

Result<json> get_award(ApiClient& client, const std::string& code) {
    auto response = client.send(get("/payroll/listAwardsLibrary/" + escape_segment(code)));
    if (response.isErr()) {
        return response;
    }
    if (!response.value().is_object()) {
        return Result<json>::err(Error(ErrorCode::GENERAL,
            std::string("failed to decode Award: expected object, got ") + type_name(response.value())));
    }
    return response;
}

Result<std::vector<Agreement>> list_agreements(ApiClient& client, int64_t employee, bool active_only) {
    json search = json::object();
    search["s1"] = search_term("EmployeeId", "eq", employee);
    if (active_only) search["s2"] = search_term("Active", "eq", true);
    return decode_list<Agreement>(
        client.send(query("EmployeeAgreement", ListOptions{}, json{{"search", search}})), "Agreement");
}

Result<Agreement> get_agreement(ApiClient& client, int64_t id) {
    return decode_one<Agreement>(client.send(get_by_id("/resource/EmployeeAgreement", id)), "Agreement");
}

// ============================================================================
// Management
// ============================================================================

Result<std::vector<Memo>> list_memos(ApiClient& client, int64_t company) {
    return decode_list<Memo>(client.send(get("/supervise/memo?company=" + std::to_string(company))), "Memo");
}

Result<std::vector<Journal>> list_journals(ApiClient& client, int64_t employee) {
    return decode_list<Journal>(
        client.send(get("/supervise/journal?employee=" + std::to_string(employee))), "Journal");
}

// ============================================================================
// Webhooks and Sales
// ============================================================================

Result<std::vector<Webhook>> list_webhooks(ApiClient& client, const ListOptions& page) {
    return decode_list<Webhook>(client.send(get("/resource/Webhook", page)), "Webhook");
}

Result<Webhook> get_webhook(ApiClient& client, int64_t id) {
    return decode_one<Webhook>(client.send(get_by_id("/resource/Webhook", id)), "Webhook");
}

Result<std::vector<SalesData>> list_sales(ApiClient& client, int64_t company) {
    std::string path = "/resource/SalesData";
    if (company > 0) path += "?company=" + std::to_string(company);
    return decode_list<SalesData>(client.send(get(path)), "SalesData");
}

} // namespace deputy
