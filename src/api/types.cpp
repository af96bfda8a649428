#include "deputy/types.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace deputy {

using json = nlohmann::json;

namespace {

// Lenient field readers. The API sometimes sends null, or a number where a
// string is expected, depending on the endpoint.

std::string get_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    return "";
}

// Any JSON number as int64_t, clamped to the representable range.
int64_t to_int64(const json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::numeric_limits<int64_t>::max();
        }
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return 0;
        // 2^63 is exact as a double; everything below it rounds into range.
        if (d >= 9223372036854775808.0) return std::numeric_limits<int64_t>::max();
        if (d <= -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(std::llround(d));
    }
    return 0;
}

int64_t get_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return 0;
    if (it->is_number()) return to_int64(*it);
    if (it->is_boolean()) return it->get<bool>() ? 1 : 0;
    return 0;
}

double get_double(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

bool get_bool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return false;
}

json get_raw(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return json(nullptr);
    return *it;
}

void put_if(json& j, const char* key, int64_t v) {
    if (v != 0) j[key] = v;
}

void put_if(json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

void put_if(json& j, const char* key, const json& v) {
    if (!v.is_null()) j[key] = v;
}

} // namespace

std::string leave_status_text(int64_t status) {
    switch (status) {
        case 0: return "awaiting";
        case 1: return "approved";
        case 2: return "declined";
        case 3: return "cancelled";
        case 4: return "pay pending";
        case 5: return "pay approved";
        default: return "unknown(" + std::to_string(status) + ")";
    }
}

std::string Location::address_string() const {
    if (address.is_null()) return "";
    if (address.is_string()) return address.get<std::string>();
    if (address.is_number()) {
        return "(ref:" + std::to_string(to_int64(address)) + ")";
    }
    return address.dump();
}

// ============================================================================
// Department
// ============================================================================

void to_json(json& j, const Department& v) {
    j = json{
        {"Id", v.id},
        {"Company", v.company},
        {"CompanyName", v.company_name},
        {"CompanyCode", v.company_code},
        {"Active", v.active},
    };
    put_if(j, "ParentId", v.parent_id);
    put_if(j, "SortOrder", v.sort_order);
}

void from_json(const json& j, Department& v) {
    v.id = get_int(j, "Id");
    v.company = get_int(j, "Company");
    v.parent_id = get_int(j, "ParentId");
    v.company_name = get_string(j, "CompanyName");
    v.company_code = get_string(j, "CompanyCode");
    v.active = get_bool(j, "Active");
    v.sort_order = get_int(j, "SortOrder");
}

// ============================================================================
// Employee
// ============================================================================

void to_json(json& j, const Employee& v) {
    j = json{
        {"Id", v.id},
        {"FirstName", v.first_name},
        {"LastName", v.last_name},
        {"DisplayName", v.display_name},
        {"Email", v.email},
        {"Mobile", v.mobile},
        {"Active", v.active},
        {"Company", v.company},
        {"Role", v.role},
    };
    put_if(j, "MainAddress", v.main_address);
    put_if(j, "Photo", v.photo);
    put_if(j, "StartDate", v.start_date);
    put_if(j, "TerminationDate", v.termination_date);
}

void from_json(const json& j, Employee& v) {
    v.id = get_int(j, "Id");
    v.first_name = get_string(j, "FirstName");
    v.last_name = get_string(j, "LastName");
    v.display_name = get_string(j, "DisplayName");
    v.email = get_string(j, "Email");
    v.mobile = get_string(j, "Mobile");
    v.active = get_bool(j, "Active");
    v.company = get_int(j, "Company");
    v.role = get_int(j, "Role");
    v.main_address = get_int(j, "MainAddress");
    v.photo = get_raw(j, "Photo");
    v.start_date = get_string(j, "StartDate");
    v.termination_date = get_string(j, "TerminationDate");
}

// ============================================================================
// Timesheet
// ============================================================================

void to_json(json& j, const Timesheet& v) {
    j = json{
        {"Id", v.id},
        {"Employee", v.employee},
        {"Date", v.date},
        {"StartTime", v.start_time},
        {"EndTime", v.end_time},
        {"Mealbreak", v.mealbreak},
        {"TotalTime", v.total_time},
        {"TotalTimeStr", v.total_time_str},
        {"OperationalUnit", v.operational_unit},
        {"IsInProgress", v.is_in_progress},
        {"IsLeave", v.is_leave},
        {"Cost", v.cost},
    };
    put_if(j, "Comment", v.comment);
}

void from_json(const json& j, Timesheet& v) {
    v.id = get_int(j, "Id");
    v.employee = get_int(j, "Employee");
    v.date = get_string(j, "Date");
    v.start_time = get_int(j, "StartTime");
    v.end_time = get_int(j, "EndTime");
    v.mealbreak = get_string(j, "Mealbreak");
    v.total_time = get_double(j, "TotalTime");
    v.total_time_str = get_string(j, "TotalTimeStr");
    v.operational_unit = get_int(j, "OperationalUnit");
    v.is_in_progress = get_bool(j, "IsInProgress");
    v.is_leave = get_bool(j, "IsLeave");
    v.comment = get_string(j, "Comment");
    v.cost = get_double(j, "Cost");
}

// ============================================================================
// Roster
// ============================================================================

void to_json(json& j, const Roster& v) {
    j = json{
        {"Id", v.id},
        {"Date", v.date},
        {"StartTime", v.start_time},
        {"EndTime", v.end_time},
        {"Mealbreak", v.mealbreak},
        {"Employee", v.employee},
        {"OperationalUnit", v.operational_unit},
        {"Open", v.open},
        {"Published", v.published},
    };
    put_if(j, "Comment", v.comment);
}

void from_json(const json& j, Roster& v) {
    v.id = get_int(j, "Id");
    v.date = get_string(j, "Date");
    v.start_time = get_int(j, "StartTime");
    v.end_time = get_int(j, "EndTime");
    v.mealbreak = get_string(j, "Mealbreak");
    v.employee = get_int(j, "Employee");
    v.operational_unit = get_int(j, "OperationalUnit");
    v.open = get_bool(j, "Open");
    v.published = get_bool(j, "Published");
    v.comment = get_string(j, "Comment");
}

// ============================================================================
// Leave
// ============================================================================

void to_json(json& j, const Leave& v) {
    j = json{
        {"Id", v.id},
        {"Employee", v.employee},
        {"Company", v.company},
        {"DateStart", v.date_start},
        {"DateEnd", v.date_end},
        {"Status", v.status},
        {"Hours", v.hours},
        {"Days", v.days},
    };
    put_if(j, "ApproveBy", v.approve_by);
    put_if(j, "PayApprover", v.pay_approver);
    put_if(j, "Comment", v.comment);
    put_if(j, "LeaveRule", v.leave_rule);
}

void from_json(const json& j, Leave& v) {
    v.id = get_int(j, "Id");
    v.employee = get_int(j, "Employee");
    v.company = get_int(j, "Company");
    v.date_start = get_string(j, "DateStart");
    v.date_end = get_string(j, "DateEnd");
    v.status = get_int(j, "Status");
    v.hours = get_double(j, "Hours");
    v.days = get_double(j, "Days");
    v.approve_by = get_int(j, "ApproveBy");
    v.pay_approver = get_int(j, "PayApprover");
    v.comment = get_string(j, "Comment");
    v.leave_rule = get_int(j, "LeaveRule");
}

// ============================================================================
// Location
// ============================================================================

void to_json(json& j, const Location& v) {
    j = json{
        {"Id", v.id},
        {"CompanyName", v.company_name},
        {"Code", v.code},
        {"Address", v.address},
        {"Active", v.active},
        {"Timezone", v.timezone},
    };
    put_if(j, "CompanyCode", v.company_code);
}

void from_json(const json& j, Location& v) {
    v.id = get_int(j, "Id");
    v.company_name = get_string(j, "CompanyName");
    v.code = get_string(j, "Code");
    v.company_code = get_string(j, "CompanyCode");
    v.address = get_raw(j, "Address");
    v.active = get_bool(j, "Active");
    v.timezone = get_string(j, "Timezone");
}

// ============================================================================
// MeInfo
// ============================================================================

void to_json(json& j, const MeInfo& v) {
    j = json{
        {"UserId", v.user_id},
        {"EmployeeId", v.employee_id},
        {"Login", v.login},
        {"Name", v.name},
        {"FirstName", v.first_name},
        {"LastName", v.last_name},
        {"PrimaryEmail", v.primary_email},
        {"PrimaryPhone", v.primary_phone},
        {"Company", v.company},
        {"Portfolio", v.portfolio},
        {"Role", v.role},
    };
    put_if(j, "Photo", v.photo);
}

void from_json(const json& j, MeInfo& v) {
    v.user_id = get_int(j, "UserId");
    v.employee_id = get_int(j, "EmployeeId");
    v.login = get_string(j, "Login");
    v.name = get_string(j, "Name");
    v.first_name = get_string(j, "FirstName");
    v.last_name = get_string(j, "LastName");
    v.primary_email = get_string(j, "PrimaryEmail");
    v.primary_phone = get_string(j, "PrimaryPhone");
    v.photo = get_raw(j, "Photo");
    v.company = get_int(j, "Company");
    v.portfolio = get_string(j, "Portfolio");
    v.role = get_int(j, "Role");
}

// ============================================================================
// Webhook
// ============================================================================

void to_json(json& j, const Webhook& v) {
    j = json{
        {"Id", v.id},
        {"Topic", v.topic},
        {"Address", v.url},
        {"Enabled", v.enabled},
    };
    put_if(j, "Type", v.type);
    put_if(j, "Created", v.created);
    put_if(j, "Modified", v.modified);
}

void from_json(const json& j, Webhook& v) {
    v.id = get_int(j, "Id");
    v.topic = get_string(j, "Topic");
    v.url = get_string(j, "Address");
    v.type = get_string(j, "Type");
    v.enabled = get_bool(j, "Enabled");
    v.created = get_string(j, "Created");
    v.modified = get_string(j, "Modified");
}

// ============================================================================
// SalesData
// ============================================================================

void to_json(json& j, const SalesData& v) {
    j = json{
        {"Id", v.id},
        {"Company", v.company},
        {"Timestamp", v.timestamp},
        {"Value", v.value},
    };
    put_if(j, "Area", v.area);
    put_if(j, "Type", v.type);
}

void from_json(const json& j, SalesData& v) {
    v.id = get_int(j, "Id");
    v.company = get_int(j, "Company");
    v.area = get_int(j, "Area");
    v.timestamp = get_int(j, "Timestamp");
    v.value = get_double(j, "Value");
    v.type = get_string(j, "Type");
}

// ============================================================================
// Memo and Journal
// ============================================================================

void to_json(json& j, const Memo& v) {
    j = json{
        {"Id", v.id},
        {"Content", v.content},
        {"Company", v.company},
        {"Creator", v.creator},
        {"Created", v.created},
    };
    put_if(j, "ShowFrom", v.show_from);
    put_if(j, "ShowUntil", v.show_until);
}

void from_json(const json& j, Memo& v) {
    v.id = get_int(j, "Id");
    v.content = get_string(j, "Content");
    v.company = get_int(j, "Company");
    v.creator = get_int(j, "Creator");
    v.created = get_int(j, "Created");
    v.show_from = get_int(j, "ShowFrom");
    v.show_until = get_int(j, "ShowUntil");
}

void to_json(json& j, const Journal& v) {
    j = json{
        {"Id", v.id},
        {"Employee", v.employee},
        {"Company", v.company},
        {"Comment", v.comment},
        {"Created", v.created},
    };
    put_if(j, "Category", v.category);
}

void from_json(const json& j, Journal& v) {
    v.id = get_int(j, "Id");
    v.employee = get_int(j, "Employee");
    v.company = get_int(j, "Company");
    v.comment = get_string(j, "Comment");
    v.created = get_int(j, "Created");
    v.category = get_int(j, "Category");
}

// ============================================================================
// Agreement
// ============================================================================

void to_json(json& j, const Agreement& v) {
    j = json{
        {"Id", v.id},
        {"Employee", v.employee},
        {"Active", v.active},
    };
    if (v.base_rate) j["BaseRate"] = *v.base_rate;
    put_if(j, "Config", v.config);
    put_if(j, "Contract", v.contract);
    put_if(j, "PayPoint", v.pay_point);
}

void from_json(const json& j, Agreement& v) {
    v.id = get_int(j, "Id");
    v.employee = get_int(j, "Employee");
    v.active = get_bool(j, "Active");
    auto rate = j.find("BaseRate");
    if (rate != j.end() && rate->is_number()) {
        v.base_rate = rate->get<double>();
    } else {
        v.base_rate.reset();
    }
    v.config = get_raw(j, "Config");
    v.contract = get_int(j, "Contract");
    v.pay_point = get_int(j, "PayPoint");
}

} // namespace deputy
