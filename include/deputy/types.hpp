#pragma once

/**
 * @file types.hpp
 * @brief Deputy domain records
 *
 * Records are decoded from the API's JSON and serialized back with the same
 * PascalCase keys, so `-o json` output matches what the API returned for the
 * fields deputy knows about. Decoding is lenient: missing, null or
 * mistyped fields keep their defaults. Fields the API omits when empty are
 * omitted on output as well.
 *
 * Integer fields are 64-bit. Numbers outside that range are clamped to
 * INT64_MIN/INT64_MAX, fractions are rounded, and NaN or infinity decode
 * as 0.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace deputy {

struct Department {
    int64_t id = 0;
    int64_t company = 0;
    int64_t parent_id = 0;
    std::string company_name;
    std::string company_code;
    bool active = false;
    int64_t sort_order = 0;
};

struct Employee {
    int64_t id = 0;
    std::string first_name;
    std::string last_name;
    std::string display_name;
    std::string email;
    std::string mobile;
    bool active = false;
    int64_t company = 0;
    int64_t role = 0;
    int64_t main_address = 0;
    nlohmann::json photo;             // null when absent
    std::string start_date;
    std::string termination_date;
};

struct Timesheet {
    int64_t id = 0;
    int64_t employee = 0;
    std::string date;
    int64_t start_time = 0;           // unix seconds
    int64_t end_time = 0;
    std::string mealbreak;
    double total_time = 0.0;          // hours
    std::string total_time_str;
    int64_t operational_unit = 0;
    bool is_in_progress = false;
    bool is_leave = false;
    std::string comment;
    double cost = 0.0;
};

struct Roster {
    int64_t id = 0;
    std::string date;
    int64_t start_time = 0;
    int64_t end_time = 0;
    std::string mealbreak;
    int64_t employee = 0;
    int64_t operational_unit = 0;
    bool open = false;
    bool published = false;
    std::string comment;
};

struct Leave {
    int64_t id = 0;
    int64_t employee = 0;
    int64_t company = 0;
    std::string date_start;
    std::string date_end;
    int64_t status = 0;
    double hours = 0.0;
    double days = 0.0;
    int64_t approve_by = 0;
    int64_t pay_approver = 0;
    std::string comment;
    int64_t leave_rule = 0;
};

struct Location {
    int64_t id = 0;
    std::string company_name;
    std::string code;
    std::string company_code;
    nlohmann::json address;           // string, or an integer address reference
    bool active = false;
    std::string timezone;

    // The address for display: the string itself, "(ref:N)" for a
    // reference, empty when absent.
    std::string address_string() const;
};

struct MeInfo {
    int64_t user_id = 0;
    int64_t employee_id = 0;
    std::string login;
    std::string name;
    std::string first_name;
    std::string last_name;
    std::string primary_email;
    std::string primary_phone;
    nlohmann::json photo;
    int64_t company = 0;
    std::string portfolio;
    int64_t role = 0;
};

struct Webhook {
    int64_t id = 0;
    std::string topic;
    std::string url;                  // "Address" on the wire
    std::string type;
    bool enabled = false;
    std::string created;
    std::string modified;
};

struct SalesData {
    int64_t id = 0;
    int64_t company = 0;
    int64_t area = 0;
    int64_t timestamp = 0;            // unix seconds
    double value = 0.0;
    std::string type;
};

struct Memo {
    int64_t id = 0;
    std::string content;
    int64_t company = 0;
    int64_t creator = 0;
    int64_t created = 0;              // unix seconds
    int64_t show_from = 0;
    int64_t show_until = 0;
};

struct Journal {
    int64_t id = 0;
    int64_t employee = 0;
    int64_t company = 0;
    std::string comment;
    int64_t created = 0;
    int64_t category = 0;
};

struct Agreement {
    int64_t id = 0;
    int64_t employee = 0;
    bool active = false;
    std::optional<double> base_rate;
    nlohmann::json config;            // null when absent
    int64_t contract = 0;
    int64_t pay_point = 0;
};

// Leave status codes: 0 awaiting, 1 approved, 2 declined, 3 cancelled,
// 4 pay pending, 5 pay approved. Anything else is "unknown(N)".
std::string leave_status_text(int64_t status);

// ============================================================================
// JSON Serialization
// ============================================================================

void to_json(nlohmann::json& j, const Department& v);
void from_json(const nlohmann::json& j, Department& v);

void to_json(nlohmann::json& j, const Employee& v);
void from_json(const nlohmann::json& j, Employee& v);

void to_json(nlohmann::json& j, const Timesheet& v);
void from_json(const nlohmann::json& j, Timesheet& v);

void to_json(nlohmann::json& j, const Roster& v);
void from_json(const nlohmann::json& j, Roster& v);

void to_json(nlohmann::json& j, const Leave& v);
void from_json(const nlohmann::json& j, Leave& v);

void to_json(nlohmann::json& j, const Location& v);
void from_json(const nlohmann::json& j, Location& v);

void to_json(nlohmann::json& j, const MeInfo& v);
void from_json(const nlohmann::json& j, MeInfo& v);

void to_json(nlohmann::json& j, const Webhook& v);
void from_json(const nlohmann::json& j, Webhook& v);

void to_json(nlohmann::json& j, const SalesData& v);
void from_json(const nlohmann::json& j, SalesData& v);

void to_json(nlohmann::json& j, const Memo& v);
void from_json(const nlohmann::json& j, Memo& v);

void to_json(nlohmann::json& j, const Journal& v);
void from_json(const nlohmann::json& j, Journal& v);

void to_json(nlohmann::json& j, const Agreement& v);
void from_json(const nlohmann::json& j, Agreement& v);

} // namespace deputy
