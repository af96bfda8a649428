#pragma once

/**
 * @file resources.hpp
 * @brief Typed, read-only access to Deputy API resources
 *
 * Each accessor issues one request through an ApiClient and decodes the
 * response into domain records. A response of the wrong shape fails with
 * "failed to decode <Resource>: ...".
 */

#include "deputy/api_client.hpp"
#include "deputy/types.hpp"

#include <string>
#include <vector>

namespace deputy {

// ============================================================================
// Current User
// ============================================================================

Result<MeInfo> get_me(ApiClient& client);
Result<std::vector<Timesheet>> list_my_timesheets(ApiClient& client);
Result<std::vector<Roster>> list_my_rosters(ApiClient& client);
Result<std::vector<Leave>> list_my_leave(ApiClient& client);

// ============================================================================
// Resources
// ============================================================================

// A plain GET ignores paging, so paged requests go through the QUERY endpoint.
Result<std::vector<Department>> list_departments(ApiClient& client, const ListOptions& page);
Result<Department> get_department(ApiClient& client, int64_t id);

Result<std::vector<Employee>> list_employees(ApiClient& client, const ListOptions& page);
Result<Employee> get_employee(ApiClient& client, int64_t id);

Result<std::vector<Timesheet>> list_timesheets(ApiClient& client, const ListOptions& page);
Result<Timesheet> get_timesheet(ApiClient& client, int64_t id);

Result<std::vector<Roster>> list_rosters(ApiClient& client, const ListOptions& page);
Result<Roster> get_roster(ApiClient& client, int64_t id);

Result<std::vector<Leave>> list_leave(ApiClient& client, const ListOptions& page);
Result<Leave> get_leave(ApiClient& client, int64_t id);

// Falls back to /resource/Company when the simplified endpoint answers 404
// or 403.
Result<std::vector<Location>> list_locations(ApiClient& client, const ListOptions& page);
Result<Location> get_location(ApiClient& client, int64_t id);

// ============================================================================
// Filtered Queries
// ============================================================================

// Timesheets for one employee, optionally bounded by YYYY-MM-DD dates
// (inclusive; empty means unbounded).
Result<std::vector<Timesheet>> query_timesheets(ApiClient& client, int64_t employee,
                                                const std::string& from, const std::string& to,
                                                const ListOptions& page);

Result<std::vector<Leave>> query_leave(ApiClient& client, int64_t employee, const ListOptions& page);

// ============================================================================
// Pay
// ============================================================================

// Award library entries are free-form objects, returned as-is.
Result<std::vector<nlohmann::json>> list_awards(ApiClient& client);
Result<nlohmann::json> get_award(ApiClient& client, const std::string& code);

Result<std::vector<Agreement>> list_agreements(ApiClient& client, int64_t employee, bool active_only);
Result<Agreement> get_agreement(ApiClient& client, int64_t id);

// ============================================================================
// Management, Webhooks, Sales
// ============================================================================

Result<std::vector<Memo>> list_memos(ApiClient& client, int64_t company);
Result<std::vector<Journal>> list_journals(ApiClient& client, int64_t employee);

Result<std::vector<Webhook>> list_webhooks(ApiClient& client, const ListOptions& page);
Result<Webhook> get_webhook(ApiClient& client, int64_t id);

// company 0 lists sales data for every location.
Result<std::vector<SalesData>> list_sales(ApiClient& client, int64_t company);

} // namespace deputy
