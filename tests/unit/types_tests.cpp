#include <doctest/doctest.h>
#include <deputy/types.hpp>

#include <limits>

using namespace deputy;
using json = nlohmann::json;

TEST_CASE("department decodes and re-encodes with PascalCase keys") {
    auto j = json::parse(R"({"Id": 3, "Company": 1, "CompanyName": "Kitchen",
                            "CompanyCode": "KIT", "Active": true, "Extra": "ignored"})");
    Department d = j.get<Department>();
    CHECK(d.id == 3);
    CHECK(d.company_name == "Kitchen");
    CHECK(d.active);

    json out = d;
    CHECK(out["Id"] == 3);
    CHECK(out["CompanyCode"] == "KIT");
    CHECK_FALSE(out.contains("ParentId"));
    CHECK_FALSE(out.contains("SortOrder"));
    CHECK_FALSE(out.contains("Extra"));
}

TEST_CASE("decoding is lenient about nulls and number types") {
    auto j = json::parse(R"({"Id": "7", "DisplayName": null, "Active": 1, "Company": 2.0})");
    Employee e = j.get<Employee>();
    CHECK(e.id == 0);
    CHECK(e.display_name.empty());
    CHECK(e.active);
    CHECK(e.company == 2);
}

TEST_CASE("timesheet keeps unix timestamps") {
    auto j = json::parse(R"({"Id": 9, "StartTime": 1700000000, "EndTime": 0,
                            "TotalTime": 7.5, "IsInProgress": true})");
    Timesheet t = j.get<Timesheet>();
    CHECK(t.start_time == 1700000000);
    CHECK(t.end_time == 0);
    CHECK(t.total_time == doctest::Approx(7.5));
    json out = t;
    CHECK(out["StartTime"] == 1700000000);
    CHECK_FALSE(out.contains("Comment"));
}

TEST_CASE("leave status text") {
    CHECK(leave_status_text(0) == "awaiting");
    CHECK(leave_status_text(1) == "approved");
    CHECK(leave_status_text(2) == "declined");
    CHECK(leave_status_text(3) == "cancelled");
    CHECK(leave_status_text(4) == "pay pending");
    CHECK(leave_status_text(5) == "pay approved");
    CHECK(leave_status_text(9) == "unknown(9)");
}

TEST_CASE("location address may be a string or a reference") {
    Location by_ref = json::parse(R"({"Id": 1, "Address": 42})").get<Location>();
    CHECK(by_ref.address_string() == "(ref:42)");

    Location by_text = json::parse(R"({"Id": 1, "Address": "1 Main St"})").get<Location>();
    CHECK(by_text.address_string() == "1 Main St");

    Location none = json::parse(R"({"Id": 1})").get<Location>();
    CHECK(none.address_string().empty());
    json out = none;
    CHECK(out["Address"].is_null());
}

TEST_CASE("me info keeps upstream field names") {
    MeInfo m = json::parse(R"({"UserId": 5, "EmployeeId": 6, "Login": "a@b.c",
                               "PrimaryEmail": "a@b.c", "Company": 1})").get<MeInfo>();
    json out = m;
    CHECK(out["UserId"] == 5);
    CHECK(out["EmployeeId"] == 6);
    CHECK(out["PrimaryEmail"] == "a@b.c");
    CHECK_FALSE(out.contains("Photo"));
}

TEST_CASE("out of range numbers clamp instead of wrapping") {
    Department huge = json::parse(R"({"Id": 1e30, "Company": -1e30, "ParentId": 18446744073709551615})")
                          .get<Department>();
    CHECK(huge.id == std::numeric_limits<int64_t>::max());
    CHECK(huge.company == std::numeric_limits<int64_t>::min());
    CHECK(huge.parent_id == std::numeric_limits<int64_t>::max());

    Employee wide = json::parse(R"({"Id": 1099511627776, "Company": 1099511627776.0})").get<Employee>();
    CHECK(wide.id == 1099511627776LL);
    CHECK(wide.company == 1099511627776LL);
    json out = wide;
    CHECK(out["Id"] == 1099511627776LL);

    Leave rounded = json::parse(R"({"Id": 2.6, "Status": 1.2})").get<Leave>();
    CHECK(rounded.id == 3);
    CHECK(rounded.status == 1);
}

TEST_CASE("out of range address references clamp") {
    Location far = json::parse(R"({"Id": 1, "Address": 1e30})").get<Location>();
    CHECK(far.address_string() == "(ref:9223372036854775807)");

    Location wide = json::parse(R"({"Id": 1, "Address": 1099511627776})").get<Location>();
    CHECK(wide.address_string() == "(ref:1099511627776)");
}

TEST_CASE("webhook address is its url") {
    Webhook w = json::parse(R"({"Id": 4, "Topic": "Timesheet.Insert",
                               "Address": "https://example.com/hook", "Enabled": true})").get<Webhook>();
    CHECK(w.url == "https://example.com/hook");
    CHECK(w.enabled);
    json out = w;
    CHECK(out["Address"] == "https://example.com/hook");
    CHECK_FALSE(out.contains("Type"));
}

TEST_CASE("agreement base rate is optional") {
    Agreement with_rate = json::parse(R"({"Id": 1, "Employee": 2, "Active": true,
                                          "BaseRate": 25.5, "Config": {"a": 1}})").get<Agreement>();
    REQUIRE(with_rate.base_rate.has_value());
    CHECK(*with_rate.base_rate == doctest::Approx(25.5));
    json out = with_rate;
    CHECK(out["Config"]["a"] == 1);

    Agreement without = json::parse(R"({"Id": 1, "Employee": 2})").get<Agreement>();
    CHECK_FALSE(without.base_rate.has_value());
    json bare = without;
    CHECK_FALSE(bare.contains("BaseRate"));
    CHECK_FALSE(bare.contains("Config"));
}
