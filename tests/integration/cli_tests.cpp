#include <doctest/doctest.h>
#include "cli.hpp"

#include <map>
#include <memory>
#include <sstream>

using namespace deputy;
using namespace deputy::cli;
using json = nlohmann::json;

namespace {

// ============================================================================
// Stub API
// ============================================================================

struct StubApi {
    std::map<std::string, Result<json>> responses;   // keyed by "METHOD path"
    std::vector<Request> requests;

    void reply(const std::string& key, json body) {
        responses.insert_or_assign(key, Result<json>::ok(std::move(body)));
    }

    void fail(const std::string& key, int status, const std::string& message = "nope") {
        ApiError api;
        api.status = status;
        api.message = message;
        api.retryable = is_retryable_status(status);
        responses.insert_or_assign(key, Result<json>::err(Error(api)));
    }
};

class StubClient : public ApiClient {
public:
    explicit StubClient(std::shared_ptr<StubApi> api) : api_(std::move(api)) {}

    Result<json> send(const Request& request) override {
        api_->requests.push_back(request);
        auto it = api_->responses.find(request.method + " " + request.path);
        if (it == api_->responses.end()) {
            ApiError api;
            api.status = 404;
            api.message = "no stub for " + request.path;
            return Result<json>::err(Error(api));
        }
        return it->second;
    }

private:
    std::shared_ptr<StubApi> api_;
};

struct Harness {
    std::shared_ptr<StubApi> api = std::make_shared<StubApi>();
    std::map<std::string, std::string> env;
    bool tty = false;
    std::string out;
    std::string err;

    int run(const std::vector<std::string>& args) {
        std::ostringstream out_stream;
        std::ostringstream err_stream;
        auto shared = api;
        ClientFactory factory = [shared](const Environment&, bool) {
            return Result<std::unique_ptr<ApiClient>>::ok(std::make_unique<StubClient>(shared));
        };
        Cli cli(factory, out_stream, err_stream, Environment(env), tty);
        int code = cli.execute(args);
        out = out_stream.str();
        err = err_stream.str();
        return code;
    }

    json out_json() const { return json::parse(out); }
    json err_json() const { return json::parse(err); }
};

json departments() {
    return json::parse(R"([
        {"Id": 1, "Company": 1, "CompanyName": "Kitchen", "CompanyCode": "KIT", "Active": true},
        {"Id": 2, "Company": 1, "CompanyName": "Bar", "CompanyCode": "BAR", "Active": false}
    ])");
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Help and Version
// ============================================================================

TEST_CASE("bare invocation prints help") {
    Harness h;
    CHECK(h.run({}) == 0);
    CHECK(contains(h.out, "departments"));
    CHECK(h.err.empty());
}

TEST_CASE("--help exits 0") {
    Harness h;
    CHECK(h.run({"--help"}) == 0);
    CHECK(contains(h.out, "--output"));

    Harness sub;
    CHECK(sub.run({"departments", "--help"}) == 0);
    CHECK(contains(sub.out, "list"));
}

TEST_CASE("command group without a subcommand prints its help") {
    Harness h;
    CHECK(h.run({"departments"}) == 0);
    CHECK(contains(h.out, "get"));
    CHECK(h.api->requests.empty());
}

TEST_CASE("--version prints the version") {
    Harness h;
    CHECK(h.run({"--version"}) == 0);
    CHECK(contains(h.out, "deputy version "));
}

TEST_CASE("version command in text and json") {
    Harness text;
    text.tty = true;
    CHECK(text.run({"version"}) == 0);
    CHECK(text.out.rfind("deputy version ", 0) == 0);
    CHECK(contains(text.out, "\n  commit: "));
    CHECK(contains(text.out, "\n  built:  "));

    Harness js;
    CHECK(js.run({"version"}) == 0);
    auto j = js.out_json();
    CHECK(j.contains("version"));
    CHECK(j.contains("commit"));
    CHECK(j.contains("built"));
}

// ============================================================================
// Output Modes
// ============================================================================

TEST_CASE("non-terminal stdout defaults to the json envelope") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"departments", "list"}) == 0);

    auto j = h.out_json();
    REQUIRE(j["items"].size() == 2);
    CHECK(j["items"][0]["CompanyName"] == "Kitchen");
    CHECK(j["meta"]["count"] == 2);
    CHECK_FALSE(j["meta"].contains("limit"));
}

TEST_CASE("terminal stdout renders a table") {
    Harness h;
    h.tty = true;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"departments", "list", "--no-color"}) == 0);
    CHECK(h.out ==
          "ID  NAME     CODE  COMPANY  ACTIVE\n"
          "1   Kitchen  KIT   1        Yes\n"
          "2   Bar      BAR   1        No\n");
}

TEST_CASE("DEPUTY_OUTPUT=text beats non-terminal detection") {
    Harness h;
    h.env["DEPUTY_OUTPUT"] = "text";
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"departments", "list"}) == 0);
    CHECK(h.out.rfind("ID  NAME", 0) == 0);
}

TEST_CASE("--output text beats non-terminal detection, global flags after the command") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"departments", "list", "-o", "text"}) == 0);
    CHECK(h.out.rfind("ID  NAME", 0) == 0);
}

TEST_CASE("--raw writes JSON Lines even with DEPUTY_OUTPUT=text") {
    Harness h;
    h.env["DEPUTY_OUTPUT"] = "text";
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"--raw", "departments", "list"}) == 0);

    std::istringstream lines(h.out);
    std::string first, second, extra;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));
    CHECK_FALSE(std::getline(lines, extra));
    CHECK(json::parse(first)["Id"] == 1);
    CHECK(json::parse(second)["Id"] == 2);
}

TEST_CASE("--query filters json output") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"-q", ".items[] | select(.Active) | .Id", "departments", "list"}) == 0);
    CHECK(h.out == "1\n");
}

TEST_CASE("single records render as an object or key/value lines") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit/1", departments()[0]);
    CHECK(h.run({"departments", "get", "1"}) == 0);
    CHECK(h.out_json()["CompanyCode"] == "KIT");

    Harness text;
    text.tty = true;
    text.api->reply("GET /resource/OperationalUnit/1", departments()[0]);
    CHECK(text.run({"departments", "get", "1"}) == 0);
    CHECK(contains(text.out, "ID:         1\n"));
    CHECK(contains(text.out, "Name:       Kitchen\n"));
    CHECK(contains(text.out, "Active:     true\n"));
}

TEST_CASE("me info keeps upstream field names") {
    Harness h;
    h.api->reply("GET /me", json{{"UserId", 5}, {"EmployeeId", 6}, {"Login", "a@b.c"}});
    CHECK(h.run({"me", "info"}) == 0);
    auto j = h.out_json();
    CHECK(j["UserId"] == 5);
    CHECK(j["EmployeeId"] == 6);
}

// ============================================================================
// Pagination
// ============================================================================

TEST_CASE("paged department lists use the QUERY endpoint and echo limit/offset") {
    Harness h;
    h.api->reply("POST /resource/OperationalUnit/QUERY", departments());
    CHECK(h.run({"departments", "list", "--limit", "5", "--offset", "2"}) == 0);

    REQUIRE(h.api->requests.size() == 1);
    const Request& req = h.api->requests[0];
    REQUIRE(req.body.has_value());
    CHECK((*req.body)["max"] == 5);
    CHECK((*req.body)["start"] == 2);

    auto j = h.out_json();
    CHECK(j["meta"]["limit"] == 5);
    CHECK(j["meta"]["offset"] == 2);
}

TEST_CASE("paging parameters are passed to list endpoints") {
    Harness h;
    h.api->reply("GET /resource/Leave", json::array());
    CHECK(h.run({"leave", "list", "--limit", "3"}) == 0);
    REQUIRE(h.api->requests.size() == 1);
    CHECK(h.api->requests[0].page.limit == 3);
    CHECK(h.api->requests[0].page.offset == 0);
}

TEST_CASE("me lists page on the client") {
    Harness h;
    json sheets = json::array();
    for (int i = 1; i <= 5; ++i) sheets.push_back(json{{"Id", i}});
    h.api->reply("GET /my/timesheets", sheets);

    CHECK(h.run({"me", "timesheets", "--offset", "1", "--limit", "2"}) == 0);
    REQUIRE(h.api->requests.size() == 1);
    CHECK(h.api->requests[0].page.empty());

    auto j = h.out_json();
    REQUIRE(j["items"].size() == 2);
    CHECK(j["items"][0]["Id"] == 2);
    CHECK(j["items"][1]["Id"] == 3);
}

TEST_CASE("negative paging values are input errors") {
    Harness h;
    CHECK(h.run({"departments", "list", "--limit=-1"}) == 2);
    CHECK(h.api->requests.empty());
}

// ============================================================================
// Fail-empty
// ============================================================================

TEST_CASE("--fail-empty exits 4 in json mode and prints nothing on stdout") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", json::array());
    CHECK(h.run({"-o", "json", "departments", "list", "--fail-empty"}) == 4);
    CHECK(h.out.empty());
    CHECK(h.err_json()["error"]["code"] == "NOT_FOUND");
}

TEST_CASE("--fail-empty is ignored in text mode") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", json::array());
    CHECK(h.run({"-o", "text", "departments", "list", "--fail-empty"}) == 0);
    CHECK(h.out == "ID  NAME  CODE  COMPANY  ACTIVE\n");
}

TEST_CASE("empty lists without --fail-empty succeed") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", json::array());
    CHECK(h.run({"departments", "list"}) == 0);
    CHECK(h.out_json()["items"].empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("upstream statuses map to exit codes") {
    struct Case { int status; int exit; const char* code; };
    for (const Case& c : {Case{401, 3, "AUTH_REQUIRED"}, Case{403, 3, "AUTH_FORBIDDEN"},
                          Case{404, 4, "NOT_FOUND"}, Case{422, 2, "VALIDATION_FAILED"},
                          Case{429, 5, "RATE_LIMITED"}, Case{500, 6, "SERVER_ERROR"}}) {
        Harness h;
        h.api->fail("GET /supervise/employee/7", c.status);
        CHECK(h.run({"employees", "get", "7"}) == c.exit);
        CHECK(h.out.empty());
        auto j = h.err_json();
        CHECK(j["error"]["code"] == c.code);
        CHECK(j["error"]["status"] == c.status);
    }
}

TEST_CASE("text mode errors carry a hint") {
    Harness h;
    h.tty = true;
    h.api->fail("GET /supervise/employee/7", 404, "Employee not found");
    CHECK(h.run({"employees", "get", "7"}) == 4);
    CHECK(h.err.rfind("Error: API error 404: Employee not found\nHint: ", 0) == 0);
}

TEST_CASE("--debug prints the raw message") {
    Harness h;
    h.tty = true;
    h.api->fail("GET /supervise/employee/7", 404, "Employee not found");
    CHECK(h.run({"--debug", "employees", "get", "7"}) == 4);
    CHECK(h.err == "Error: API error 404: Employee not found\n");
}

TEST_CASE("unknown flags are input errors") {
    Harness h;
    h.tty = true;
    CHECK(h.run({"departments", "list", "--bogus"}) == 2);
    CHECK(h.err.rfind("Error: unknown flag: --bogus", 0) == 0);
    CHECK(h.api->requests.empty());
}

TEST_CASE("unknown commands suggest close matches") {
    Harness h;
    CHECK(h.run({"departmnts"}) == 1);
    CHECK(contains(h.err, "unknown command \"departmnts\" for \"deputy\""));
    CHECK(contains(h.err, "departments"));
}

TEST_CASE("argument errors") {
    Harness invalid;
    CHECK(invalid.run({"departments", "get", "abc"}) == 2);
    CHECK(contains(invalid.err, "invalid department ID: abc"));

    Harness zero;
    CHECK(zero.run({"rosters", "get", "0"}) == 2);
    CHECK(contains(zero.err, "invalid roster ID: 0"));

    Harness missing;
    CHECK(missing.run({"departments", "get"}) == 2);
    CHECK(contains(missing.err, "missing required argument"));

    Harness extra;
    CHECK(extra.run({"departments", "get", "1", "2"}) == 2);
    CHECK(contains(extra.err, "too many arguments"));
}

TEST_CASE("invalid output settings are input errors reported as text") {
    Harness flag;
    CHECK(flag.run({"-o", "xml", "version"}) == 2);
    CHECK(flag.err.rfind("Error: invalid --output", 0) == 0);
    CHECK(flag.out.empty());

    Harness env;
    env.env["DEPUTY_OUTPUT"] = "yaml";
    CHECK(env.run({"version"}) == 2);
    CHECK(contains(env.err, "DEPUTY_OUTPUT"));
}

TEST_CASE("invalid query is an input error and writes nothing") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"-q", ".items[", "departments", "list"}) == 2);
    CHECK(h.out.empty());
    CHECK(contains(h.err_json()["error"]["message"].get<std::string>(), "invalid jq query"));
}

TEST_CASE("missing credentials fail before any request") {
    std::ostringstream out;
    std::ostringstream err;
    Cli cli(default_client_factory(), out, err, Environment(), false);
    CHECK(cli.execute({"departments", "list"}) == 1);
    CHECK(out.str().empty());
    CHECK(contains(err.str(), "not authenticated"));
}

// ============================================================================
// Locations
// ============================================================================

TEST_CASE("locations fall back to /resource/Company") {
    Harness h;
    h.api->fail("GET /supervise/location/simplified", 404);
    h.api->reply("GET /resource/Company", json::parse(R"([{"Id": 1, "CompanyName": "HQ", "Address": 12}])"));
    CHECK(h.run({"locations", "list"}) == 0);
    REQUIRE(h.api->requests.size() == 2);
    CHECK(h.out_json()["items"][0]["CompanyName"] == "HQ");
}

TEST_CASE("failed location fallback keeps the first error") {
    Harness h;
    h.api->fail("GET /supervise/location/simplified", 403, "forbidden");
    h.api->fail("GET /resource/Company", 500, "boom");
    CHECK(h.run({"--debug", "locations", "list"}) == 3);
    auto message = h.err_json()["error"]["message"].get<std::string>();
    CHECK(message.rfind("locations list failed: API error 403: forbidden", 0) == 0);
    CHECK(contains(message, "fallback to /resource/Company failed: API error 500: boom"));
}

TEST_CASE("server errors on the simplified endpoint do not fall back") {
    Harness h;
    h.api->fail("GET /supervise/location/simplified", 502);
    CHECK(h.run({"locations", "list"}) == 6);
    CHECK(h.api->requests.size() == 1);
}

TEST_CASE("location address reference is shown in text mode") {
    Harness h;
    h.tty = true;
    h.api->reply("GET /resource/Company/1", json::parse(R"({"Id": 1, "CompanyName": "HQ", "Address": 12})"));
    CHECK(h.run({"locations", "get", "1"}) == 0);
    CHECK(contains(h.out, "Address:  (ref:12)\n"));
}

TEST_CASE("query arithmetic overflow is not fatal") {
    Harness h;
    h.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(h.run({"--query=-9223372036854775808 % -1", "departments", "list"}) == 0);
    CHECK_FALSE(h.out.empty());

    Harness slice;
    slice.api->reply("GET /resource/OperationalUnit", departments());
    CHECK(slice.run({"-q", ".items[1e30:]", "departments", "list"}) == 0);
    CHECK(slice.out == "[]\n");
}

// ============================================================================
// Filters
// ============================================================================

TEST_CASE("timesheets for an employee use the QUERY endpoint with date bounds") {
    Harness h;
    h.api->reply("POST /resource/Timesheet/QUERY", json::parse(R"([{"Id": 1, "Employee": 7, "Date": "2024-01-02"}])"));
    CHECK(h.run({"timesheets", "list", "--employee", "7", "--from", "2024-01-01", "--to", "2024-01-31",
                 "--limit", "10"}) == 0);

    REQUIRE(h.api->requests.size() == 1);
    const json& body = *h.api->requests[0].body;
    CHECK(body["search"]["f1"] == json{{"field", "Employee"}, {"type", "eq"}, {"data", 7}});
    CHECK(body["search"]["f2"] == json{{"field", "Date"}, {"type", "ge"}, {"data", "2024-01-01"}});
    CHECK(body["search"]["f3"] == json{{"field", "Date"}, {"type", "le"}, {"data", "2024-01-31"}});
    CHECK(body["max"] == 10);
    CHECK(h.out_json()["items"][0]["Employee"] == 7);
}

TEST_CASE("timesheet date filters apply client-side without --employee") {
    Harness h;
    h.api->reply("GET /my/timesheets", json::parse(R"([
        {"Id": 1, "Date": "2023-12-31"},
        {"Id": 2, "Date": "2024-01-01"},
        {"Id": 3, "Date": ""},
        {"Id": 4, "Date": "2024-01-31"},
        {"Id": 5, "Date": "2024-02-01"}
    ])"));
    CHECK(h.run({"timesheets", "list", "--from", "2024-01-01", "--to", "2024-01-31"}) == 0);
    auto items = h.out_json()["items"];
    REQUIRE(items.size() == 2);
    CHECK(items[0]["Id"] == 2);
    CHECK(items[1]["Id"] == 4);
}

TEST_CASE("timesheet date flags are validated") {
    Harness bad;
    CHECK(bad.run({"timesheets", "list", "--from", "2024-02-30"}) == 2);
    CHECK(contains(bad.err, "invalid --from date \\\"2024-02-30\\\" (expected YYYY-MM-DD)"));
    CHECK(bad.api->requests.empty());

    Harness reversed;
    CHECK(reversed.run({"timesheets", "list", "--from", "2024-02-01", "--to", "2024-01-01"}) == 2);
    CHECK(contains(reversed.err, "--from must be on or before --to"));

    Harness leap;
    leap.api->reply("GET /my/timesheets", json::array());
    CHECK(leap.run({"timesheets", "list", "--to", "2024-02-29"}) == 0);

    Harness undated;
    undated.api->reply("GET /my/timesheets", json::parse(R"([{"Id": 8, "Date": "15/01/2024"}])"));
    CHECK(undated.run({"timesheets", "list", "--from", "2024-01-01"}) == 1);
    CHECK(contains(undated.err, "timesheet 8 has invalid Date"));
}

TEST_CASE("leave for an employee uses the QUERY endpoint") {
    Harness h;
    h.api->reply("POST /resource/Leave/QUERY", json::parse(R"([{"Id": 3, "Employee": 5, "Status": 1}])"));
    CHECK(h.run({"leave", "list", "--employee", "5", "--limit", "2"}) == 0);
    REQUIRE(h.api->requests.size() == 1);
    const json& body = *h.api->requests[0].body;
    CHECK(body["search"] == json{{"Employee", 5}});
    CHECK(body["max"] == 2);
    CHECK(h.out_json()["items"][0]["Id"] == 3);
}

// ============================================================================
// Pay
// ============================================================================

TEST_CASE("award library lists page on the client") {
    auto awards = json::parse(R"([
        {"AwardCode": "GA", "Name": "General Award", "CountryCode": "AU"},
        {"Code": "HR", "AwardName": "Retail", "Country": "NZ"},
        {"Id": 9, "Description": "Other"}
    ])");

    Harness h;
    h.api->reply("GET /payroll/listAwardsLibrary", awards);
    CHECK(h.run({"pay", "awards", "list", "--offset", "1", "--limit", "1"}) == 0);
    auto j = h.out_json();
    REQUIRE(j["items"].size() == 1);
    CHECK(j["items"][0]["Code"] == "HR");
    CHECK(h.api->requests[0].page.limit == 0);

    Harness text;
    text.tty = true;
    text.api->reply("GET /payroll/listAwardsLibrary", awards);
    CHECK(text.run({"pay", "awards", "list"}) == 0);
    CHECK(contains(text.out, "CODE"));
    CHECK(contains(text.out, "General Award"));
    CHECK(contains(text.out, "Retail"));
    CHECK(contains(text.out, "Other"));
}

TEST_CASE("award get escapes the code and prints sorted keys") {
    Harness h;
    h.tty = true;
    h.api->reply("GET /payroll/listAwardsLibrary/GA%202020", json{{"Name", "General"}, {"AwardCode", "GA 2020"}});
    CHECK(h.run({"pay", "awards", "get", "GA 2020"}) == 0);
    CHECK(h.out == "AwardCode: GA 2020\nName: General\n");
}

TEST_CASE("agreement lists require --employee and search by it") {
    Harness missing;
    CHECK(missing.run({"pay", "agreements", "list"}) == 2);
    CHECK(contains(missing.err, "--employee is required"));
    CHECK(missing.api->requests.empty());

    Harness h;
    h.tty = true;
    h.api->reply("POST /resource/EmployeeAgreement/QUERY", json::parse(R"([
        {"Id": 1, "Employee": 3, "Active": true, "BaseRate": 25.5},
        {"Id": 2, "Employee": 3, "Active": true}
    ])"));
    CHECK(h.run({"pay", "agreements", "list", "--employee", "3", "--active-only"}) == 0);
    const json& body = *h.api->requests[0].body;
    CHECK(body["search"]["s1"] == json{{"field", "EmployeeId"}, {"type", "eq"}, {"data", 3}});
    CHECK(body["search"]["s2"] == json{{"field", "Active"}, {"type", "eq"}, {"data", true}});
    CHECK(contains(h.out, "BASE RATE"));
    CHECK(contains(h.out, "25.50"));
}

TEST_CASE("agreement get shows the base rate and config") {
    Harness h;
    h.tty = true;
    h.api->reply("GET /resource/EmployeeAgreement/4",
                 json::parse(R"({"Id": 4, "Employee": 3, "Active": false, "BaseRate": 30, "Config": {"a": 1}})"));
    CHECK(h.run({"pay", "agreements", "get", "4"}) == 0);
    CHECK(contains(h.out, "Base Rate: 30.00\n"));
    CHECK(contains(h.out, "Config:    {\"a\":1}\n"));
    CHECK(contains(h.out, "Active:    false\n"));
}

// ============================================================================
// Management, Webhooks, Sales
// ============================================================================

TEST_CASE("memo lists need a company and truncate content in text mode") {
    Harness missing;
    CHECK(missing.run({"management", "memo", "list"}) == 2);
    CHECK(contains(missing.err, "--company is required"));

    std::string long_text(60, 'x');
    Harness h;
    h.tty = true;
    h.api->reply("GET /supervise/memo?company=2", json::array({json{{"Id", 1}, {"Content", long_text}}}));
    CHECK(h.run({"management", "memo", "list", "--company", "2"}) == 0);
    CHECK(contains(h.out, std::string(50, 'x') + "..."));
    CHECK_FALSE(contains(h.out, std::string(51, 'x')));

    Harness j;
    j.api->reply("GET /supervise/memo?company=2", json::array({json{{"Id", 1}, {"Content", long_text}}}));
    CHECK(j.run({"management", "memo", "list", "--company", "2"}) == 0);
    CHECK(j.out_json()["items"][0]["Content"] == long_text);
}

TEST_CASE("journal lists need an employee") {
    Harness missing;
    CHECK(missing.run({"management", "journal", "list"}) == 2);
    CHECK(contains(missing.err, "--employee is required"));

    Harness h;
    h.api->reply("GET /supervise/journal?employee=9", json::parse(R"([
        {"Id": 1, "Employee": 9, "Comment": "late"},
        {"Id": 2, "Employee": 9, "Comment": "early"}
    ])"));
    CHECK(h.run({"management", "journal", "list", "--employee", "9", "--limit", "1"}) == 0);
    auto items = h.out_json()["items"];
    REQUIRE(items.size() == 1);
    CHECK(items[0]["Comment"] == "late");
}

TEST_CASE("webhooks list and get") {
    auto hook = json::parse(R"({"Id": 6, "Topic": "Timesheet.Insert", "Address": "https://example.com/h",
                                "Type": "URL", "Enabled": true})");
    Harness list;
    list.api->reply("GET /resource/Webhook", json::array({hook}));
    CHECK(list.run({"webhooks", "list", "--limit", "5"}) == 0);
    CHECK(list.api->requests[0].page.limit == 5);
    CHECK(list.out_json()["items"][0]["Address"] == "https://example.com/h");

    Harness get;
    get.tty = true;
    get.api->reply("GET /resource/Webhook/6", hook);
    CHECK(get.run({"webhooks", "get", "6"}) == 0);
    CHECK(contains(get.out, "URL:     https://example.com/h\n"));
    CHECK(contains(get.out, "Enabled: true\n"));

    Harness bad;
    CHECK(bad.run({"webhooks", "get", "x"}) == 2);
    CHECK(contains(bad.err, "invalid webhook ID: x"));
}

TEST_CASE("sales lists filter by company and page on the client") {
    auto rows = json::parse(R"([
        {"Id": 1, "Company": 3, "Timestamp": 1700000000, "Value": 10.5},
        {"Id": 2, "Company": 3, "Timestamp": 1700003600, "Value": 12}
    ])");

    Harness all;
    all.api->reply("GET /resource/SalesData", rows);
    CHECK(all.run({"sales", "list", "--offset", "1"}) == 0);
    auto items = all.out_json()["items"];
    REQUIRE(items.size() == 1);
    CHECK(items[0]["Id"] == 2);

    Harness one;
    one.tty = true;
    one.api->reply("GET /resource/SalesData?company=3", rows);
    CHECK(one.run({"sales", "list", "--company", "3"}) == 0);
    CHECK(contains(one.out, "10.50"));
    CHECK(contains(one.out, "TIMESTAMP"));
}

// ============================================================================
// Auth
// ============================================================================

TEST_CASE("auth status masks the token") {
    Harness h;
    h.env = {{"DEPUTY_TOKEN", "abcd1234wxyz"}, {"DEPUTY_INSTALL", "acme"}, {"DEPUTY_GEO", "au"}};
    CHECK(h.run({"auth", "status"}) == 0);
    auto j = h.out_json();
    CHECK(j["token_masked"] == "abcd...wxyz");
    CHECK(j["region"] == "AU");
    CHECK(j["base_url"] == "https://acme.au.deputy.com/api/v1");
    CHECK(h.api->requests.empty());

    Harness short_token;
    short_token.tty = true;
    short_token.env = {{"DEPUTY_TOKEN", "abc"}, {"DEPUTY_INSTALL", "acme"}};
    CHECK(short_token.run({"auth", "status"}) == 0);
    CHECK(contains(short_token.out, "Token:    ****\n"));
    CHECK(contains(short_token.out, "Install:  acme\n"));
}

TEST_CASE("auth status without a token is not an error") {
    Harness h;
    CHECK(h.run({"auth", "status"}) == 0);
    CHECK(contains(h.out, "Not authenticated"));
    CHECK(h.err.empty());

    Harness partial;
    partial.env = {{"DEPUTY_TOKEN", "abcd1234wxyz"}};
    CHECK(partial.run({"auth", "status"}) == 1);
    CHECK(contains(partial.err, "DEPUTY_INSTALL"));
}

TEST_CASE("auth test calls /me") {
    Harness h;
    h.tty = true;
    h.api->reply("GET /me", json{{"Name", "Ann"}, {"PrimaryEmail", "ann@example.com"}, {"EmployeeId", 6}});
    CHECK(h.run({"auth", "test"}) == 0);
    CHECK(h.out == "Authentication successful!\nUser: Ann (ann@example.com)\nID:   6\n");

    Harness denied;
    denied.api->fail("GET /me", 401, "bad token");
    CHECK(denied.run({"--debug", "auth", "test"}) == 3);
    CHECK(denied.err_json()["error"]["message"].get<std::string>().rfind("authentication failed: ", 0) == 0);
}
