#include <doctest/doctest.h>
#include <deputy/credentials.hpp>
#include <deputy/environment.hpp>

#include <cstdio>
#include <fstream>

using namespace deputy;

// ============================================================================
// .env Parsing
// ============================================================================

TEST_CASE("parse_dotenv handles comments, export and quotes") {
    auto kv = parse_dotenv(
        "# comment\n"
        "\n"
        "DEPUTY_TOKEN=abc123\n"
        "export DEPUTY_INSTALL=acme\n"
        "DEPUTY_GEO=\"au\"\n"
        "SINGLE='it''s raw \\n'\n"
        "ESCAPED=\"line1\\nline2\"\n"
        "TRAILING=value # note\n"
        "  SPACED  =  padded  \n"
        "NOEQUALS\n"
        "=novalue\n");

    REQUIRE(kv.size() == 7);
    CHECK(kv[0] == std::make_pair(std::string("DEPUTY_TOKEN"), std::string("abc123")));
    CHECK(kv[1].first == "DEPUTY_INSTALL");
    CHECK(kv[1].second == "acme");
    CHECK(kv[2].second == "au");
    CHECK(kv[3].first == "SINGLE");
    CHECK(kv[4].second == "line1\nline2");
    CHECK(kv[5].second == "value");
    CHECK(kv[6].first == "SPACED");
    CHECK(kv[6].second == "padded");
}

TEST_CASE("quoted values keep '#'") {
    auto kv = parse_dotenv("A=\"x # y\"\n");
    REQUIRE(kv.size() == 1);
    CHECK(kv[0].second == "x # y");
}

// ============================================================================
// Environment
// ============================================================================

TEST_CASE("process variables win over .env values") {
    const std::string path = "deputy_config_tests.env";
    {
        std::ofstream f(path);
        f << "DEPUTY_TOKEN=from-file\nDEPUTY_INSTALL=file-install\n";
    }

    Environment env({{"DEPUTY_TOKEN", "from-env"}});
    CHECK(env.load_dotenv_file(path));
    CHECK(env.get("DEPUTY_TOKEN") == "from-env");
    CHECK(env.get("DEPUTY_INSTALL") == "file-install");

    std::remove(path.c_str());
}

TEST_CASE("the first .env file loaded wins") {
    const std::string first = "deputy_config_first.env";
    const std::string second = "deputy_config_second.env";
    {
        std::ofstream f1(first);
        f1 << "KEY=one\n";
        std::ofstream f2(second);
        f2 << "KEY=two\nOTHER=two\n";
    }

    Environment env;
    CHECK(env.load_dotenv_file(first));
    CHECK(env.load_dotenv_file(second));
    CHECK(env.get("KEY") == "one");
    CHECK(env.get("OTHER") == "two");

    std::remove(first.c_str());
    std::remove(second.c_str());
}

TEST_CASE("missing .env files are skipped") {
    Environment env;
    CHECK_FALSE(env.load_dotenv_file("definitely/not/here.env"));
    CHECK_FALSE(env.lookup("ANYTHING").has_value());
}

TEST_CASE("DEPUTY_ENV_FILE replaces the default search") {
    const std::string path = "deputy_config_explicit.env";
    {
        std::ofstream f(path);
        f << "DEPUTY_GEO=uk\n";
    }

    Environment env({{"DEPUTY_ENV_FILE", path}});
    env.load_dotenv();
    CHECK(env.get("DEPUTY_GEO") == "uk");

    std::remove(path.c_str());
}

TEST_CASE("set and lookup") {
    Environment env;
    CHECK(env.get("X").empty());
    env.set("X", "1");
    REQUIRE(env.lookup("X").has_value());
    CHECK(*env.lookup("X") == "1");
}

// ============================================================================
// Credentials
// ============================================================================

TEST_CASE("missing token is an authentication error") {
    auto r = credentials_from_env(Environment({{"DEPUTY_INSTALL", "acme"}}));
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("not authenticated") != std::string::npos);
}

TEST_CASE("token without install or base URL names both") {
    auto r = credentials_from_env(Environment({{"DEPUTY_TOKEN", "t"}}));
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("DEPUTY_BASE_URL") != std::string::npos);
    CHECK(r.error().message().find("DEPUTY_INSTALL") != std::string::npos);
}

TEST_CASE("install and geo build the base URL") {
    auto r = credentials_from_env(Environment({
        {"DEPUTY_TOKEN", " t0k "},
        {"DEPUTY_INSTALL", "Acme"},
        {"DEPUTY_GEO", "AU"},
    }));
    REQUIRE(r.isOk());
    CHECK(r.value().token == "t0k");
    CHECK(r.value().base_url() == "https://acme.au.deputy.com/api/v1");
    CHECK(r.value().authorization_header() == "Bearer t0k");

    auto no_geo = credentials_from_env(Environment({{"DEPUTY_TOKEN", "t"}, {"DEPUTY_INSTALL", "acme"}}));
    REQUIRE(no_geo.isOk());
    CHECK(no_geo.value().base_url() == "https://acme.deputy.com/api/v1");
}

TEST_CASE("base URL override and auth scheme") {
    auto r = credentials_from_env(Environment({
        {"DEPUTY_TOKEN", "t"},
        {"DEPUTY_BASE_URL", "acme.example.com/"},
        {"DEPUTY_AUTH_SCHEME", "OAuth"},
    }));
    REQUIRE(r.isOk());
    CHECK(r.value().base_url() == "https://acme.example.com/api/v1");
    CHECK(r.value().authorization_header() == "OAuth t");
}

TEST_CASE("normalize_base_url") {
    CHECK(normalize_base_url("https://x.deputy.com") == "https://x.deputy.com/api/v1");
    CHECK(normalize_base_url("http://localhost:8080/api/v2") == "http://localhost:8080/api/v1");
    CHECK(normalize_base_url("x.deputy.com/api/v1/") == "https://x.deputy.com/api/v1");
    CHECK(normalize_base_url("").empty());
}
