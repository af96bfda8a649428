/**
 * deputy CLI - command tree and top-level error reporting
 */

#include "cli.hpp"

#include <deputy/credentials.hpp>
#include <deputy/error_format.hpp>
#include <deputy/exit_codes.hpp>
#include <deputy/http_client.hpp>
#include <deputy/logging.hpp>
#include <deputy/version.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <ctime>

// Forward declarations for commands
namespace deputy::cli::commands {
    void setup_version(CLI::App* app, Session& session);
    void setup_me(CLI::App* app, Session& session);
    void setup_departments(CLI::App* app, Session& session);
    void setup_employees(CLI::App* app, Session& session);
    void setup_timesheets(CLI::App* app, Session& session);
    void setup_rosters(CLI::App* app, Session& session);
    void setup_leave(CLI::App* app, Session& session);
    void setup_locations(CLI::App* app, Session& session);
    void setup_pay(CLI::App* app, Session& session);
    void setup_management(CLI::App* app, Session& session);
    void setup_webhooks(CLI::App* app, Session& session);
    void setup_sales(CLI::App* app, Session& session);
    void setup_auth(CLI::App* app, Session& session);
}

namespace deputy::cli {

// ============================================================================
// Output Helpers
// ============================================================================

namespace {

std::tm local_tm(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    return local;
}

} // namespace

std::string clock_time(int64_t unix_seconds) {
    std::tm local = local_tm(unix_seconds);
    char buf[8];
    std::strftime(buf, sizeof(buf), "%H:%M", &local);
    return buf;
}

std::string local_date(int64_t unix_seconds) {
    std::tm local = local_tm(unix_seconds);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
    return buf;
}

std::string rfc3339(int64_t unix_seconds) {
    std::tm local = local_tm(unix_seconds);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &local);
    std::string offset = zone;
    if (offset == "+0000" || offset == "-0000" || offset.size() != 5) {
        return std::string(stamp) + "Z";
    }
    return std::string(stamp) + offset.substr(0, 3) + ":" + offset.substr(3);
}

std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

namespace {

// ============================================================================
// Command Suggestions
// ============================================================================

int levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    if (m == 0) return static_cast<int>(n);
    if (n == 0) return static_cast<int>(m);

    std::vector<std::vector<int>> dp(m + 1, std::vector<int>(n + 1));
    for (size_t i = 0; i <= m; ++i) dp[i][0] = static_cast<int>(i);
    for (size_t j = 0; j <= n; ++j) dp[0][j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            int cost = (s1[i-1] == s2[j-1]) ? 0 : 1;
            dp[i][j] = std::min({dp[i-1][j] + 1, dp[i][j-1] + 1, dp[i-1][j-1] + cost});
        }
    }
    return dp[m][n];
}

std::vector<std::string> find_similar_commands(const std::string& input,
                                               const std::vector<std::string>& valid_commands,
                                               int max_distance = 2) {
    std::vector<std::pair<int, std::string>> candidates;
    for (const auto& cmd : valid_commands) {
        int dist = levenshtein_distance(input, cmd);
        bool prefix = !input.empty() && cmd.compare(0, input.size(), input) == 0;
        if (dist <= max_distance || prefix) {
            candidates.push_back({dist, cmd});
        }
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<std::string> result;
    for (const auto& [dist, cmd] : candidates) {
        result.push_back(cmd);
        if (result.size() >= 3) break;
    }
    return result;
}

// The innermost subcommand that was selected before parsing stopped.
const CLI::App* deepest_selected(const CLI::App& app) {
    const CLI::App* current = &app;
    while (true) {
        auto selected = current->get_subcommands();
        if (selected.empty()) return current;
        current = selected.back();
    }
}

std::string command_path(const CLI::App* app) {
    std::string path;
    for (const CLI::App* a = app; a != nullptr; a = a->get_parent()) {
        path = path.empty() ? a->get_name() : a->get_name() + " " + path;
    }
    return path;
}

// Arguments listed in a CLI11 ExtrasError message.
std::vector<std::string> extra_arguments(const std::string& what) {
    std::vector<std::string> args;
    auto pos = what.find("expected: ");
    std::string list = pos == std::string::npos ? what : what.substr(pos + 10);
    size_t start = 0;
    while (start < list.size()) {
        size_t end = list.find(' ', start);
        if (end == std::string::npos) end = list.size();
        if (end > start) args.push_back(list.substr(start, end - start));
        start = end + 1;
    }
    return args;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

Error unknown_command(const CLI::App* app, const std::string& name) {
    std::string message = "unknown command \"" + name + "\" for \"" + command_path(app) + "\"";

    std::vector<std::string> valid_cmds;
    for (const auto* sub : app->get_subcommands({})) {
        valid_cmds.push_back(sub->get_name());
    }
    auto suggestions = find_similar_commands(name, valid_cmds);
    if (!suggestions.empty()) {
        message += "\n\nDid you mean?\n";
        for (size_t i = 0; i < suggestions.size(); ++i) {
            message += "  " + suggestions[i];
            if (i + 1 < suggestions.size()) message += "\n";
        }
    }
    return Error(ErrorCode::GENERAL, message);
}

} // namespace

// ============================================================================
// Parse Error Translation
// ============================================================================

Error translate_parse_error(const CLI::App& app, const CLI::ParseError& e) {
    std::string what = e.what();
    const CLI::App* target = deepest_selected(app);

    if (dynamic_cast<const CLI::ExtrasError*>(&e) != nullptr) {
        auto extras = extra_arguments(what);
        for (const auto& arg : extras) {
            if (arg.size() > 1 && arg[0] == '-') {
                return Error(ErrorCode::INVALID_FLAG, "unknown flag: " + arg);
            }
        }
        if (!extras.empty() && !target->get_subcommands({}).empty()) {
            return unknown_command(target, extras.front());
        }
        return Error(ErrorCode::INVALID_INPUT, "too many arguments: " + join(extras, " "));
    }

    if (dynamic_cast<const CLI::RequiredError*>(&e) != nullptr) {
        for (const auto* opt : target->get_options()) {
            if (!opt->get_required() || opt->count() > 0) continue;
            if (opt->get_positional()) {
                return Error(ErrorCode::INVALID_INPUT,
                    "missing required argument: <" + opt->get_name() + ">");
            }
            return Error(ErrorCode::INVALID_INPUT,
                "required flag \"" + opt->get_name() + "\" not set");
        }
        return Error(ErrorCode::INVALID_INPUT, "missing required argument: " + what);
    }

    if (dynamic_cast<const CLI::ConversionError*>(&e) != nullptr ||
        dynamic_cast<const CLI::ValidationError*>(&e) != nullptr ||
        dynamic_cast<const CLI::ArgumentMismatch*>(&e) != nullptr) {
        return Error(ErrorCode::INVALID_INPUT, "invalid argument: " + what);
    }

    return Error(ErrorCode::GENERAL, what);
}

// ============================================================================
// Client Factory
// ============================================================================

ClientFactory default_client_factory() {
    return [](const Environment& env, bool debug) -> Result<std::unique_ptr<ApiClient>> {
        using R = Result<std::unique_ptr<ApiClient>>;
        auto creds = credentials_from_env(env);
        if (creds.isErr()) {
            return R::err(creds.error());
        }
        spdlog::debug("using API base URL {}", creds.value().base_url());
        return R::ok(std::make_unique<HttpApiClient>(creds.value(), debug));
    };
}

// ============================================================================
// Cli
// ============================================================================

int Cli::report(const Session& session, const Error& error) {
    bool debug = session.opts.debug;
    if (session.json()) {
        err_ << format_error_json(error, debug) << "\n";
    } else {
        err_ << "Error: " << format_error(error, debug) << "\n";
    }
    err_.flush();

    ExitCode code = exit_code_from_error(error);
    spdlog::debug("exit {} ({})", to_int(code), exit_code_to_string(code));
    return to_int(code);
}

int Cli::execute(const std::vector<std::string>& args) {
    init_logging(false);

    Session session(out_, err_, env_, stdout_tty_, factory_);
    auto& opts = session.opts;

    CLI::App app{"deputy - command-line client for the Deputy workforce API"};
    app.name("deputy");
    app.require_subcommand(0, 1);
    app.set_version_flag("-V,--version", std::string("deputy version ") + version());
    app.footer("\nRun 'deputy <command> --help' for more information on a command.");
    // Global flags are accepted after the subcommand name too.
    app.fallthrough();

    auto* output_opt = app.add_option("-o,--output", opts.output,
        "Output format: text or json (default: json when stdout is not a terminal)");
    app.add_flag("--debug", opts.debug,
        "Show raw error messages and trace HTTP requests on stderr");
    app.add_option("-q,--query", opts.query,
        "jq expression applied to JSON output");
    app.add_flag("--raw", opts.raw,
        "Compact JSON Lines output, one value per line (implies -o json)");
    app.add_flag("--no-color", opts.no_color,
        "Disable colors in text output");

    // Resolve the output mode once, before any command body runs
    app.parse_complete_callback([&session, output_opt]() {
        auto& o = session.opts;
        init_logging(o.debug);

        FormatInputs inputs;
        inputs.output_flag = o.output;
        inputs.output_flag_set = output_opt->count() > 0;
        inputs.env_output = session.env.get("DEPUTY_OUTPUT");
        inputs.stdout_is_terminal = session.stdout_tty;
        inputs.raw = o.raw;

        auto resolved = resolve_output_format(inputs);
        if (resolved.isErr()) {
            session.fail(resolved.error());
            return;
        }

        Invocation inv;
        inv.render = resolved.value();
        if (!o.query.empty()) {
            inv.render.query = o.query;
        }
        inv.render.color = !o.no_color && session.stdout_tty;
        inv.debug = o.debug;
        session.invocation = inv;
    });

    commands::setup_version(app.add_subcommand("version", "Print version information"), session);
    commands::setup_me(app.add_subcommand("me", "Commands for the current user"), session);
    commands::setup_departments(app.add_subcommand("departments", "Manage departments"), session);
    commands::setup_employees(app.add_subcommand("employees", "Manage employees"), session);
    commands::setup_timesheets(app.add_subcommand("timesheets", "Manage timesheets"), session);
    commands::setup_rosters(app.add_subcommand("rosters", "Manage rosters/shifts"), session);
    commands::setup_leave(app.add_subcommand("leave", "Manage leave requests"), session);
    commands::setup_locations(app.add_subcommand("locations", "Manage locations"), session);
    commands::setup_pay(app.add_subcommand("pay", "Pay rates and agreements"), session);
    commands::setup_management(app.add_subcommand("management", "Memos and journals"), session);
    commands::setup_webhooks(app.add_subcommand("webhooks", "Manage webhooks"), session);
    commands::setup_sales(app.add_subcommand("sales", "Sales data"), session);
    commands::setup_auth(app.add_subcommand("auth", "Authentication"), session);

    // CLI11 consumes arguments from the back
    std::vector<std::string> argv(args.rbegin(), args.rend());
    try {
        app.parse(argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e, out_, err_);
    } catch (const CLI::CallForAllHelp& e) {
        return app.exit(e, out_, err_);
    } catch (const CLI::CallForVersion& e) {
        return app.exit(e, out_, err_);
    } catch (const CLI::ParseError& e) {
        return report(session, translate_parse_error(app, e));
    }

    if (session.error) {
        return report(session, *session.error);
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        out_ << app.help() << std::endl;
    }

    return 0;
}

} // namespace deputy::cli
