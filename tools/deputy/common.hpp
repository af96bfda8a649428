/**
 * deputy CLI - Common utilities and types
 */

#pragma once

#include <deputy/api_client.hpp>
#include <deputy/environment.hpp>
#include <deputy/errors.hpp>
#include <deputy/output.hpp>
#include <deputy/renderer.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace deputy::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string output = "text";   // -o, --output
    bool debug = false;            // --debug
    std::string query;             // -q, --query
    bool raw = false;              // --raw
    bool no_color = false;         // --no-color
};

/**
 * Everything resolved once, before any command body runs.
 */
struct Invocation {
    RenderOptions render;
    bool debug = false;
};

/**
 * Flags shared by every list command.
 */
struct ListFlags {
    int limit = 0;
    int offset = 0;
    bool fail_empty = false;
};

// Builds the API client for one invocation. Injected so tests can supply a
// stub.
using ClientFactory =
    std::function<Result<std::unique_ptr<ApiClient>>(const Environment& env, bool debug)>;

/**
 * Per-invocation state shared by the command callbacks.
 *
 * Commands never print errors or pick exit codes. They record the first
 * error with fail() and the top level reports it.
 */
struct Session {
    Session(std::ostream& out, std::ostream& err, const Environment& env,
            bool stdout_tty, ClientFactory factory)
        : out(out), err(err), env(env), stdout_tty(stdout_tty),
          client_factory(std::move(factory)) {}

    std::ostream& out;
    std::ostream& err;
    const Environment& env;
    bool stdout_tty;
    ClientFactory client_factory;

    GlobalOptions opts;
    std::optional<Invocation> invocation;
    std::optional<Error> error;

    void fail(Error e) {
        if (!error) error = std::move(e);
    }

    bool ok() const { return !error; }

    bool json() const { return invocation && invocation->render.json(); }

    // Run a command body unless an earlier step already failed.
    void run(const std::function<Result<void>()>& body) {
        if (!ok()) return;
        auto result = body();
        if (result.isErr()) fail(result.error());
    }

    Result<std::unique_ptr<ApiClient>> client() const {
        return client_factory(env, invocation ? invocation->debug : opts.debug);
    }

    // Renderer for a single value.
    Renderer renderer() const {
        return Renderer(out, invocation ? invocation->render : RenderOptions{});
    }

    // Renderer for a list, carrying the command's paging and fail-empty flags.
    Renderer renderer(const ListFlags& flags) const {
        RenderOptions o = invocation ? invocation->render : RenderOptions{};
        if (flags.limit > 0) o.limit = flags.limit;
        if (flags.offset > 0) o.offset = flags.offset;
        o.fail_on_empty = flags.fail_empty;
        return Renderer(out, o);
    }
};

// ============================================================================
// Flag Helpers
// ============================================================================

inline void add_list_flags(CLI::App* cmd, ListFlags& flags) {
    cmd->add_option("--limit", flags.limit, "Maximum number of results (0 = unlimited)");
    cmd->add_option("--offset", flags.offset, "Number of results to skip");
    cmd->add_flag("--fail-empty", flags.fail_empty, "Exit 4 when results are empty (JSON mode)");
}

/**
 * Make `cmd` a command group: at most one subcommand, help when none is given.
 */
inline void setup_group(CLI::App* cmd, Session& session) {
    cmd->require_subcommand(0, 1);
    cmd->callback([cmd, &session]() {
        if (!cmd->get_subcommands().empty()) return;
        session.run([cmd, &session]() {
            session.out << cmd->help() << std::endl;
            return Result<void>::ok();
        });
    });
}

inline Result<ListOptions> validate_list_flags(const ListFlags& flags) {
    if (flags.limit < 0) {
        return Result<ListOptions>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid --limit " + std::to_string(flags.limit) + ": must be >= 0"));
    }
    if (flags.offset < 0) {
        return Result<ListOptions>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid --offset " + std::to_string(flags.offset) + ": must be >= 0"));
    }
    ListOptions page;
    page.limit = flags.limit;
    page.offset = flags.offset;
    return Result<ListOptions>::ok(page);
}

/**
 * Parse a positive integer resource ID.
 */
inline Result<int64_t> parse_id(const std::string& resource, const std::string& arg) {
    auto invalid = [&]() {
        return Result<int64_t>::err(Error(ErrorCode::INVALID_INPUT, "invalid " + resource + " ID: " + arg));
    };
    // 18 digits always fit in int64_t.
    if (arg.empty() || arg.size() > 18) return invalid();
    int64_t value = 0;
    for (char c : arg) {
        if (c < '0' || c > '9') return invalid();
        value = value * 10 + (c - '0');
    }
    if (value <= 0) return invalid();
    return Result<int64_t>::ok(value);
}

// ============================================================================
// Output Helpers
// ============================================================================

using Fields = std::vector<std::pair<std::string, std::string>>;

/**
 * Print "Key: Value" lines with the values aligned.
 */
inline void print_key_values(std::ostream& out, const Fields& fields) {
    size_t width = 0;
    for (const auto& f : fields) width = std::max(width, display_width(f.first));
    for (const auto& f : fields) {
        out << f.first << ":" << std::string(width - display_width(f.first) + 1, ' ') << f.second << "\n";
    }
}

inline std::string yes_no(bool v) { return v ? "Yes" : "No"; }

inline std::string bool_text(bool v) { return v ? "true" : "false"; }

// HH:MM in local time for a unix timestamp.
std::string clock_time(int64_t unix_seconds);

// YYYY-MM-DD in local time for a unix timestamp.
std::string local_date(int64_t unix_seconds);

// RFC 3339 in local time, e.g. 2024-01-15T09:30:00+11:00 (Z for UTC).
std::string rfc3339(int64_t unix_seconds);

// Fixed-point number with the given number of decimals.
std::string fixed(double v, int decimals);

// At most `max_bytes` bytes of `s` plus "..." when cut, never splitting a
// UTF-8 sequence.
inline std::string truncate_text(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}

// Build the API client and run one request with it.
template<typename T, typename Fetch>
Result<T> fetch(const Session& s, Fetch f) {
    auto client = s.client();
    if (client.isErr()) {
        return Result<T>::err(client.error());
    }
    return f(*client.value());
}

/**
 * Render a single record: the JSON object in JSON mode, key/value lines in
 * text mode.
 */
template<typename T, typename FieldsFn>
Result<void> render_one(Session& s, const T& value, FieldsFn fields) {
    Renderer r = s.renderer();
    if (r.options().json()) {
        nlohmann::json j = value;
        return r.output(j);
    }
    print_key_values(s.out, fields(value));
    return Result<void>::ok();
}

/**
 * Render a list: envelope or JSON Lines in JSON mode, a table in text mode.
 */
template<typename T, typename RowFn>
Result<void> render_list(Session& s, const ListFlags& flags, const std::vector<T>& items,
                         const std::vector<std::string>& headers, RowFn row) {
    Renderer r = s.renderer(flags);
    if (r.options().json()) {
        nlohmann::json j = items;
        return r.output_list(j);
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        rows.push_back(row(item));
    }
    r.table(headers, rows);
    return Result<void>::ok();
}

} // namespace deputy::cli
