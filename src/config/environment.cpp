#include "deputy/environment.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <direct.h>
#include <stdlib.h>
#define getcwd _getcwd
#else
#include <unistd.h>
extern char** environ;
#endif

namespace deputy {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string unescape_double_quoted(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char next = s[i + 1];
            switch (next) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case 'r': out += '\r'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                default: break;
            }
        }
        out += s[i];
    }
    return out;
}

std::string parse_value(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) return value;

    char quote = value[0];
    if (quote == '"' || quote == '\'') {
        auto close = value.find_last_of(quote);
        if (close != 0) {
            std::string inner = value.substr(1, close - 1);
            return quote == '"' ? unescape_double_quoted(inner) : inner;
        }
    }

    auto comment = value.find(" #");
    if (comment != std::string::npos) {
        value = trim(value.substr(0, comment));
    }
    return value;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

std::vector<std::pair<std::string, std::string>> parse_dotenv(const std::string& content) {
    std::vector<std::pair<std::string, std::string>> out;
    std::istringstream in(content);
    std::string line;

    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        if (t.compare(0, 7, "export ") == 0) {
            t = trim(t.substr(7));
        }

        auto eq = t.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(t.substr(0, eq));
        if (key.empty()) continue;

        out.emplace_back(key, parse_value(t.substr(eq + 1)));
    }

    return out;
}

// ============================================================================
// Environment
// ============================================================================

Environment Environment::from_process() {
    std::map<std::string, std::string> vars;
#ifdef _WIN32
    char** env = _environ;
#else
    char** env = environ;
#endif
    for (char** p = env; p && *p; ++p) {
        std::string entry(*p);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        vars.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return Environment(std::move(vars));
}

std::optional<std::string> Environment::lookup(const std::string& name) const {
    auto it = vars_.find(name);
    if (it != vars_.end()) return it->second;
    auto dit = dotenv_.find(name);
    if (dit != dotenv_.end()) return dit->second;
    return std::nullopt;
}

std::string Environment::get(const std::string& name) const {
    return lookup(name).value_or("");
}

void Environment::set(const std::string& name, std::string value) {
    vars_[name] = std::move(value);
}

bool Environment::load_dotenv_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::debug("dotenv: {} not found", path);
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();

    size_t loaded = 0;
    for (auto& kv : parse_dotenv(ss.str())) {
        if (vars_.count(kv.first) || dotenv_.count(kv.first)) continue;
        dotenv_.emplace(std::move(kv.first), std::move(kv.second));
        ++loaded;
    }

    spdlog::debug("dotenv: loaded {} variable(s) from {}", loaded, path);
    return true;
}

std::vector<std::string> Environment::default_dotenv_paths() const {
    std::vector<std::string> paths;

    char buf[4096];
    if (getcwd(buf, sizeof(buf)) != nullptr) {
        paths.push_back(std::string(buf) + "/.env");
    }

    std::string home = get("HOME");
    if (home.empty()) home = get("USERPROFILE");
    if (!home.empty()) {
        paths.push_back(home + "/.openclaw/.env");
    }

    return paths;
}

void Environment::load_dotenv() {
    std::string explicit_path = trim(get("DEPUTY_ENV_FILE"));
    if (!explicit_path.empty()) {
        if (!load_dotenv_file(explicit_path)) {
            spdlog::warn("DEPUTY_ENV_FILE {} could not be read", explicit_path);
        }
        return;
    }

    int files = 0;
    for (const auto& path : default_dotenv_paths()) {
        if (load_dotenv_file(path)) ++files;
    }
    spdlog::debug("dotenv: {} file(s) loaded", files);
}

} // namespace deputy
