#pragma once

/**
 * @file environment.hpp
 * @brief Process environment layered over .env files
 *
 * Lookups consult the process environment first and fall back to values
 * loaded from .env files. A .env file never overrides a variable that is
 * already set, and when several files define a key the first one loaded
 * wins.
 */

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace deputy {

class Environment {
public:
    Environment() = default;
    explicit Environment(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}

    // Snapshot of the current process environment.
    static Environment from_process();

    std::optional<std::string> lookup(const std::string& name) const;

    // Value of `name`, or an empty string when unset.
    std::string get(const std::string& name) const;

    void set(const std::string& name, std::string value);

    // Load DEPUTY_ENV_FILE if set, otherwise ./.env then ~/.openclaw/.env.
    // Missing or unreadable files are skipped.
    void load_dotenv();

    // Load one file. Returns false if it could not be read.
    bool load_dotenv_file(const std::string& path);

    // ./.env and ~/.openclaw/.env, in load order.
    std::vector<std::string> default_dotenv_paths() const;

private:
    std::map<std::string, std::string> vars_;
    std::map<std::string, std::string> dotenv_;
};

/**
 * @brief Parse .env content into ordered key/value pairs
 *
 * Accepts KEY=VALUE lines with an optional "export " prefix. Blank lines
 * and lines starting with '#' are skipped. Single and double quoted values
 * are unquoted (double quotes also process \n, \t, \" and \\); unquoted
 * values lose a trailing " # comment".
 */
std::vector<std::pair<std::string, std::string>> parse_dotenv(const std::string& content);

} // namespace deputy
