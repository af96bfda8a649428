/**
 * deputy CLI - command tree
 */

#pragma once

#include "common.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace deputy::cli {

// Reads credentials from the environment and builds an HttpApiClient.
ClientFactory default_client_factory();

/**
 * The deputy command tree.
 *
 * Each execute() call builds a fresh CLI11 app, parses the arguments, runs
 * the selected command and reports any error. Output and error streams,
 * the environment and the TTY flag are injected so the whole tree can run
 * in-process.
 */
class Cli {
public:
    Cli(ClientFactory factory, std::ostream& out, std::ostream& err,
        Environment env, bool stdout_tty)
        : factory_(std::move(factory)), out_(out), err_(err),
          env_(std::move(env)), stdout_tty_(stdout_tty) {}

    // Arguments exclude the program name. Returns the process exit code.
    int execute(const std::vector<std::string>& args);

private:
    int report(const Session& session, const Error& error);

    ClientFactory factory_;
    std::ostream& out_;
    std::ostream& err_;
    Environment env_;
    bool stdout_tty_;
};

// Convert a CLI11 parse failure into an Error carrying the phrase the exit
// code classifier keys on.
Error translate_parse_error(const CLI::App& app, const CLI::ParseError& e);

} // namespace deputy::cli
