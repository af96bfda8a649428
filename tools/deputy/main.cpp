/**
 * deputy CLI - Entry Point
 *
 * Command-line client for the Deputy workforce management API.
 */

#include "cli.hpp"

#include <deputy/logging.hpp>

#include <algorithm>
#include <iostream>

int main(int argc, char** argv) {
    using namespace deputy::cli;

    std::vector<std::string> args(argv + 1, argv + argc);

    // .env files load before flags are parsed; honor --debug for that step
    bool debug = std::find(args.begin(), args.end(), "--debug") != args.end();
    deputy::init_logging(debug);

    deputy::Environment env = deputy::Environment::from_process();
    env.load_dotenv();

    Cli cli(default_client_factory(), std::cout, std::cerr, std::move(env),
            deputy::stdout_is_terminal());
    return cli.execute(args);
}
