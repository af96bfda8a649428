#include "deputy/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace deputy {

void init_logging(bool debug) {
    auto logger = spdlog::get(logger_name());
    if (!logger) {
        logger = spdlog::stderr_color_mt(logger_name());
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    spdlog::set_default_logger(logger);

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::debug("debug logging enabled");
}

} // namespace deputy
