#pragma once

#include <string>

namespace deputy {

// Name of the logger installed as spdlog's default.
inline const char* logger_name() { return "deputy"; }

/**
 * @brief Route spdlog output to stderr
 *
 * Installs a "deputy" stderr logger as the default so stdout carries only
 * command output. The level is debug when `debug` is set, warn otherwise.
 * Safe to call more than once; later calls only change the level.
 */
void init_logging(bool debug);

} // namespace deputy
