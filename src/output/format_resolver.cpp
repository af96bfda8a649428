#include "deputy/output.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace deputy {

namespace {

std::optional<OutputMode> parse_mode(const std::string& value) {
    if (value == "text") return OutputMode::Text;
    if (value == "json") return OutputMode::Json;
    return std::nullopt;
}

} // namespace

Result<RenderOptions> resolve_output_format(const FormatInputs& inputs) {
    RenderOptions opts;
    const char* source = "default";

    if (inputs.output_flag_set) {
        // An explicit flag wins; no auto-detection.
        auto mode = parse_mode(inputs.output_flag);
        if (!mode) {
            return Result<RenderOptions>::err(Error(ErrorCode::INVALID_INPUT,
                "invalid --output \"" + inputs.output_flag + "\" (expected text or json)"));
        }
        opts.mode = *mode;
        source = "--output";
    } else if (!inputs.env_output.empty()) {
        std::string lower = inputs.env_output;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto mode = parse_mode(lower);
        if (!mode) {
            return Result<RenderOptions>::err(Error(ErrorCode::INVALID_INPUT,
                "invalid DEPUTY_OUTPUT \"" + inputs.env_output + "\" (expected text or json)"));
        }
        opts.mode = *mode;
        source = "DEPUTY_OUTPUT";
    } else if (!inputs.stdout_is_terminal) {
        opts.mode = OutputMode::Json;
        source = "non-terminal stdout";
    }

    if (inputs.raw && opts.mode == OutputMode::Text) {
        opts.mode = OutputMode::Json;
        source = "--raw";
    }
    opts.raw = inputs.raw;

    spdlog::debug("output mode: {} (from {}), raw={}", output_mode_to_string(opts.mode), source, opts.raw);
    return Result<RenderOptions>::ok(opts);
}

bool stdout_is_terminal() {
    return isatty(fileno(stdout)) != 0;
}

} // namespace deputy
