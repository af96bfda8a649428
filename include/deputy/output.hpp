#pragma once

#include "deputy/errors.hpp"

#include <optional>
#include <string>

namespace deputy {

// ============================================================================
// Output Mode
// ============================================================================

enum class OutputMode {
    Text,
    Json
};

inline const char* output_mode_to_string(OutputMode m) {
    switch (m) {
        case OutputMode::Text: return "text";
        case OutputMode::Json: return "json";
    }
    return "text";
}

// ============================================================================
// Render Options
// ============================================================================

/**
 * @brief Everything the renderer needs to know about one invocation
 *
 * mode, raw, query and color are resolved once before any command runs.
 * limit, offset and fail_on_empty come from the list command's own flags.
 * A limit or offset of zero means "not requested".
 */
struct RenderOptions {
    OutputMode mode = OutputMode::Text;
    bool raw = false;
    std::optional<std::string> query;
    std::optional<int> limit;
    std::optional<int> offset;
    bool fail_on_empty = false;
    bool color = false;

    bool json() const { return mode == OutputMode::Json; }
};

// ============================================================================
// Format Resolution
// ============================================================================

struct FormatInputs {
    std::string output_flag = "text";   // --output value (default "text")
    bool output_flag_set = false;       // --output given on the command line
    std::string env_output;             // DEPUTY_OUTPUT, empty when unset
    bool stdout_is_terminal = false;
    bool raw = false;                   // --raw
};

/**
 * @brief Resolve the effective output mode
 *
 * Precedence: explicit --output, then DEPUTY_OUTPUT, then TTY detection
 * (json when stdout is not a terminal). --raw forces json on top of any of
 * these. Invalid flag or environment values are INVALID_INPUT errors.
 */
Result<RenderOptions> resolve_output_format(const FormatInputs& inputs);

// isatty() on stdout.
bool stdout_is_terminal();

} // namespace deputy
