#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Prism {

struct RuntimeOptions {
    std::string app_root{"."};
    std::size_t max_source_bytes{1024 * 1024};
    std::size_t memory_limit_bytes{16 * 1024 * 1024};
    bool        logging{false};
    int         json_indent{-1};
};

// One scripted user interaction for prism_run, applied in command-line order.
struct RunStep {
    enum class Kind {
        Action,
        Click,
        Type,
        Backspace
    };
    Kind        kind{Kind::Action};
    std::string target; // action name, or node path for the other kinds
    std::string text;   // Type only
};

struct RunArguments {
    RuntimeOptions       options;
    std::string          document;
    std::vector<RunStep> steps;
    bool                 show_help{false};
};

// Defaults, then environment overrides, then flags. Prints the problem to
// stderr and returns nullopt on bad input.
auto ParseRuntimeArguments(int argc, char** argv) -> std::optional<RunArguments>;

void PrintRuntimeUsage();

// PRISM_APP_ROOT, PRISM_MAX_SOURCE_BYTES, PRISM_MEMORY_LIMIT, PRISM_LOG.
bool ApplyRuntimeEnvOverrides(RuntimeOptions& options);

auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<std::string>;

} // namespace Prism
