#include <prism/runtime/RuntimeOptions.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace Prism {

namespace {

constexpr int kMaxJsonIndent = 16;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<std::string> {
    if (options.app_root.empty()) {
        return std::string{"--root must not be empty"};
    }
    if (options.max_source_bytes == 0) {
        return std::string{"max source size must be > 0"};
    }
    if (options.memory_limit_bytes == 0) {
        return std::string{"memory limit must be > 0"};
    }
    if (options.json_indent < -1 || options.json_indent > kMaxJsonIndent) {
        return std::string{"--indent must be within -1-16"};
    }
    return std::nullopt;
}

bool ApplyRuntimeEnvOverrides(RuntimeOptions& options) {
    if (!apply_env("PRISM_APP_ROOT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "PRISM_APP_ROOT must not be empty\n";
                return false;
            }
            options.app_root = std::string{value};
            return true;
        })) {
        return false;
    }

    auto apply_positive_size = [&](char const* key, std::size_t& target) {
        return apply_env(key, [&](std::string_view value) {
            std::size_t parsed = target;
            if (!parse_integer_in_range<std::size_t>(value, 1, std::numeric_limits<std::size_t>::max(), parsed)) {
                std::cerr << key << " must be a byte count > 0\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_positive_size("PRISM_MAX_SOURCE_BYTES", options.max_source_bytes)) {
        return false;
    }
    if (!apply_positive_size("PRISM_MEMORY_LIMIT", options.memory_limit_bytes)) {
        return false;
    }

    if (!apply_env("PRISM_LOG", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "PRISM_LOG must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.logging = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintRuntimeUsage() {
    std::cout << "Usage: prism_run [options] <file.prism>\n"
              << "  --action <name>       Run a named action\n"
              << "  --click <path>        Click the node at a child-index path (\"\" is the root, \"0/1\")\n"
              << "  --type <path> <text>  Type text into the input bound at <path>\n"
              << "  --backspace <path>    Delete the last character of the input bound at <path>\n"
              << "  --root <dir>          Application root the document must live in (default .)\n"
              << "  --max-source <bytes>  Source size limit (default 1048576)\n"
              << "  --memory-limit <bytes> Runtime memory limit (default 16777216)\n"
              << "  --indent <n>          JSON indent (default -1 for one line per event)\n"
              << "  --log                 Enable diagnostic logging to stderr\n"
              << "  --help                Show this help\n";
}

auto ParseRuntimeArguments(int argc, char** argv) -> std::optional<RunArguments> {
    RunArguments arguments{};
    if (!ApplyRuntimeEnvOverrides(arguments.options)) {
        return std::nullopt;
    }
    auto& options = arguments.options;

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            arguments.show_help = true;
            return arguments;
        } else if (arg == "--action") {
            if (auto value = require_value(i, "--action")) {
                if (value->empty()) {
                    std::cerr << "--action must not be empty\n";
                    return std::nullopt;
                }
                arguments.steps.push_back(RunStep{RunStep::Kind::Action, std::string{*value}, {}});
            } else {
                return std::nullopt;
            }
        } else if (arg == "--click") {
            if (auto value = require_value(i, "--click")) {
                arguments.steps.push_back(RunStep{RunStep::Kind::Click, std::string{*value}, {}});
            } else {
                return std::nullopt;
            }
        } else if (arg == "--type") {
            auto path = require_value(i, "--type");
            if (!path) {
                return std::nullopt;
            }
            auto text = require_value(i, "--type");
            if (!text) {
                return std::nullopt;
            }
            arguments.steps.push_back(RunStep{RunStep::Kind::Type, std::string{*path}, std::string{*text}});
        } else if (arg == "--backspace") {
            if (auto value = require_value(i, "--backspace")) {
                arguments.steps.push_back(RunStep{RunStep::Kind::Backspace, std::string{*value}, {}});
            } else {
                return std::nullopt;
            }
        } else if (arg == "--root") {
            if (auto value = require_value(i, "--root")) {
                if (value->empty()) {
                    std::cerr << "--root must not be empty\n";
                    return std::nullopt;
                }
                options.app_root = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-source") {
            if (auto value = require_value(i, "--max-source")) {
                std::size_t parsed = options.max_source_bytes;
                if (!parse_integer_in_range<std::size_t>(*value, 1, std::numeric_limits<std::size_t>::max(), parsed)) {
                    std::cerr << "--max-source must be > 0\n";
                    return std::nullopt;
                }
                options.max_source_bytes = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--memory-limit") {
            if (auto value = require_value(i, "--memory-limit")) {
                std::size_t parsed = options.memory_limit_bytes;
                if (!parse_integer_in_range<std::size_t>(*value, 1, std::numeric_limits<std::size_t>::max(), parsed)) {
                    std::cerr << "--memory-limit must be > 0\n";
                    return std::nullopt;
                }
                options.memory_limit_bytes = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--indent") {
            if (auto value = require_value(i, "--indent")) {
                int parsed = options.json_indent;
                if (!parse_integer_in_range<int>(*value, -1, kMaxJsonIndent, parsed)) {
                    std::cerr << "--indent must be within -1-16\n";
                    return std::nullopt;
                }
                options.json_indent = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--log") {
            options.logging = true;
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown flag '" << arg << "'\n";
            return std::nullopt;
        } else if (arguments.document.empty()) {
            arguments.document = std::string{arg};
        } else {
            std::cerr << "Unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    if (arguments.document.empty()) {
        std::cerr << "A .prism document is required\n";
        return std::nullopt;
    }
    if (auto error = ValidateRuntimeOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return arguments;
}

} // namespace Prism
