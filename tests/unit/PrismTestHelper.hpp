#pragma once

#include "ast/Document.hpp"
#include "parse/Parser.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

namespace Prism::Test {

// Pre-order layout of the view:
//   0 ""  column
//   1 "0" text "Count: {count}"
//   2 "1" button "Increment"
//   3 "2" button "Toggle"
//   4 "3" text "Hello {name}"      visible: showDetails
//   5 "4" progress                 value: done / total, color
//   6 "5" input                    bind: name
inline constexpr std::string_view kCounterSource = R"(-- counter sample
@app "Counter"
@version 1

state {
  count: 0
  name: "Ada"
  showDetails: false
  total: 10
  done: 5
}

view {
  column {
    text "Count: {count}"
    button "Increment" { on_click: increment }
    button "Toggle" { on_click: toggle }
    text "Hello {name}" { visible: showDetails }
    progress { value: done / total, color: #3366ff }
    input { bind: name, placeholder: "Name" }
  }
}

actions {
  increment { count: count + 1 }
  toggle { showDetails: showDetails == false }
  reset { count: 0 }
  broken { count: count / 0 }
  chain {
    count: count + 1
    count: count * 10
  }
  finish { done: total }
}
)";

inline auto parseOrFail(std::string_view source) -> Document {
    auto document = parseDocument(source);
    REQUIRE_MESSAGE(document.has_value(), (document ? std::string{} : describeError(document.error())));
    auto resolved = validateDocument(*document);
    REQUIRE_MESSAGE(resolved.has_value(), (resolved ? std::string{} : describeError(resolved.error())));
    return std::move(*document);
}

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDirectory {
public:
    ScratchDirectory() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path()
                / ("prism_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_ / "app");
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(ScratchDirectory const&)            = delete;
    ScratchDirectory& operator=(ScratchDirectory const&) = delete;

    // Application root; the scratch directory itself is its parent.
    [[nodiscard]] auto root() const -> std::filesystem::path { return path_ / "app"; }
    [[nodiscard]] auto outside() const -> std::filesystem::path { return path_; }

    auto write(std::filesystem::path const& path, std::string_view contents) const -> void {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::binary};
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

private:
    std::filesystem::path path_;
};

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace Prism::Test
