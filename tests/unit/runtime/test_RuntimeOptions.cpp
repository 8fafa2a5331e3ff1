#include "../PrismTestHelper.hpp"

#include <prism/runtime/RuntimeOptions.hpp>

#include <doctest/doctest.h>

#include <initializer_list>
#include <string>
#include <vector>

using namespace Prism;
using Prism::Test::EnvGuard;

namespace {

struct Argv {
    Argv(std::initializer_list<char const*> args)
        : storage(args.begin(), args.end()) {
        for (auto& arg : storage)
            pointers.push_back(arg.data());
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

auto parse(Argv args) -> std::optional<RunArguments> {
    return ParseRuntimeArguments(args.argc(), args.argv());
}

struct CleanEnvironment {
    EnvGuard root{"PRISM_APP_ROOT", nullptr};
    EnvGuard source{"PRISM_MAX_SOURCE_BYTES", nullptr};
    EnvGuard memory{"PRISM_MEMORY_LIMIT", nullptr};
    EnvGuard log{"PRISM_LOG", nullptr};
};

} // namespace

TEST_SUITE("runtime.options") {
    TEST_CASE("Defaults") {
        CleanEnvironment clean;
        auto parsed = parse({"prism_run", "app.prism"});
        REQUIRE(parsed.has_value());
        CHECK(parsed->document == "app.prism");
        CHECK(parsed->options.app_root == ".");
        CHECK(parsed->options.max_source_bytes == 1024 * 1024);
        CHECK(parsed->options.memory_limit_bytes == 16 * 1024 * 1024);
        CHECK_FALSE(parsed->options.logging);
        CHECK(parsed->options.json_indent == -1);
        CHECK(parsed->steps.empty());
        CHECK_FALSE(parsed->show_help);
    }

    TEST_CASE("Flags and steps in order") {
        CleanEnvironment clean;
        auto parsed = parse({"prism_run", "--root", "apps", "--max-source", "2048", "--memory-limit", "65536",
                             "--indent", "2", "--log", "--action", "increment", "--click", "0/1", "--type", "5",
                             "hi there", "--backspace", "5", "main.prism"});
        REQUIRE(parsed.has_value());
        CHECK(parsed->options.app_root == "apps");
        CHECK(parsed->options.max_source_bytes == 2048);
        CHECK(parsed->options.memory_limit_bytes == 65536);
        CHECK(parsed->options.json_indent == 2);
        CHECK(parsed->options.logging);
        CHECK(parsed->document == "main.prism");

        REQUIRE(parsed->steps.size() == 4);
        CHECK(parsed->steps[0].kind == RunStep::Kind::Action);
        CHECK(parsed->steps[0].target == "increment");
        CHECK(parsed->steps[1].kind == RunStep::Kind::Click);
        CHECK(parsed->steps[1].target == "0/1");
        CHECK(parsed->steps[2].kind == RunStep::Kind::Type);
        CHECK(parsed->steps[2].target == "5");
        CHECK(parsed->steps[2].text == "hi there");
        CHECK(parsed->steps[3].kind == RunStep::Kind::Backspace);
    }

    TEST_CASE("Help short-circuits") {
        CleanEnvironment clean;
        auto parsed = parse({"prism_run", "--help", "--bogus"});
        REQUIRE(parsed.has_value());
        CHECK(parsed->show_help);
        CHECK(parse({"prism_run", "-h"})->show_help);
    }

    TEST_CASE("Bad command lines are rejected") {
        CleanEnvironment clean;
        CHECK_FALSE(parse({"prism_run"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "b.prism"}).has_value());
        CHECK_FALSE(parse({"prism_run", "--bogus", "a.prism"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--action"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--action", ""}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--type", "5"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--root", ""}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--max-source", "0"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--memory-limit", "12kb"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--indent", "17"}).has_value());
        CHECK_FALSE(parse({"prism_run", "a.prism", "--indent", "-2"}).has_value());
        CHECK(parse({"prism_run", "a.prism", "--indent", "-1"}).has_value());
    }

    TEST_CASE("Environment overrides sit between defaults and flags") {
        CleanEnvironment clean;
        EnvGuard root{"PRISM_APP_ROOT", "/srv/apps"};
        EnvGuard memory{"PRISM_MEMORY_LIMIT", "4096"};
        EnvGuard log{"PRISM_LOG", "yes"};

        RuntimeOptions options;
        REQUIRE(ApplyRuntimeEnvOverrides(options));
        CHECK(options.app_root == "/srv/apps");
        CHECK(options.memory_limit_bytes == 4096);
        CHECK(options.max_source_bytes == 1024 * 1024);
        CHECK(options.logging);

        auto parsed = parse({"prism_run", "--memory-limit", "8192", "x.prism"});
        REQUIRE(parsed.has_value());
        CHECK(parsed->options.app_root == "/srv/apps");
        CHECK(parsed->options.memory_limit_bytes == 8192);
    }

    TEST_CASE("Malformed environment values are rejected") {
        CleanEnvironment clean;
        {
            EnvGuard bad{"PRISM_MAX_SOURCE_BYTES", "0"};
            RuntimeOptions options;
            CHECK_FALSE(ApplyRuntimeEnvOverrides(options));
        }
        {
            EnvGuard bad{"PRISM_LOG", "maybe"};
            RuntimeOptions options;
            CHECK_FALSE(ApplyRuntimeEnvOverrides(options));
            CHECK_FALSE(parse({"prism_run", "x.prism"}).has_value());
        }
        {
            EnvGuard bad{"PRISM_APP_ROOT", ""};
            RuntimeOptions options;
            CHECK_FALSE(ApplyRuntimeEnvOverrides(options));
        }
    }

    TEST_CASE("Validation") {
        RuntimeOptions options;
        CHECK_FALSE(ValidateRuntimeOptions(options).has_value());
        options.memory_limit_bytes = 0;
        CHECK(ValidateRuntimeOptions(options).has_value());
        options                    = RuntimeOptions{};
        options.json_indent        = 20;
        CHECK(ValidateRuntimeOptions(options).has_value());
        options                    = RuntimeOptions{};
        options.app_root.clear();
        CHECK(ValidateRuntimeOptions(options).has_value());
    }
}
