#ifdef PRISM_LOG_DEBUG
#include "../PrismTestHelper.hpp"

#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

using Prism::Test::EnvGuard;

namespace {

auto captureStderr(std::function<void(Prism::TaggedLogger&)> fn) -> std::string {
    std::ostringstream buffer;
    std::string        output;
    {
        Prism::TaggedLogger logger;
        std::streambuf*     original = nullptr;
        {
            std::lock_guard<std::mutex> lock(Prism::TaggedLogger::coutMutex);
            original = std::cerr.rdbuf(buffer.rdbuf());
        }
        fn(logger);
        logger.flush();
        std::lock_guard<std::mutex> lock(Prism::TaggedLogger::coutMutex);
        std::cerr.rdbuf(original);
        output = buffer.str();
    }
    return output;
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.log_impl("should not appear", std::source_location::current(), "Store");
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "Runtime", "INFO");
    });
    CHECK(output.find("[INFO][Runtime]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_trace") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.log_impl("filtered", std::source_location::current(), "Trace");
        logger.log_impl("kept", std::source_location::current(), "Store");
    });
    CHECK(output.find("filtered") == std::string::npos);
    CHECK(output.find("kept") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Materializer"});
        logger.log_impl("keep me", std::source_location::current(), "Materializer");
        logger.log_impl("drop me", std::source_location::current(), "Materializer", "Other");
    });
    CHECK(output.find("keep me") != std::string::npos);
    CHECK(output.find("drop me") == std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setThreadName("EventLoop");
        logger.log_impl("with name", std::source_location::current(), "Runtime");
    });
    CHECK(output.find("[EventLoop]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([](Prism::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/LoggedFile.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 108 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("subdir/LoggedFile.cpp:42") != std::string::npos);
}

TEST_CASE("environment_configures_the_global_logger") {
    EnvGuard enable{"PRISM_LOG", "1"};
    EnvGuard tags{"PRISM_LOG_TAGS", "Alpha,Beta"};
    Prism::configure_logging_from_env();

    std::ostringstream buffer;
    std::streambuf*    original = nullptr;
    {
        std::lock_guard<std::mutex> lock(Prism::TaggedLogger::coutMutex);
        original = std::cerr.rdbuf(buffer.rdbuf());
    }
    prism_log("via macro", "Alpha", "Beta");
    prism_log("filtered out", "Gamma");
    Prism::logger().flush();
    {
        std::lock_guard<std::mutex> lock(Prism::TaggedLogger::coutMutex);
        std::cerr.rdbuf(original);
    }
    Prism::set_logging_enabled(false);
    Prism::logger().setEnabledTags({});

    auto const output = buffer.str();
    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
    CHECK(output.find("filtered out") == std::string::npos);
}

} // TEST_SUITE
#endif // PRISM_LOG_DEBUG
