#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "msgtrace/core/logging/config.hpp"
#include "msgtrace/core/logging/logger.hpp"

TEST_CASE("Logger API", "[logging]") {
    using namespace msgtrace::core::logging;

    auto logger = std::make_shared<Logger>("test-logger");

    SECTION("Level setting and getting") {
        REQUIRE(logger->level() == Level::info);

        logger->set_level(Level::debug);
        REQUIRE(logger->level() == Level::debug);
        REQUIRE(logger->should_log(Level::debug));
        REQUIRE_FALSE(logger->should_log(Level::trace));

        logger->set_level(Level::warn);
        REQUIRE_FALSE(logger->should_log(Level::info));
    }

    SECTION("Logger name") {
        REQUIRE(logger->name() == "test-logger");
    }

    SECTION("Level string conversion") {
        REQUIRE(level_to_string(Level::trace) == "TRACE");
        REQUIRE(level_to_string(Level::warn) == "WARN");
        REQUIRE(level_to_string(Level::critical) == "CRITICAL");

        REQUIRE(level_from_string("trace") == Level::trace);
        REQUIRE(level_from_string("WARNING") == Level::warn);
        REQUIRE(level_from_string("critical") == Level::critical);
        REQUIRE(level_from_string("unknown") == Level::info);
    }

    SECTION("Formatted messages") {
        logger->set_level(Level::trace);
        logger->trace("trace message");
        logger->debug("dropped {} spans", 3);
        logger->info("span {} ended with {}", "Handle: CreateOrder", "ok");
        logger->warn("queue at {:.1f}%", 99.5);
        logger->error("export failed");
        logger->flush();
    }
}

TEST_CASE("Logger writes to configured file sink", "[logging]") {
    using namespace msgtrace::core::logging;

    auto path = std::filesystem::temp_directory_path() / "msgtrace_logger_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.level = Level::debug;
    SinkConfig sink;
    sink.type = SinkType::File;
    sink.path = path;
    sink.level = Level::debug;
    config.sinks.push_back(sink);

    {
        auto logger = create_logger("msgtrace.file-test", config);
        logger->debug("span {} exported", "0123456789abcdef");
        logger->trace("not written");
        logger->flush();
    }

    std::ifstream input{path};
    std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    REQUIRE(content.find("span 0123456789abcdef exported") != std::string::npos);
    REQUIRE(content.find("not written") == std::string::npos);
    REQUIRE(content.find("[msgtrace.file-test]") != std::string::npos);

    input.close();
    std::filesystem::remove(path);
}
