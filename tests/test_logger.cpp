#include <catch2/catch.hpp>

#include "utils/logger.h"
#include "test_support.hpp"

TEST_CASE("Log level names", "[logger]") {
    REQUIRE(Logger::parse_level("debug") == LogLevel::Debug);
    REQUIRE(Logger::parse_level("WARN") == LogLevel::Warn);
    REQUIRE(Logger::parse_level("warning") == LogLevel::Warn);
    REQUIRE(Logger::parse_level("error") == LogLevel::Error);
    REQUIRE(Logger::parse_level("verbose") == LogLevel::Info);
    REQUIRE(std::string(Logger::level_name(LogLevel::Error)) == "ERROR");
}

TEST_CASE("Messages below the level are dropped", "[logger]") {
    LogCapture logs(LogLevel::Warn);

    LOG_DEBUG("debug line");
    LOG_INFO("info line");
    LOG_WARN("warn line " << 42);
    LOG_ERROR("error line");

    REQUIRE_FALSE(logs.contains("debug line"));
    REQUIRE_FALSE(logs.contains("info line"));
    REQUIRE(logs.contains("WARN"));
    REQUIRE(logs.contains("warn line 42"));
    REQUIRE(logs.contains("error line"));
    REQUIRE(logs.lines().size() == 2);
}
