// strata_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <strata/core/log.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace strata_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());

    REQUIRE(log_level_name(spdlog::level::err) == "error");
    REQUIRE(log_level_name(spdlog::level::off) == "off");
    REQUIRE(parse_log_level(log_level_name(spdlog::level::warn)) == spdlog::level::warn);
}

TEST_CASE("Module loggers", "[core][log]") {
    REQUIRE(core_logger()->name() == "strata_core");
    REQUIRE(memory_logger()->name() == "strata_memory");
    REQUIRE(ecs_logger()->name() == "strata_ecs");
    REQUIRE(spdlog::get("strata_ecs") == ecs_logger());
    REQUIRE(ecs_logger() == ecs_logger());
}

TEST_CASE("configure_logging redirects loggers that already exist", "[core][log]") {
    const auto dir = std::filesystem::temp_directory_path() / "strata_log_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    // Created before the file sink is configured
    auto logger = ecs_logger();

    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.log_directory = dir.string();
    config.level = spdlog::level::debug;
    configure_logging(config);
    REQUIRE(logger->level() == spdlog::level::debug);

    logger->debug("written after reconfiguration");
    flush_all_loggers();
    configure_logging(LogConfig{});
    REQUIRE(logger->level() == spdlog::level::info);

    std::ifstream in(dir / "strata.log");
    std::stringstream text;
    text << in.rdbuf();
    REQUIRE(text.str().find("[strata_ecs] written after reconfiguration") != std::string::npos);

    in.close();
    std::filesystem::remove_all(dir);
}

TEST_CASE("LogScope traces entry and exit", "[core][log]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%v");
    auto logger = std::make_shared<spdlog::logger>("strata_test_scope", sink);
    logger->set_level(spdlog::level::trace);

    {
        LogScope scope(logger, "load");
        logger->trace("inside");
    }
    logger->flush();

    const std::string text = out.str();
    const auto started = text.find("load started");
    const auto inside = text.find("inside");
    const auto finished = text.find("load finished in ");
    REQUIRE(started != std::string::npos);
    REQUIRE(inside != std::string::npos);
    REQUIRE(finished != std::string::npos);
    REQUIRE(started < inside);
    REQUIRE(inside < finished);
}
