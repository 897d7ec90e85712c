#pragma once

/// @file log.hpp
/// @brief spdlog-backed logging for strata
///
/// Every strata module logs through its own named spdlog logger. All of them
/// write into one shared set of sinks, so configure_logging() can switch the
/// console and file outputs of loggers that already exist.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace strata_core {

// =============================================================================
// Configuration
// =============================================================================

/// Output settings shared by the strata loggers
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                     // strata.log is written here
    std::size_t max_file_size = 10 * 1024 * 1024;  // bytes before rotation
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Replace the shared sinks and set the level of every strata logger
void configure_logging(const LogConfig& config);

/// Accepts spdlog's level names plus "warn", "err" and "fatal"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

/// spdlog's name for a level ("warning", "error", ...)
[[nodiscard]] std::string log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Module Loggers
// =============================================================================

[[nodiscard]] std::shared_ptr<spdlog::logger> core_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> memory_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> ecs_logger();

/// Flush every logger registered with spdlog
void flush_all_loggers();

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit of a block, with the time spent inside it
class LogScope {
public:
    LogScope(std::shared_ptr<spdlog::logger> logger, std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace strata_core
