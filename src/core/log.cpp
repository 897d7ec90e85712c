/// @file log.cpp
/// @brief Shared sinks and module loggers for strata_core

#include <strata/core/log.hpp>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <filesystem>
#include <vector>

namespace strata_core {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr const char* LOG_FILE_NAME = "strata.log";

/// Fan-out sink every strata logger writes to
class SharedSinks {
public:
    SharedSinks() : m_fanout(std::make_shared<spdlog::sinks::dist_sink_mt>()) {
        m_fanout->set_sinks(build(LogConfig{}));
    }

    [[nodiscard]] spdlog::sink_ptr fanout() const { return m_fanout; }
    [[nodiscard]] spdlog::level::level_enum level() const { return m_level.load(); }

    void apply(const LogConfig& config) {
        m_fanout->set_sinks(build(config));
        m_level.store(config.level);
    }

private:
    static std::vector<spdlog::sink_ptr> build(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(CONSOLE_PATTERN);
            sinks.push_back(std::move(console));
        }

        if (config.file_enabled && !config.log_directory.empty()) {
            const auto path = std::filesystem::path(config.log_directory) / LOG_FILE_NAME;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), config.max_file_size, config.max_files);
                file->set_pattern(FILE_PATTERN);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& ex) {
                // The strata loggers cannot report this yet; use spdlog's default
                spdlog::warn("Cannot open log file '{}': {}", path.string(), ex.what());
            }
        }

        return sinks;
    }

    std::shared_ptr<spdlog::sinks::dist_sink_mt> m_fanout;
    std::atomic<spdlog::level::level_enum> m_level{spdlog::level::info};
};

SharedSinks& shared_sinks() {
    static SharedSinks sinks;
    return sinks;
}

std::shared_ptr<spdlog::logger> make_module_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = std::make_shared<spdlog::logger>(name, shared_sinks().fanout());
    logger->set_level(shared_sinks().level());
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    shared_sinks().apply(config);
    for (const auto& logger : {core_logger(), memory_logger(), ecs_logger()}) {
        logger->set_level(config.level);
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
    if (text == "fatal") {
        return spdlog::level::critical;
    }
    // from_str maps every unknown name to off
    const auto level = spdlog::level::from_str(std::string(text));
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

std::string log_level_name(spdlog::level::level_enum level) {
    const auto name = spdlog::level::to_string_view(level);
    return std::string(name.data(), name.size());
}

std::shared_ptr<spdlog::logger> core_logger() {
    static const auto logger = make_module_logger("strata_core");
    return logger;
}

std::shared_ptr<spdlog::logger> memory_logger() {
    static const auto logger = make_module_logger("strata_memory");
    return logger;
}

std::shared_ptr<spdlog::logger> ecs_logger() {
    static const auto logger = make_module_logger("strata_ecs");
    return logger;
}

void flush_all_loggers() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::shared_ptr<spdlog::logger> logger, std::string name)
    : m_logger(std::move(logger))
    , m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("{} started", m_name);
}

LogScope::~LogScope() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("{} finished in {}us", m_name, elapsed.count());
}

} // namespace strata_core
