/// @file config.cpp
/// @brief Store configuration loading for strata_core

#include <strata/core/config.hpp>

#include <cstdint>
#include <fstream>

namespace strata_core {

namespace {

Result<std::size_t> read_size(const nlohmann::json& obj, const char* key, std::size_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok(fallback);
    }
    // Integers built in code are signed even when non-negative
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        return Err<std::size_t>(ConfigError::wrong_type(key, "a non-negative integer"));
    }
    return Ok(it->get<std::size_t>());
}

Result<bool> read_bool(const nlohmann::json& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok(fallback);
    }
    if (!it->is_boolean()) {
        return Err<bool>(ConfigError::wrong_type(key, "a boolean"));
    }
    return Ok(it->get<bool>());
}

Result<void> parse_log_section(const nlohmann::json& obj, LogConfig& log) {
    if (!obj.is_object()) {
        return Err(ConfigError::wrong_type("log", "an object"));
    }

    if (auto it = obj.find("level"); it != obj.end()) {
        if (!it->is_string()) {
            return Err(ConfigError::wrong_type("log.level", "a string"));
        }
        auto level = parse_log_level(it->get<std::string>());
        if (!level) {
            return Err(ConfigError::invalid_value("log.level", it->get<std::string>()));
        }
        log.level = *level;
    }

    auto console = read_bool(obj, "console", log.console_enabled);
    if (!console) return Err(console.error());
    log.console_enabled = *console;

    auto file = read_bool(obj, "file", log.file_enabled);
    if (!file) return Err(file.error());
    log.file_enabled = *file;

    if (auto it = obj.find("directory"); it != obj.end()) {
        if (!it->is_string()) {
            return Err(ConfigError::wrong_type("log.directory", "a string"));
        }
        log.log_directory = it->get<std::string>();
    }

    auto max_size = read_size(obj, "max_file_size", log.max_file_size);
    if (!max_size) return Err(max_size.error());
    log.max_file_size = *max_size;

    auto max_files = read_size(obj, "max_files", log.max_files);
    if (!max_files) return Err(max_files.error());
    log.max_files = *max_files;

    if (log.file_enabled && log.log_directory.empty()) {
        return Err(ConfigError::invalid_value("log.directory", "(empty while file logging is enabled)"));
    }

    return Ok();
}

} // anonymous namespace

Result<StoreConfig> parse_config(const nlohmann::json& json) {
    if (!json.is_object()) {
        return Err<StoreConfig>(ConfigError::parse_failed("top level must be an object"));
    }

    StoreConfig config;

    auto capacity = read_size(json, "initial_capacity", config.initial_capacity);
    if (!capacity) return Err<StoreConfig>(capacity.error());
    config.initial_capacity = *capacity;

    if (auto it = json.find("log"); it != json.end()) {
        auto result = parse_log_section(*it, config.log);
        if (!result) {
            return Err<StoreConfig>(result.error());
        }
    }

    return Ok(std::move(config));
}

Result<StoreConfig> parse_config_string(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return Err<StoreConfig>(ConfigError::parse_failed(ex.what()));
    }
    return parse_config(json);
}

Result<StoreConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<StoreConfig>(ConfigError::file_not_found(path.string()));
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& ex) {
        Error err(ConfigError::parse_failed(ex.what()));
        err.with_context("path", path.string());
        return Err<StoreConfig>(std::move(err));
    }

    auto result = parse_config(json);
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

nlohmann::json config_to_json(const StoreConfig& config) {
    return nlohmann::json{
        {"initial_capacity", config.initial_capacity},
        {"log", {
            {"level", log_level_name(config.log.level)},
            {"console", config.log.console_enabled},
            {"file", config.log.file_enabled},
            {"directory", config.log.log_directory},
            {"max_file_size", config.log.max_file_size},
            {"max_files", config.log.max_files},
        }},
    };
}

void apply_config(const StoreConfig& config) {
    configure_logging(config.log);
    core_logger()->debug("Applied store config (initial_capacity={}, level={})",
        config.initial_capacity, log_level_name(config.log.level));
}

} // namespace strata_core
