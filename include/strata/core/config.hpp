#pragma once

/// @file config.hpp
/// @brief Store configuration for strata_core
///
/// Configuration is read from JSON:
/// @code
/// {
///     "initial_capacity": 64,
///     "log": {
///         "level": "debug",
///         "console": true,
///         "file": false,
///         "directory": "logs",
///         "max_file_size": 10485760,
///         "max_files": 5
///     }
/// }
/// @endcode
/// Every key is optional. Unknown keys are ignored.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace strata_core {

/// Configuration for a component store
struct StoreConfig {
    /// Slots reserved by every newly created component set (0 = lazy)
    std::size_t initial_capacity = 0;

    /// Logging setup
    LogConfig log;
};

/// Parse configuration from a JSON document
[[nodiscard]] Result<StoreConfig> parse_config(const nlohmann::json& json);

/// Parse configuration from JSON text
[[nodiscard]] Result<StoreConfig> parse_config_string(const std::string& text);

/// Load configuration from a JSON file
[[nodiscard]] Result<StoreConfig> load_config(const std::filesystem::path& path);

/// Serialize configuration back to JSON
[[nodiscard]] nlohmann::json config_to_json(const StoreConfig& config);

/// Apply the logging section of a configuration
void apply_config(const StoreConfig& config);

} // namespace strata_core
