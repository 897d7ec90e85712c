#pragma once

/// @file core.hpp
/// @brief Main include file for strata_core module
///
/// This header includes all strata_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling
#include "error.hpp"
#include "fatal.hpp"

// Logging and configuration
#include "log.hpp"
#include "config.hpp"

// Identifiers
#include "id.hpp"

/// @namespace strata_core
/// @brief Foundational types shared by the strata modules
///
/// - **Error Handling**: Result<T> for recoverable conditions, STRATA_VERIFY
///   for fatal programming errors
/// - **Logging**: spdlog-backed named loggers
/// - **Configuration**: JSON store configuration
/// - **Identifiers**: Monotonic, never-recycled id allocation
///
/// Example usage:
/// @code
/// #include <strata/core/core.hpp>
///
/// using namespace strata_core;
///
/// auto config = load_config("store.json");
/// if (!config) {
///     core_logger()->error("{}", build_error_chain(config.error()));
///     return;
/// }
/// apply_config(*config);
///
/// IdAllocator ids;
/// std::uint64_t first = ids.next();  // 1
/// @endcode

namespace strata_core {

/// Library version string
[[nodiscard]] inline const char* strata_core_version_string() noexcept {
    return "strata_core 0.1.0";
}

} // namespace strata_core
