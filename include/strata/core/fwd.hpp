#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_core module

#include <cstdint>

namespace strata_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct StoreError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

struct FatalInfo;

// =============================================================================
// ID Types
// =============================================================================

class IdAllocator;

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig;
struct StoreConfig;

} // namespace strata_core
