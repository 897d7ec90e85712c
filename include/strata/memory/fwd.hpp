#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_memory

namespace strata_memory {

// Allocators
class IAllocator;
class HeapAllocator;

// Helpers
struct AllocatorStats;

} // namespace strata_memory
