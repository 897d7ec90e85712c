#pragma once

/// @file memory.hpp
/// @brief Main header for strata_memory - raw block allocation
///
/// - IAllocator: allocate / reallocate / deallocate raw blocks
/// - HeapAllocator: C heap backed implementation with bookkeeping

#include "fwd.hpp"
#include "allocator.hpp"

namespace strata_memory {

/// Prelude namespace for commonly used types
namespace prelude {
    using strata_memory::IAllocator;
    using strata_memory::HeapAllocator;
    using strata_memory::AllocatorStats;
    using strata_memory::default_allocator;
    using strata_memory::align_up;
    using strata_memory::align_down;
    using strata_memory::is_aligned;
}

} // namespace strata_memory
