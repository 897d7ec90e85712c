#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_ecs
///
/// All ECS types are declared here for header dependency management.

#include <cstdint>
#include <cstddef>

namespace strata_ecs {

// =============================================================================
// Core Types
// =============================================================================

/// Opaque, never-recycled entity identifier
struct Entity;

// =============================================================================
// Column Types
// =============================================================================

/// Element metadata (type tag, size, alignment, drop/relocate functions)
struct ColumnLayout;

/// Type-erased growable element storage
class Column;

/// Length-bounded typed view over a column
template<typename T>
class ColumnView;

// =============================================================================
// Sparse Set Types
// =============================================================================

/// Entity to dense slot index over a column
template<typename T>
class SparseSet;

/// Entity/value pair yielded by sparse set iteration
template<typename T>
struct Entry;

/// Parallel entity/value vectors produced by SparseSet::take_all
template<typename T>
struct Drained;

// =============================================================================
// Registry Types
// =============================================================================

/// Type-erased per-kind slot
class ComponentSlotBase;

/// Typed per-kind slot (set + lock)
template<typename T>
class ComponentSlot;

/// Shared access to one component kind
template<typename T>
class ReadGuard;

/// Exclusive access to one component kind
template<typename T>
class WriteGuard;

/// Composition root: one sparse set per component kind
class Registry;

} // namespace strata_ecs
