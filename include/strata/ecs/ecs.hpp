#pragma once

/// @file ecs.hpp
/// @brief Main include file for strata_ecs
///
/// Storage layers, bottom up:
/// - Column: type-erased growable storage for one element type
/// - SparseSet<T>: entity -> dense slot index over a Column
/// - Registry: one locked SparseSet per component kind, plus entity ids

#include "fwd.hpp"
#include "entity.hpp"
#include "component.hpp"
#include "column.hpp"
#include "sparse_set.hpp"
#include "registry.hpp"

namespace strata_ecs {

/// Module version string
[[nodiscard]] const char* version() noexcept;

/// Module name
[[nodiscard]] const char* module_name() noexcept;

/// Prelude namespace for commonly used types
namespace prelude {
    using strata_ecs::Entity;
    using strata_ecs::Column;
    using strata_ecs::ColumnLayout;
    using strata_ecs::ColumnView;
    using strata_ecs::SparseSet;
    using strata_ecs::Entry;
    using strata_ecs::Drained;
    using strata_ecs::Registry;
    using strata_ecs::ReadGuard;
    using strata_ecs::WriteGuard;
}

} // namespace strata_ecs
