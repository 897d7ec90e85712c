#pragma once

/// @file entity.hpp
/// @brief Entity identifier for strata_ecs
///
/// An Entity is a pure key: a 64-bit id with no payload. Ids come from an
/// IdAllocator, start at 1 and are never reused. Id 0 is the null entity.
/// Whether an entity "exists" is decided per component set; there is no
/// global liveness table.

#include "fwd.hpp"
#include <strata/core/id.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace strata_ecs {

// =============================================================================
// Entity
// =============================================================================

struct Entity {
    std::uint64_t id = strata_core::IdAllocator::NULL_ID;

    /// Create null entity
    constexpr Entity() noexcept = default;

    /// Wrap a raw id
    constexpr explicit Entity(std::uint64_t raw) noexcept : id(raw) {}

    /// Null entity factory
    [[nodiscard]] static constexpr Entity null() noexcept {
        return Entity{};
    }

    /// Allocate a fresh entity from an id allocator
    [[nodiscard]] static Entity allocate(strata_core::IdAllocator& ids) noexcept {
        return Entity{ids.next()};
    }

    /// Check if this is the null entity
    [[nodiscard]] constexpr bool is_null() const noexcept {
        return id == strata_core::IdAllocator::NULL_ID;
    }

    /// Check if this is a non-null entity
    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return !is_null();
    }

    /// Explicit bool conversion
    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_valid();
    }

    /// Raw id
    [[nodiscard]] constexpr std::uint64_t value() const noexcept {
        return id;
    }

    /// Comparison operators
    constexpr auto operator<=>(const Entity&) const noexcept = default;
    constexpr bool operator==(const Entity&) const noexcept = default;

    /// Decimal form of the id ("0" for null)
    [[nodiscard]] std::string to_string() const {
        return std::to_string(id);
    }
};

/// Output stream operator (decimal id)
inline std::ostream& operator<<(std::ostream& os, const Entity& e) {
    return os << e.id;
}

// =============================================================================
// JSON Conversion
// =============================================================================

/// Entities serialize as their integer id
inline void to_json(nlohmann::json& j, const Entity& e) {
    j = e.id;
}

/// Entities deserialize from a strictly positive integer
///
/// @throws std::invalid_argument for zero, negative or non-integer input
inline void from_json(const nlohmann::json& j, Entity& e) {
    if (j.is_number_unsigned()) {
        e.id = j.get<std::uint64_t>();
    } else if (j.is_number_integer() && j.get<std::int64_t>() > 0) {
        e.id = static_cast<std::uint64_t>(j.get<std::int64_t>());
    } else {
        throw std::invalid_argument("entity must be a positive integer, got " + j.dump());
    }
    if (e.is_null()) {
        throw std::invalid_argument("entity id 0 is reserved");
    }
}

} // namespace strata_ecs

// =============================================================================
// std::hash Specialization
// =============================================================================

template<>
struct std::hash<strata_ecs::Entity> {
    [[nodiscard]] std::size_t operator()(const strata_ecs::Entity& e) const noexcept {
        return std::hash<std::uint64_t>{}(e.id);
    }
};
