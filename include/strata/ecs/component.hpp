#pragma once

/// @file component.hpp
/// @brief Component type constraints and column layout metadata
///
/// A column stores elements as raw bytes described by a ColumnLayout. The
/// layout carries the runtime type tag checked by every typed column call,
/// plus the functions needed to finalize and relocate elements without
/// knowing their static type.

#include "fwd.hpp"

#include <cstddef>
#include <functional>
#include <new>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace strata_ecs {

// =============================================================================
// Type Traits
// =============================================================================

/// Whether elements of T may be relocated by copying their bytes
///
/// True for trivially copyable types. Specialize to std::true_type for types
/// known to survive a raw byte move (no pointers into their own storage).
/// Types that stay false are relocated with move-construct + destroy.
template<typename T>
struct is_trivially_relocatable : std::bool_constant<std::is_trivially_copyable_v<T>> {};

template<typename T>
inline constexpr bool is_trivially_relocatable_v = is_trivially_relocatable<T>::value;

/// Whether T occupies no storage in a column
///
/// Empty, default-constructible, trivially destructible classes (tags) are
/// stored without memory; only the element count is tracked.
template<typename T>
inline constexpr bool is_zero_sized_v =
    std::is_empty_v<T> && std::is_default_constructible_v<T> && std::is_trivially_destructible_v<T>;

/// Concept for valid component types
template<typename T>
concept Component =
    std::is_object_v<T> &&
    !std::is_pointer_v<T> &&
    !std::is_const_v<T> &&
    !std::is_array_v<T> &&
    std::is_nothrow_destructible_v<T> &&
    std::is_move_constructible_v<T>;

namespace detail {

/// Shared instance handed out for every slot of a zero-sized column
template<typename T>
[[nodiscard]] T& zero_sized_instance() noexcept {
    static T instance{};
    return instance;
}

} // namespace detail

// =============================================================================
// ColumnLayout
// =============================================================================

/// Element metadata for a column
struct ColumnLayout {
    std::type_index type{typeid(void)};
    std::string name;
    std::size_t size{0};
    std::size_t align{1};

    /// Destroy the element at the given address (null for trivially destructible types)
    std::function<void(void*)> drop_fn;

    /// Move the element at src into uninitialized dst and destroy src
    /// (null when a raw byte copy is enough)
    std::function<void(void* dst, void* src)> relocate_fn;

    /// Create the layout for a component type
    template<Component T>
    [[nodiscard]] static ColumnLayout of() {
        ColumnLayout layout;
        layout.type = std::type_index(typeid(T));
        layout.name = typeid(T).name();
        layout.size = is_zero_sized_v<T> ? 0 : sizeof(T);
        layout.align = alignof(T);

        if constexpr (!std::is_trivially_destructible_v<T>) {
            layout.drop_fn = [](void* ptr) {
                std::launder(static_cast<T*>(ptr))->~T();
            };
        }

        if constexpr (!is_zero_sized_v<T> && !is_trivially_relocatable_v<T>) {
            layout.relocate_fn = [](void* dst, void* src) {
                T* from = std::launder(static_cast<T*>(src));
                ::new (dst) T(std::move(*from));
                from->~T();
            };
        }

        return layout;
    }

    /// Create the layout for a component type with a display name
    template<Component T>
    [[nodiscard]] static ColumnLayout named(std::string display_name) {
        ColumnLayout layout = of<T>();
        layout.name = std::move(display_name);
        return layout;
    }

    /// Check whether the layout was created for T
    template<typename T>
    [[nodiscard]] bool holds() const noexcept {
        return type == std::type_index(typeid(std::remove_cv_t<T>));
    }

    /// Whether elements occupy no storage
    [[nodiscard]] bool is_zero_sized() const noexcept {
        return size == 0;
    }

    /// Whether elements can be relocated by copying bytes
    [[nodiscard]] bool is_bitwise_relocatable() const noexcept {
        return relocate_fn == nullptr;
    }
};

} // namespace strata_ecs
