#pragma once

/// @file column.hpp
/// @brief Type-erased growable column storage for strata_ecs
///
/// A Column owns a contiguous raw buffer holding elements of exactly one
/// type, fixed at construction by a ColumnLayout. Typed calls check the
/// caller's type against the layout's type tag; a mismatch, an index past
/// the live length or an allocation failure is fatal.
///
/// Growth multiplies the capacity by 1.5 (minimum 8 slots). Bitwise
/// relocatable elements first try an in-place resize through the allocator
/// and fall back to allocate + byte copy + release. Other elements are moved
/// one by one into a fresh block. Capacity never shrinks.

#include "fwd.hpp"
#include "component.hpp"

#include <strata/core/fatal.hpp>
#include <strata/memory/allocator.hpp>

#include <cstddef>
#include <iterator>
#include <limits>
#include <new>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata_ecs {

// =============================================================================
// ColumnView
// =============================================================================

/// Length-bounded typed view over the live elements of a column
///
/// Must not be kept across a structural change of the column (push, grow,
/// swap_remove, clear). For zero-sized element types every index refers to
/// the same shared instance.
template<typename T>
class ColumnView {
public:
    using value_type = std::remove_cv_t<T>;
    using size_type = std::size_t;
    using reference = T&;
    using pointer = T*;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::remove_cv_t<T>;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() noexcept = default;
        iterator(const ColumnView* view, size_type index) noexcept
            : m_view(view), m_index(index) {}

        [[nodiscard]] reference operator*() const { return (*m_view)[m_index]; }
        [[nodiscard]] pointer operator->() const { return &(*m_view)[m_index]; }

        iterator& operator++() noexcept {
            ++m_index;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            ++m_index;
            return tmp;
        }

        [[nodiscard]] bool operator==(const iterator& other) const noexcept {
            return m_index == other.m_index;
        }

        [[nodiscard]] bool operator!=(const iterator& other) const noexcept {
            return m_index != other.m_index;
        }

    private:
        const ColumnView* m_view = nullptr;
        size_type m_index = 0;
    };

    ColumnView() noexcept = default;

    ColumnView(T* data, size_type len, bool zero_sized) noexcept
        : m_data(data), m_len(len), m_zero_sized(zero_sized) {}

    [[nodiscard]] size_type size() const noexcept { return m_len; }
    [[nodiscard]] bool empty() const noexcept { return m_len == 0; }

    /// Element access (index checked)
    [[nodiscard]] reference operator[](size_type index) const {
        STRATA_VERIFY(index < m_len, "ColumnView index out of bounds");
        return m_zero_sized ? *m_data : m_data[index];
    }

    [[nodiscard]] reference front() const { return (*this)[0]; }
    [[nodiscard]] reference back() const { return (*this)[m_len - 1]; }

    [[nodiscard]] iterator begin() const noexcept { return iterator(this, 0); }
    [[nodiscard]] iterator end() const noexcept { return iterator(this, m_len); }

    /// Copy the viewed elements into a vector
    [[nodiscard]] std::vector<value_type> to_vector() const {
        return std::vector<value_type>(begin(), end());
    }

private:
    T* m_data = nullptr;
    size_type m_len = 0;
    bool m_zero_sized = false;
};

// =============================================================================
// Column
// =============================================================================

/// Type-erased storage for elements of a single type
class Column {
public:
    using size_type = std::size_t;

    /// Capacity reported for zero-sized element types
    static constexpr size_type UNBOUNDED = std::numeric_limits<size_type>::max();

    /// Capacity of the first block a growth allocates
    static constexpr size_type MIN_CAPACITY = 8;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create a column for the given layout
    ///
    /// Allocates exactly initial_capacity slots unless it is 0 or the element
    /// type is zero-sized, in which case nothing is allocated.
    explicit Column(ColumnLayout layout,
                    size_type initial_capacity = 0,
                    strata_memory::IAllocator& allocator = strata_memory::default_allocator());

    /// Create a column for a component type
    template<Component T>
    [[nodiscard]] static Column of(size_type initial_capacity = 0,
                                   strata_memory::IAllocator& allocator = strata_memory::default_allocator()) {
        return Column(ColumnLayout::of<T>(), initial_capacity, allocator);
    }

    /// Destructor - finalizes live elements in index order, then frees the buffer
    ~Column();

    // Non-copyable (owns raw storage)
    Column(const Column&) = delete;
    Column& operator=(const Column&) = delete;

    // Movable
    Column(Column&& other) noexcept;
    Column& operator=(Column&& other) noexcept;

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] const ColumnLayout& layout() const noexcept { return m_layout; }

    /// Number of live elements
    [[nodiscard]] size_type size() const noexcept { return m_len; }

    /// Alias for size()
    [[nodiscard]] size_type len() const noexcept { return m_len; }

    [[nodiscard]] bool empty() const noexcept { return m_len == 0; }

    /// Slots available before the next growth (UNBOUNDED for zero-sized types)
    [[nodiscard]] size_type capacity() const noexcept {
        return m_layout.is_zero_sized() ? UNBOUNDED : m_capacity;
    }

    [[nodiscard]] bool is_zero_sized() const noexcept { return m_layout.is_zero_sized(); }

    /// Raw buffer (null until the first allocation, always null when zero-sized)
    [[nodiscard]] const std::byte* data() const noexcept { return m_data; }

    [[nodiscard]] strata_memory::IAllocator& allocator() const noexcept { return *m_allocator; }

    /// Check whether the column stores T
    template<typename T>
    [[nodiscard]] bool holds() const noexcept {
        return m_layout.holds<T>();
    }

    // =========================================================================
    // Typed Operations
    // =========================================================================

    /// Append a value, growing first if the column is full
    template<typename T>
    void push(T value) {
        verify_type<T>("push");

        if constexpr (!is_zero_sized_v<T>) {
            if (m_len == m_capacity) {
                grow();
            }
            ::new (slot(m_len)) T(std::move(value));
        }

        ++m_len;
    }

    /// Swap the value at index for a new one
    /// @return The previous value
    template<typename T>
    [[nodiscard]] T replace(size_type index, T value) {
        verify_type<T>("replace");
        verify_index(index, "replace");

        if constexpr (is_zero_sized_v<T>) {
            return value;
        } else {
            T* stored = std::launder(reinterpret_cast<T*>(slot(index)));
            T previous(std::move(*stored));
            stored->~T();
            ::new (slot(index)) T(std::move(value));
            return previous;
        }
    }

    /// Get typed element at index
    template<typename T>
    [[nodiscard]] const T& get(size_type index) const {
        verify_type<T>("get");
        verify_index(index, "get");

        if constexpr (is_zero_sized_v<T>) {
            return detail::zero_sized_instance<T>();
        } else {
            return *std::launder(reinterpret_cast<const T*>(slot(index)));
        }
    }

    /// Get mutable typed element at index
    template<typename T>
    [[nodiscard]] T& get(size_type index) {
        verify_type<T>("get");
        verify_index(index, "get");

        if constexpr (is_zero_sized_v<T>) {
            return detail::zero_sized_instance<T>();
        } else {
            return *std::launder(reinterpret_cast<T*>(slot(index)));
        }
    }

    /// Read-only view over the live elements
    template<typename T>
    [[nodiscard]] ColumnView<const T> view() const {
        verify_type<T>("view");
        if constexpr (is_zero_sized_v<T>) {
            return ColumnView<const T>(&detail::zero_sized_instance<T>(), m_len, true);
        } else {
            return ColumnView<const T>(typed_data<const T>(), m_len, false);
        }
    }

    /// Mutable view over the live elements
    template<typename T>
    [[nodiscard]] ColumnView<T> view_mut() {
        verify_type<T>("view_mut");
        if constexpr (is_zero_sized_v<T>) {
            return ColumnView<T>(&detail::zero_sized_instance<T>(), m_len, true);
        } else {
            return ColumnView<T>(typed_data<T>(), m_len, false);
        }
    }

    /// Move every live element out in index order and empty the column
    ///
    /// Capacity is kept.
    template<typename T>
    [[nodiscard]] std::vector<T> drain() {
        verify_type<T>("drain");

        std::vector<T> out;
        out.reserve(m_len);

        if constexpr (is_zero_sized_v<T>) {
            out.resize(m_len);
        } else {
            for (size_type i = 0; i < m_len; ++i) {
                T* element = std::launder(reinterpret_cast<T*>(slot(i)));
                out.push_back(std::move(*element));
                element->~T();
            }
        }

        m_len = 0;
        return out;
    }

    // =========================================================================
    // Untyped Operations
    // =========================================================================

    /// Remove the element at index in O(1)
    ///
    /// The element is finalized; the last element (if different) is
    /// relocated into its slot. Any external mapping from the old last index
    /// must be fixed up by the caller.
    void swap_remove(size_type index);

    /// Finalize every live element in index order; capacity is kept
    void clear();

    /// Make room for at least min_capacity elements without further growth
    void reserve(size_type min_capacity);

private:
    template<typename T>
    void verify_type(const char* operation) const {
        static_assert(Component<std::remove_cv_t<T>>, "column elements must satisfy Component");
        if (!m_layout.holds<T>()) {
            type_mismatch(operation, typeid(std::remove_cv_t<T>).name());
        }
    }

    void verify_index(size_type index, const char* operation) const;

    template<typename T>
    [[nodiscard]] T* typed_data() const noexcept {
        if (!m_data) {
            return nullptr;
        }
        return std::launder(reinterpret_cast<T*>(m_data));
    }

    [[noreturn]] void type_mismatch(const char* operation, const char* requested) const;

    /// Grow by the 1.5x policy
    void grow();

    /// Reallocate the buffer to exactly new_capacity slots
    void grow_to(size_type new_capacity);

    /// Allocate a block or die
    [[nodiscard]] std::byte* allocate_or_die(size_type bytes) const;

    /// Finalize and release everything
    void release() noexcept;

    [[nodiscard]] std::byte* slot(size_type index) noexcept {
        return m_data + index * m_layout.size;
    }

    [[nodiscard]] const std::byte* slot(size_type index) const noexcept {
        return m_data + index * m_layout.size;
    }

    ColumnLayout m_layout;
    std::byte* m_data = nullptr;
    size_type m_len = 0;
    size_type m_capacity = 0;
    strata_memory::IAllocator* m_allocator;
};

} // namespace strata_ecs
