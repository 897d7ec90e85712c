/// @file column.cpp
/// @brief Column storage management for strata_ecs

#include <strata/ecs/column.hpp>
#include <strata/core/log.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace strata_ecs {

// =============================================================================
// Construction / Destruction
// =============================================================================

Column::Column(ColumnLayout layout, size_type initial_capacity, strata_memory::IAllocator& allocator)
    : m_layout(std::move(layout))
    , m_allocator(&allocator)
{
    if (!m_layout.is_zero_sized() && initial_capacity > 0) {
        grow_to(initial_capacity);
    }
}

Column::~Column() {
    release();
}

Column::Column(Column&& other) noexcept
    : m_layout(std::move(other.m_layout))
    , m_data(other.m_data)
    , m_len(other.m_len)
    , m_capacity(other.m_capacity)
    , m_allocator(other.m_allocator)
{
    other.m_data = nullptr;
    other.m_len = 0;
    other.m_capacity = 0;
}

Column& Column::operator=(Column&& other) noexcept {
    if (this != &other) {
        release();
        m_layout = std::move(other.m_layout);
        m_data = other.m_data;
        m_len = other.m_len;
        m_capacity = other.m_capacity;
        m_allocator = other.m_allocator;
        other.m_data = nullptr;
        other.m_len = 0;
        other.m_capacity = 0;
    }
    return *this;
}

void Column::release() noexcept {
    if (m_layout.drop_fn) {
        for (size_type i = 0; i < m_len; ++i) {
            m_layout.drop_fn(slot(i));
        }
    }
    m_len = 0;

    if (m_data) {
        m_allocator->deallocate(m_data, m_capacity * m_layout.size, m_layout.align);
        m_data = nullptr;
    }
    m_capacity = 0;
}

// =============================================================================
// Removal
// =============================================================================

void Column::swap_remove(size_type index) {
    verify_index(index, "swap_remove");

    const size_type last = m_len - 1;

    if (!m_layout.is_zero_sized()) {
        std::byte* target = slot(index);

        if (m_layout.drop_fn) {
            m_layout.drop_fn(target);
        }

        if (index != last) {
            std::byte* source = slot(last);
            if (m_layout.relocate_fn) {
                m_layout.relocate_fn(target, source);
            } else {
                std::memcpy(target, source, m_layout.size);
            }
        }
    }

    m_len = last;
}

void Column::clear() {
    if (m_layout.drop_fn) {
        for (size_type i = 0; i < m_len; ++i) {
            m_layout.drop_fn(slot(i));
        }
    }
    m_len = 0;
}

// =============================================================================
// Growth
// =============================================================================

void Column::reserve(size_type min_capacity) {
    if (m_layout.is_zero_sized() || min_capacity <= m_capacity) {
        return;
    }
    grow_to(min_capacity);
}

void Column::grow() {
    if (!m_data) {
        grow_to(MIN_CAPACITY);
        return;
    }
    // A capacity of 1 would not move under old + old/2
    grow_to(std::max(m_capacity + m_capacity / 2, m_capacity + 1));
}

void Column::grow_to(size_type new_capacity) {
    const size_type elem_size = m_layout.size;

    STRATA_VERIFY(new_capacity <= UNBOUNDED / elem_size,
        "Column capacity overflow for " + m_layout.name);

    const size_type old_bytes = m_capacity * elem_size;
    const size_type new_bytes = new_capacity * elem_size;

    if (!m_data) {
        m_data = allocate_or_die(new_bytes);
    } else if (m_layout.is_bitwise_relocatable()) {
        void* resized = m_allocator->reallocate(m_data, old_bytes, new_bytes, m_layout.align);
        if (resized) {
            m_data = static_cast<std::byte*>(resized);
        } else {
            // Elements keep living; their bytes move to the new block
            std::byte* fresh = allocate_or_die(new_bytes);
            std::memcpy(fresh, m_data, m_len * elem_size);
            m_allocator->deallocate(m_data, old_bytes, m_layout.align);
            m_data = fresh;
        }
    } else {
        std::byte* fresh = allocate_or_die(new_bytes);
        for (size_type i = 0; i < m_len; ++i) {
            m_layout.relocate_fn(fresh + i * elem_size, slot(i));
        }
        m_allocator->deallocate(m_data, old_bytes, m_layout.align);
        m_data = fresh;
    }

    strata_core::ecs_logger()->trace("Column<{}> grew {} -> {} slots ({} live)",
        m_layout.name, m_capacity, new_capacity, m_len);

    m_capacity = new_capacity;
}

std::byte* Column::allocate_or_die(size_type bytes) const {
    void* ptr = m_allocator->allocate(bytes, m_layout.align);
    if (!ptr) {
        STRATA_FATAL("Column<" + m_layout.name + "> failed to allocate " +
            std::to_string(bytes) + " bytes");
    }
    return static_cast<std::byte*>(ptr);
}

// =============================================================================
// Checks
// =============================================================================

void Column::verify_index(size_type index, const char* operation) const {
    if (index >= m_len) {
        STRATA_FATAL(std::string("Column<") + m_layout.name + ">::" + operation +
            " index " + std::to_string(index) + " out of bounds (len " + std::to_string(m_len) + ")");
    }
}

void Column::type_mismatch(const char* operation, const char* requested) const {
    STRATA_FATAL(std::string("Column<") + m_layout.name + ">::" + operation +
        " called with mismatched type " + requested);
}

} // namespace strata_ecs
