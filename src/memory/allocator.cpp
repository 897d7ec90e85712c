/// @file allocator.cpp
/// @brief Heap allocator implementation for strata_memory

#include <strata/memory/allocator.hpp>
#include <strata/core/log.hpp>

#include <cstdlib>

namespace strata_memory {

namespace {

constexpr std::size_t FUNDAMENTAL_ALIGN = alignof(std::max_align_t);

} // anonymous namespace

void* HeapAllocator::allocate(std::size_t size, std::size_t align) {
    if (size == 0 || !is_power_of_two(align)) {
        return nullptr;
    }

    void* ptr = nullptr;
    if (align <= FUNDAMENTAL_ALIGN) {
        ptr = std::malloc(size);
    } else {
        // aligned_alloc requires the size to be a multiple of the alignment
        ptr = std::aligned_alloc(align, align_up(size, align));
    }

    if (!ptr) {
        strata_core::memory_logger()->error("Heap allocation of {} bytes (align {}) failed", size, align);
        return nullptr;
    }

    m_bytes_in_use.fetch_add(size, std::memory_order_relaxed);
    m_live_blocks.fetch_add(1, std::memory_order_relaxed);
    m_total_allocations.fetch_add(1, std::memory_order_relaxed);
    return ptr;
}

void* HeapAllocator::reallocate(void* ptr, std::size_t old_size, std::size_t new_size, std::size_t align) {
    if (!ptr || new_size == 0) {
        return nullptr;
    }

    if (align > FUNDAMENTAL_ALIGN) {
        // No aligned counterpart to realloc
        m_failed_reallocations.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    void* resized = std::realloc(ptr, new_size);
    if (!resized) {
        m_failed_reallocations.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    m_bytes_in_use.fetch_add(new_size, std::memory_order_relaxed);
    m_bytes_in_use.fetch_sub(old_size, std::memory_order_relaxed);
    m_total_reallocations.fetch_add(1, std::memory_order_relaxed);
    return resized;
}

void HeapAllocator::deallocate(void* ptr, std::size_t size, std::size_t /*align*/) {
    if (!ptr) {
        return;
    }

    std::free(ptr);
    m_bytes_in_use.fetch_sub(size, std::memory_order_relaxed);
    m_live_blocks.fetch_sub(1, std::memory_order_relaxed);
}

AllocatorStats HeapAllocator::stats() const noexcept {
    AllocatorStats s;
    s.bytes_in_use = m_bytes_in_use.load(std::memory_order_relaxed);
    s.live_blocks = m_live_blocks.load(std::memory_order_relaxed);
    s.total_allocations = m_total_allocations.load(std::memory_order_relaxed);
    s.total_reallocations = m_total_reallocations.load(std::memory_order_relaxed);
    s.failed_reallocations = m_failed_reallocations.load(std::memory_order_relaxed);
    return s;
}

IAllocator& default_allocator() noexcept {
    static HeapAllocator allocator;
    return allocator;
}

} // namespace strata_memory
