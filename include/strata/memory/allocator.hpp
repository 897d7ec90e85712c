#pragma once

/// @file allocator.hpp
/// @brief Raw allocator interface for strata_memory
///
/// Column storage is built on this interface: plain byte blocks with an
/// explicit size and alignment, plus an optional resize that preserves the
/// block's bytes. Allocators report failure with nullptr; deciding whether a
/// failure is fatal is left to the caller.

#include "fwd.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace strata_memory {

// =============================================================================
// Alignment Utilities
// =============================================================================

/// Align a value up to the given alignment
[[nodiscard]] constexpr std::size_t align_up(std::size_t value, std::size_t align) noexcept {
    return (value + align - 1) & ~(align - 1);
}

/// Align a value down to the given alignment
[[nodiscard]] constexpr std::size_t align_down(std::size_t value, std::size_t align) noexcept {
    return value & ~(align - 1);
}

/// Check if a pointer is aligned
[[nodiscard]] inline bool is_aligned(const void* ptr, std::size_t align) noexcept {
    return (reinterpret_cast<std::uintptr_t>(ptr) & (align - 1)) == 0;
}

/// Check if a value is a power of two
[[nodiscard]] constexpr bool is_power_of_two(std::size_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

// =============================================================================
// Allocator Statistics
// =============================================================================

/// Snapshot of allocator bookkeeping
struct AllocatorStats {
    std::size_t bytes_in_use = 0;
    std::size_t live_blocks = 0;
    std::size_t total_allocations = 0;
    std::size_t total_reallocations = 0;
    std::size_t failed_reallocations = 0;
};

// =============================================================================
// Allocator Interface
// =============================================================================

/// Common interface for raw block allocators
class IAllocator {
public:
    virtual ~IAllocator() = default;

    /// Allocate a block with the given size and alignment
    /// @return Block pointer, or nullptr on failure
    [[nodiscard]] virtual void* allocate(std::size_t size, std::size_t align) = 0;

    /// Resize a block, preserving its first min(old_size, new_size) bytes
    ///
    /// The block may stay at its address or be moved by the allocator.
    /// @return Resized block, or nullptr if the allocator cannot resize it;
    ///         in that case the original block is untouched and still owned
    ///         by the caller.
    [[nodiscard]] virtual void* reallocate(void* ptr, std::size_t old_size,
                                           std::size_t new_size, std::size_t align) = 0;

    /// Release a block
    virtual void deallocate(void* ptr, std::size_t size, std::size_t align) = 0;

    /// Get the currently used memory in bytes
    [[nodiscard]] virtual std::size_t used() const noexcept = 0;

    /// Number of blocks currently allocated
    [[nodiscard]] virtual std::size_t live_blocks() const noexcept = 0;

    /// Check if the allocator has no outstanding blocks
    [[nodiscard]] bool is_empty() const noexcept {
        return live_blocks() == 0;
    }
};

// =============================================================================
// HeapAllocator
// =============================================================================

/// General purpose allocator over the C heap
///
/// Blocks with fundamental alignment are resized with std::realloc. Blocks
/// with extended alignment cannot be resized (reallocate returns nullptr).
class HeapAllocator final : public IAllocator {
public:
    HeapAllocator() = default;

    // Non-copyable (tracks live blocks)
    HeapAllocator(const HeapAllocator&) = delete;
    HeapAllocator& operator=(const HeapAllocator&) = delete;

    [[nodiscard]] void* allocate(std::size_t size, std::size_t align) override;

    [[nodiscard]] void* reallocate(void* ptr, std::size_t old_size,
                                   std::size_t new_size, std::size_t align) override;

    void deallocate(void* ptr, std::size_t size, std::size_t align) override;

    [[nodiscard]] std::size_t used() const noexcept override {
        return m_bytes_in_use.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t live_blocks() const noexcept override {
        return m_live_blocks.load(std::memory_order_relaxed);
    }

    /// Bookkeeping snapshot
    [[nodiscard]] AllocatorStats stats() const noexcept;

private:
    std::atomic<std::size_t> m_bytes_in_use{0};
    std::atomic<std::size_t> m_live_blocks{0};
    std::atomic<std::size_t> m_total_allocations{0};
    std::atomic<std::size_t> m_total_reallocations{0};
    std::atomic<std::size_t> m_failed_reallocations{0};
};

/// Process-wide heap allocator used when no allocator is supplied
[[nodiscard]] IAllocator& default_allocator() noexcept;

} // namespace strata_memory
