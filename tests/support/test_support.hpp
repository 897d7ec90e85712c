#pragma once

/// @file test_support.hpp
/// @brief Shared helpers for strata tests

#include <strata/core/fatal.hpp>
#include <strata/memory/allocator.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace strata_test {

// =============================================================================
// Fatal Conditions
// =============================================================================

/// Thrown by the test fatal handler instead of aborting
struct FatalException : std::runtime_error {
    explicit FatalException(const strata_core::FatalInfo& info)
        : std::runtime_error(info.message) {}
};

[[noreturn]] inline void throwing_fatal_handler(const strata_core::FatalInfo& info) {
    throw FatalException(info);
}

/// Installs the throwing handler for the lifetime of the guard
class ScopedFatalHandler {
public:
    ScopedFatalHandler()
        : m_previous(strata_core::set_fatal_handler(&throwing_fatal_handler)) {}

    ~ScopedFatalHandler() {
        strata_core::set_fatal_handler(m_previous);
    }

    ScopedFatalHandler(const ScopedFatalHandler&) = delete;
    ScopedFatalHandler& operator=(const ScopedFatalHandler&) = delete;

private:
    strata_core::FatalHandler m_previous;
};

// =============================================================================
// Allocators
// =============================================================================

/// Heap allocator with call counting and switchable refusals
class TrackingAllocator final : public strata_memory::IAllocator {
public:
    /// Refuse every in-place resize (forces the relocation path)
    bool refuse_reallocate = false;

    /// Return null from allocate
    bool fail_allocate = false;

    std::size_t allocate_calls = 0;
    std::size_t reallocate_calls = 0;
    std::size_t deallocate_calls = 0;

    [[nodiscard]] void* allocate(std::size_t size, std::size_t align) override {
        ++allocate_calls;
        if (fail_allocate) {
            return nullptr;
        }
        return m_heap.allocate(size, align);
    }

    [[nodiscard]] void* reallocate(void* ptr, std::size_t old_size,
                                   std::size_t new_size, std::size_t align) override {
        ++reallocate_calls;
        if (refuse_reallocate) {
            return nullptr;
        }
        return m_heap.reallocate(ptr, old_size, new_size, align);
    }

    void deallocate(void* ptr, std::size_t size, std::size_t align) override {
        ++deallocate_calls;
        m_heap.deallocate(ptr, size, align);
    }

    [[nodiscard]] std::size_t used() const noexcept override { return m_heap.used(); }
    [[nodiscard]] std::size_t live_blocks() const noexcept override { return m_heap.live_blocks(); }

private:
    strata_memory::HeapAllocator m_heap;
};

// =============================================================================
// Instrumented Components
// =============================================================================

/// Counts live instances and destructor runs
struct Tracked {
    static inline int live = 0;
    static inline int destroyed = 0;

    int value = 0;
    bool moved_from = false;

    static void reset() {
        live = 0;
        destroyed = 0;
    }

    explicit Tracked(int v) : value(v) { ++live; }
    Tracked(const Tracked& other) : value(other.value) { ++live; }
    Tracked(Tracked&& other) noexcept : value(other.value) {
        other.moved_from = true;
        ++live;
    }
    Tracked& operator=(const Tracked&) = default;
    Tracked& operator=(Tracked&&) = default;
    ~Tracked() {
        --live;
        if (!moved_from) {
            ++destroyed;
        }
    }
};

/// Zero-footprint tag component
struct Marker {};

} // namespace strata_test
