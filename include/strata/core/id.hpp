#pragma once

/// @file id.hpp
/// @brief Monotonic identifier allocation for strata_core

#include "fwd.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace strata_core {

// =============================================================================
// IdAllocator
// =============================================================================

/// Thread-safe monotonic identifier allocator
///
/// Issues strictly increasing 64-bit identifiers starting at FIRST_ID.
/// The value 0 is never issued and serves as the "no id" sentinel.
/// Identifiers are never recycled and the allocator cannot be reset.
class IdAllocator {
public:
    /// Sentinel value, never issued
    static constexpr std::uint64_t NULL_ID = 0;

    /// First identifier handed out by a fresh allocator
    static constexpr std::uint64_t FIRST_ID = 1;

    IdAllocator() noexcept : m_next(FIRST_ID) {}

    // Non-copyable, non-movable (shared by reference)
    IdAllocator(const IdAllocator&) = delete;
    IdAllocator& operator=(const IdAllocator&) = delete;
    IdAllocator(IdAllocator&&) = delete;
    IdAllocator& operator=(IdAllocator&&) = delete;

    /// Allocate the next identifier (thread-safe)
    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

    /// Allocate a contiguous batch of identifiers
    /// @return First identifier; the batch is [first, first + count)
    [[nodiscard]] std::uint64_t next_batch(std::uint64_t count) noexcept {
        return m_next.fetch_add(count, std::memory_order_relaxed);
    }

    /// Make sure no identifier <= id is issued from now on
    ///
    /// Used after loading persisted identifiers. Never moves backwards.
    void advance_past(std::uint64_t id) noexcept {
        std::uint64_t current = m_next.load(std::memory_order_relaxed);
        while (current <= id &&
               !m_next.compare_exchange_weak(current, id + 1, std::memory_order_relaxed)) {
        }
    }

    /// Next identifier that would be issued (approximate under contention)
    [[nodiscard]] std::uint64_t peek() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

    /// Number of identifiers issued or skipped so far
    [[nodiscard]] std::uint64_t issued() const noexcept {
        return peek() - FIRST_ID;
    }

private:
    std::atomic<std::uint64_t> m_next;
};

// =============================================================================
// ID Parsing (Implemented in id.cpp)
// =============================================================================

/// Parse a persisted identifier
///
/// Accepts decimal digits only; rejects empty input, signs, zero and values
/// that overflow 64 bits.
/// @return Parsed identifier, or Error(StoreError::invalid_entity)
Result<std::uint64_t> parse_id(const std::string& text);

} // namespace strata_core
