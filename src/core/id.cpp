/// @file id.cpp
/// @brief Identifier parsing for strata_core

#include <strata/core/id.hpp>
#include <strata/core/error.hpp>

#include <charconv>

namespace strata_core {

Result<std::uint64_t> parse_id(const std::string& text) {
    if (text.empty()) {
        return Err<std::uint64_t>(StoreError::invalid_entity(text));
    }

    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    // from_chars rejects leading '+' and '-' for unsigned targets
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return Err<std::uint64_t>(StoreError::invalid_entity(text));
    }

    if (value == IdAllocator::NULL_ID) {
        return Err<std::uint64_t>(StoreError::invalid_entity(text));
    }

    return Ok(value);
}

} // namespace strata_core
