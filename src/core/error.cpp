/// @file error.cpp
/// @brief Error codes, chain formatting and error counters for strata_core

#include <strata/core/error.hpp>

#include <atomic>
#include <sstream>

namespace strata_core {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::Unknown: break;
    }
    return "Unknown";
}

ErrorCode StoreError::code() const noexcept {
    switch (kind) {
        case Kind::InvalidEntity: return ErrorCode::InvalidArgument;
        case Kind::MalformedData:
        case Kind::ComponentDecode: return ErrorCode::ParseError;
        case Kind::NameConflict: return ErrorCode::AlreadyExists;
        case Kind::UnknownComponent: return ErrorCode::NotFound;
        case Kind::IncompatibleVersion: return ErrorCode::IncompatibleVersion;
    }
    return ErrorCode::Unknown;
}

ErrorCode ConfigError::code() const noexcept {
    switch (kind) {
        case Kind::FileNotFound: return ErrorCode::IOError;
        case Kind::ParseFailed: return ErrorCode::ParseError;
        case Kind::WrongType:
        case Kind::InvalidValue: return ErrorCode::ValidationError;
    }
    return ErrorCode::Unknown;
}

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] " << error.message();

    // Store errors carry their subject outside the message
    if (const auto* store = error.as<StoreError>()) {
        if (!store->component.empty()) {
            oss << " (component: " << store->component << ")";
        }
        if (!store->key.empty()) {
            oss << " (key: " << store->key << ")";
        }
    }

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }
    return oss.str();
}

// =============================================================================
// Error Counters
// =============================================================================

namespace debug {

namespace {

std::atomic<std::uint64_t> s_total{0};
std::atomic<std::uint64_t> s_store{0};
std::atomic<std::uint64_t> s_config{0};
std::atomic<std::uint64_t> s_other{0};

} // anonymous namespace

void record_error(const Error& error) {
    s_total.fetch_add(1, std::memory_order_relaxed);
    auto& bucket = error.is<StoreError>() ? s_store : error.is<ConfigError>() ? s_config : s_other;
    bucket.fetch_add(1, std::memory_order_relaxed);
}

ErrorCounts error_counts() {
    return ErrorCounts{
        s_total.load(std::memory_order_relaxed),
        s_store.load(std::memory_order_relaxed),
        s_config.load(std::memory_order_relaxed),
        s_other.load(std::memory_order_relaxed),
    };
}

void reset_error_counts() {
    for (auto* counter : {&s_total, &s_store, &s_config, &s_other}) {
        counter->store(0, std::memory_order_relaxed);
    }
}

} // namespace debug

} // namespace strata_core
