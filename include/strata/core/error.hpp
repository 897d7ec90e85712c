#pragma once

/// @file error.hpp
/// @brief Recoverable error types for strata_core
///
/// Bad serialized input, bad configuration and name clashes travel as
/// Result<T> carrying an Error. Programming errors (type mismatch, index out
/// of bounds, allocation failure) never reach this header: they go through
/// fatal_error() / STRATA_VERIFY.

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace strata_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category shared by every error kind
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
};

[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;

// =============================================================================
// StoreError
// =============================================================================

/// Failures of the component store: persisted data and kind registration
struct StoreError {
    enum class Kind : std::uint8_t {
        InvalidEntity,        // id zero, negative or not an integer
        MalformedData,        // input has the wrong shape
        ComponentDecode,      // a component value failed to decode
        NameConflict,         // name already bound to another type
        UnknownComponent,     // snapshot names an unregistered kind
        IncompatibleVersion,  // snapshot version mismatch
    };

    Kind kind;
    std::string message;
    std::string component;  // kind name, when known
    std::string key;        // offending key or entity id, when known

    [[nodiscard]] ErrorCode code() const noexcept;

    [[nodiscard]] static StoreError invalid_entity(const std::string& key) {
        return {Kind::InvalidEntity, "Invalid entity id: '" + key + "'", {}, key};
    }

    [[nodiscard]] static StoreError malformed(const std::string& reason) {
        return {Kind::MalformedData, "Malformed data: " + reason, {}, {}};
    }

    [[nodiscard]] static StoreError component_decode(const std::string& key, const std::string& reason) {
        return {Kind::ComponentDecode, "Failed to decode component for entity " + key + ": " + reason, {}, key};
    }

    [[nodiscard]] static StoreError name_conflict(const std::string& name) {
        return {Kind::NameConflict, "Component name already registered for another type: " + name, name, {}};
    }

    [[nodiscard]] static StoreError unknown_component(const std::string& name) {
        return {Kind::UnknownComponent, "Unknown component: " + name, name, {}};
    }

    [[nodiscard]] static StoreError incompatible_version(std::uint64_t expected, std::uint64_t found) {
        return {Kind::IncompatibleVersion,
            "Snapshot version mismatch: expected " + std::to_string(expected) +
            ", found " + std::to_string(found), {}, {}};
    }
};

// =============================================================================
// ConfigError
// =============================================================================

/// Failures while reading a StoreConfig
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        WrongType,
        InvalidValue,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] ErrorCode code() const noexcept;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return {Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return {Kind::ParseFailed, "Config parse failed: " + reason, {}};
    }

    [[nodiscard]] static ConfigError wrong_type(const std::string& key, const std::string& expected) {
        return {Kind::WrongType, "Config key '" + key + "' must be " + expected, key};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& value) {
        return {Kind::InvalidValue, "Config key '" + key + "' has invalid value: " + value, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// One recoverable failure: a typed detail plus free-form context entries
class Error {
public:
    using Detail = std::variant<StoreError, ConfigError, std::string>;

    Error(StoreError err) : m_code(err.code()), m_detail(std::move(err)) {}
    Error(ConfigError err) : m_code(err.code()), m_detail(std::move(err)) {}
    explicit Error(std::string message, ErrorCode code = ErrorCode::Unknown)
        : m_code(code), m_detail(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] const std::string& message() const {
        return std::visit([](const auto& err) -> const std::string& {
            if constexpr (std::is_same_v<std::decay_t<decltype(err)>, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_detail);
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(m_detail); }

    /// Typed detail, or nullptr when the error holds another kind
    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&m_detail); }

    /// Attach a context entry; an existing key is overwritten
    Error& with_context(const std::string& key, std::string value) {
        m_context[key] = std::move(value);
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Detail m_detail;
    std::map<std::string, std::string> m_context;
};

/// "[Code] message" followed by one indented line per context entry
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an error
template<typename T, typename E>
class Result {
public:
    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

private:
    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

private:
    std::optional<E> m_error;
};

template<typename T>
[[nodiscard]] Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

/// Counts of recorded errors, by detail kind
struct ErrorCounts {
    std::uint64_t total = 0;
    std::uint64_t store = 0;
    std::uint64_t config = 0;
    std::uint64_t other = 0;
};

/// Count an error that is about to be returned to a caller
void record_error(const Error& error);

[[nodiscard]] ErrorCounts error_counts();

void reset_error_counts();

} // namespace debug

} // namespace strata_core
