#pragma once

/// @file error.hpp
/// @brief Error handling types for sim_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace sim_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    CreationFailed,
    Inconsistent,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CreationFailed: return "CreationFailed";
        case ErrorCode::Inconsistent: return "Inconsistent";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Entity, component and identifier errors
struct EntityError {
    enum class Kind : std::uint8_t {
        UnknownId,                   // Id lookup miss
        DuplicateComponent,          // Component type already present on entity
        NotFound,                    // Component absent
        InvalidLifecycleTransition,  // Lifecycle call from the wrong stage
        EntityCreationFailure,       // Load/initialize failure (entity rolled back)
        StructuralInconsistency,     // Hierarchy repaired in place
        DuplicateBinding,            // Entity or network id already bound
        MandatoryComponent,          // Metadata/transform cannot be removed
    };

    Kind kind;
    std::string message;
    std::string entity;     // Descriptive string of the entity involved
    std::string component;  // Component name, where relevant

    [[nodiscard]] static EntityError unknown_id(const std::string& id) {
        return EntityError{Kind::UnknownId, "Unknown id: " + id, id, {}};
    }

    [[nodiscard]] static EntityError duplicate_component(const std::string& entity, const std::string& comp) {
        return EntityError{Kind::DuplicateComponent,
            "Component '" + comp + "' already present on " + entity, entity, comp};
    }

    [[nodiscard]] static EntityError not_found(const std::string& entity, const std::string& comp) {
        return EntityError{Kind::NotFound,
            "Component '" + comp + "' not found on " + entity, entity, comp};
    }

    [[nodiscard]] static EntityError invalid_transition(const std::string& entity,
                                                        const std::string& expected,
                                                        const std::string& found) {
        return EntityError{Kind::InvalidLifecycleTransition,
            "Invalid lifecycle transition on " + entity + ": expected " + expected + ", was " + found,
            entity, {}};
    }

    [[nodiscard]] static EntityError creation_failure(const std::string& entity, const std::string& reason) {
        return EntityError{Kind::EntityCreationFailure,
            "Failed to create " + entity + ": " + reason, entity, {}};
    }

    [[nodiscard]] static EntityError structural_inconsistency(const std::string& entity, const std::string& reason) {
        return EntityError{Kind::StructuralInconsistency,
            "Structural inconsistency on " + entity + ": " + reason, entity, {}};
    }

    [[nodiscard]] static EntityError duplicate_binding(const std::string& id) {
        return EntityError{Kind::DuplicateBinding, "Id already bound: " + id, id, {}};
    }

    [[nodiscard]] static EntityError mandatory_component(const std::string& entity, const std::string& comp) {
        return EntityError{Kind::MandatoryComponent,
            "Component '" + comp + "' is mandatory and cannot be removed from " + entity, entity, comp};
    }
};

/// Event bus errors
struct EventError {
    enum class Kind : std::uint8_t {
        CyclicOrdering,   // before/after constraints form a cycle
        AlreadyOrdered,   // calc_ordering called twice
        UnknownSubscription,
    };

    Kind kind;
    std::string message;
    std::string event_type;

    [[nodiscard]] static EventError cyclic_ordering(const std::string& event_type) {
        return EventError{Kind::CyclicOrdering,
            "Cyclic subscriber ordering for event " + event_type, event_type};
    }

    [[nodiscard]] static EventError already_ordered() {
        return EventError{Kind::AlreadyOrdered, "Subscriber ordering already calculated", {}};
    }

    [[nodiscard]] static EventError unknown_subscription(std::uint64_t id) {
        return EventError{Kind::UnknownSubscription,
            "Unknown subscription: " + std::to_string(id), {}};
    }
};

/// Network session errors
struct SessionError {
    enum class Kind : std::uint8_t {
        UnknownSession,
        AlreadyConnected,
        DispatchFailed,
    };

    Kind kind;
    std::string message;
    std::uint32_t session = 0;

    [[nodiscard]] static SessionError unknown_session(std::uint32_t session) {
        return SessionError{Kind::UnknownSession,
            "Unknown session: " + std::to_string(session), session};
    }

    [[nodiscard]] static SessionError already_connected(std::uint32_t session) {
        return SessionError{Kind::AlreadyConnected,
            "Session already connected: " + std::to_string(session), session};
    }

    [[nodiscard]] static SessionError dispatch_failed(std::uint32_t session, const std::string& reason) {
        return SessionError{Kind::DispatchFailed,
            "Dispatch failed for session " + std::to_string(session) + ": " + reason, session};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseFailed,
        InvalidValue,
        FileNotFound,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse config: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& value) {
        return ConfigError{Kind::InvalidValue,
            "Invalid value for '" + key + "': " + value, key};
    }

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        EntityError,
        EventError,
        SessionError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(EntityError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(EventError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SessionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True if this is an EntityError of the given kind
    [[nodiscard]] bool is_entity_error(EntityError::Kind kind) const {
        const auto* e = as<EntityError>();
        return e != nullptr && e->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(EntityError::Kind kind) {
        switch (kind) {
            case EntityError::Kind::UnknownId: return ErrorCode::NotFound;
            case EntityError::Kind::DuplicateComponent: return ErrorCode::AlreadyExists;
            case EntityError::Kind::NotFound: return ErrorCode::NotFound;
            case EntityError::Kind::InvalidLifecycleTransition: return ErrorCode::InvalidState;
            case EntityError::Kind::EntityCreationFailure: return ErrorCode::CreationFailed;
            case EntityError::Kind::StructuralInconsistency: return ErrorCode::Inconsistent;
            case EntityError::Kind::DuplicateBinding: return ErrorCode::AlreadyExists;
            case EntityError::Kind::MandatoryComponent: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(EventError::Kind kind) {
        switch (kind) {
            case EventError::Kind::CyclicOrdering: return ErrorCode::InvalidArgument;
            case EventError::Kind::AlreadyOrdered: return ErrorCode::InvalidState;
            case EventError::Kind::UnknownSubscription: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SessionError::Kind kind) {
        switch (kind) {
            case SessionError::Kind::UnknownSession: return ErrorCode::NotFound;
            case SessionError::Kind::AlreadyConnected: return ErrorCode::AlreadyExists;
            case SessionError::Kind::DispatchFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::FileNotFound: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap (throws if error)
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind and context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded structural inconsistencies
std::uint64_t structural_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace sim_core
