/// @file error.cpp
/// @brief Error handling implementation for sim_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error kind names and formatting with context
/// - Explicit template instantiations for common Result types
/// - Error statistics

#include <simcore/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace sim_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* entity_kind_name(EntityError::Kind kind) {
    switch (kind) {
        case EntityError::Kind::UnknownId: return "UnknownId";
        case EntityError::Kind::DuplicateComponent: return "DuplicateComponent";
        case EntityError::Kind::NotFound: return "NotFound";
        case EntityError::Kind::InvalidLifecycleTransition: return "InvalidLifecycleTransition";
        case EntityError::Kind::EntityCreationFailure: return "EntityCreationFailure";
        case EntityError::Kind::StructuralInconsistency: return "StructuralInconsistency";
        case EntityError::Kind::DuplicateBinding: return "DuplicateBinding";
        case EntityError::Kind::MandatoryComponent: return "MandatoryComponent";
    }
    return "Unknown";
}

std::string format_entity_error(const EntityError& err) {
    std::ostringstream oss;
    oss << "[EntityError:" << entity_kind_name(err.kind) << "] " << err.message;
    if (!err.component.empty()) {
        oss << " (component: " << err.component << ")";
    }
    return oss.str();
}

std::string format_event_error(const EventError& err) {
    std::ostringstream oss;
    oss << "[EventError] " << err.message;
    if (!err.event_type.empty()) {
        oss << " (event: " << err.event_type << ")";
    }
    return oss.str();
}

std::string format_session_error(const SessionError& err) {
    std::ostringstream oss;
    oss << "[SessionError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, EntityError>) {
            oss << detail::format_entity_error(err);
        } else if constexpr (std::is_same_v<T, EventError>) {
            oss << detail::format_event_error(err);
        } else if constexpr (std::is_same_v<T, SessionError>) {
            oss << detail::format_session_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> entity_errors{0};
    std::atomic<std::uint64_t> structural_errors{0};
    std::atomic<std::uint64_t> event_errors{0};
    std::atomic<std::uint64_t> session_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (const auto* entity = error.as<EntityError>()) {
        s_error_stats.entity_errors.fetch_add(1, std::memory_order_relaxed);
        if (entity->kind == EntityError::Kind::StructuralInconsistency) {
            s_error_stats.structural_errors.fetch_add(1, std::memory_order_relaxed);
        }
    } else if (error.is<EventError>()) {
        s_error_stats.event_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<SessionError>()) {
        s_error_stats.session_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t structural_error_count() {
    return s_error_stats.structural_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.entity_errors.store(0, std::memory_order_relaxed);
    s_error_stats.structural_errors.store(0, std::memory_order_relaxed);
    s_error_stats.event_errors.store(0, std::memory_order_relaxed);
    s_error_stats.session_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Entity: " << s_error_stats.entity_errors.load() << "\n"
        << "  Structural: " << s_error_stats.structural_errors.load() << "\n"
        << "  Event: " << s_error_stats.event_errors.load() << "\n"
        << "  Session: " << s_error_stats.session_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace sim_core
