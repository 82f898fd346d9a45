#pragma once

/// @file log.hpp
/// @brief Subsystem loggers for simcore
///
/// Every subsystem logs through a named spdlog logger. All named loggers
/// share one sink set, so a single configure_logging() call redirects the
/// whole runtime (console, rotating file, or both).

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>

namespace sim_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sink and level selection, usually read from the "logging" config block
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// File written by the rotating sink inside LogConfig::log_directory
inline constexpr const char* k_log_file_name = "simcore.log";

/// Rebuild the shared sinks and apply the level to every named logger
void configure_logging(const LogConfig& config);

/// Current configuration
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger bound to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Runtime core ("sim_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Entity manager and lifecycle ("entity")
std::shared_ptr<spdlog::logger> entity_logger();

/// Event bus ("event")
std::shared_ptr<spdlog::logger> event_logger();

/// Network reconciliation ("net.ent")
std::shared_ptr<spdlog::logger> net_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// Override one logger; reset by the next configure_logging/set_global_log_level
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse "trace".."off" (also "warning", "err", "fatal")
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Render `message {key="value", ...}`
[[nodiscard]] std::string format_fields(
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Log a message with key/value fields appended
void log_structured(
    spdlog::logger& logger,
    spdlog::level::level_enum level,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every named logger
void shutdown_logging();

} // namespace sim_core
