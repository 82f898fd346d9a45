/// @file log.cpp
/// @brief Shared-sink logger registry for sim_core

#include <simcore/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace sim_core {

// =============================================================================
// Logger State
// =============================================================================

namespace {

struct LogState {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    bool sinks_built = false;
};

LogState& state() {
    static LogState s;
    return s;
}

// Caller holds the state mutex
void build_sinks(LogState& s) {
    s.sinks.clear();

    if (s.config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        s.sinks.push_back(std::move(console));
    }

    if (s.config.file_enabled && !s.config.log_directory.empty()) {
        try {
            std::filesystem::create_directories(s.config.log_directory);
            auto path = std::filesystem::path(s.config.log_directory) / k_log_file_name;
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), s.config.max_file_size, s.config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            s.sinks.push_back(std::move(file));
        } catch (const std::exception& e) {
            spdlog::warn("Cannot open log file in '{}': {}", s.config.log_directory, e.what());
        }
    }

    s.sinks_built = true;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }

    s.config = config;
    build_sinks(s);

    for (auto& [name, logger] : s.loggers) {
        logger->sinks() = s.sinks;
        logger->set_level(s.config.level);
    }
}

LogConfig current_log_config() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config;
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.loggers.find(name);
    if (it != s.loggers.end()) {
        return it->second;
    }

    if (!s.sinks_built) {
        build_sinks(s);
    }

    auto logger = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    logger->set_level(s.config.level);
    s.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("sim_core");
}

std::shared_ptr<spdlog::logger> entity_logger() {
    return get_logger("entity");
}

std::shared_ptr<spdlog::logger> event_logger() {
    return get_logger("event");
}

std::shared_ptr<spdlog::logger> net_logger() {
    return get_logger("net.ent");
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config.level = level;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    get_logger(name)->set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

std::string format_fields(
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    if (fields.empty()) {
        return message;
    }

    std::ostringstream oss;
    oss << message << " {";
    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ", ";
        oss << key << "=\"" << value << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

void log_structured(
    spdlog::logger& logger,
    spdlog::level::level_enum level,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    if (!logger.should_log(level)) {
        return;
    }
    logger.log(level, format_fields(message, fields));
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
    s.loggers.clear();
    s.sinks.clear();
    s.sinks_built = false;
}

} // namespace sim_core
