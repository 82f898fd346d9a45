/// @file config.cpp
/// @brief Runtime configuration implementation for sim_core

#include <simcore/core/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace sim_core {

Result<FaultMode> parse_fault_mode(const std::string& str) {
    if (str == "tolerant") return FaultMode::Tolerant;
    if (str == "strict") return FaultMode::Strict;
    return Err<FaultMode>(ConfigError::invalid_value("fault_mode", str));
}

namespace {

Result<LogConfig> logging_from_json(const nlohmann::json& j, LogConfig config) {
    if (!j.is_object()) {
        return Err<LogConfig>(ConfigError::invalid_value("logging", j.dump()));
    }

    if (j.contains("level")) {
        auto name = j["level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Err<LogConfig>(ConfigError::invalid_value("logging.level", name));
        }
        config.level = *level;
    }
    if (j.contains("console")) {
        config.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        config.file_enabled = j["file"].get<bool>();
    }
    if (j.contains("directory")) {
        config.log_directory = j["directory"].get<std::string>();
    }
    if (j.contains("max_file_size")) {
        config.max_file_size = j["max_file_size"].get<std::size_t>();
    }
    if (j.contains("max_files")) {
        config.max_files = j["max_files"].get<std::size_t>();
    }

    return config;
}

} // anonymous namespace

Result<RuntimeConfig> RuntimeConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<RuntimeConfig>(ConfigError::parse_failed("root must be an object"));
    }

    RuntimeConfig config;

    try {
        if (j.contains("fault_mode")) {
            auto mode = parse_fault_mode(j["fault_mode"].get<std::string>());
            if (!mode) {
                return Err<RuntimeConfig>(mode.error());
            }
            config.fault_mode = *mode;
        }
        if (j.contains("log_late_messages")) {
            config.log_late_messages = j["log_late_messages"].get<bool>();
        }
        if (j.contains("entity_capacity")) {
            config.entity_capacity = j["entity_capacity"].get<std::size_t>();
        }
        if (j.contains("logging")) {
            auto logging = logging_from_json(j["logging"], config.logging);
            if (!logging) {
                return Err<RuntimeConfig>(logging.error());
            }
            config.logging = std::move(*logging);
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<RuntimeConfig>(ConfigError::parse_failed(e.what()));
    }

    return config;
}

Result<RuntimeConfig> RuntimeConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return Err<RuntimeConfig>(ConfigError::parse_failed(e.what()));
    }
    return from_json(j);
}

Result<RuntimeConfig> RuntimeConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<RuntimeConfig>(ConfigError::file_not_found(path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = from_json_string(content);
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

nlohmann::json RuntimeConfig::to_json() const {
    nlohmann::json j;
    j["fault_mode"] = fault_mode_name(fault_mode);
    j["log_late_messages"] = log_late_messages;
    j["entity_capacity"] = entity_capacity;

    nlohmann::json log_json;
    log_json["level"] = log_level_name(logging.level);
    log_json["console"] = logging.console_enabled;
    log_json["file"] = logging.file_enabled;
    log_json["directory"] = logging.log_directory;
    log_json["max_file_size"] = logging.max_file_size;
    log_json["max_files"] = logging.max_files;
    j["logging"] = log_json;

    return j;
}

} // namespace sim_core
