#pragma once

/// @file config.hpp
/// @brief Runtime configuration loaded from JSON

#include "fwd.hpp"
#include "error.hpp"
#include "fault.hpp"
#include "log.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace sim_core {

/// Configuration of the entity runtime
///
/// JSON layout:
/// ```json
/// {
///   "fault_mode": "tolerant",
///   "log_late_messages": true,
///   "entity_capacity": 4096,
///   "logging": { "level": "info", "console": true, "file": false,
///                "directory": "logs", "max_file_size": 10485760, "max_files": 5 }
/// }
/// ```
/// Every key is optional.
struct RuntimeConfig {
    FaultMode fault_mode = k_default_fault_mode;
    bool log_late_messages = false;
    std::size_t entity_capacity = 1024;
    LogConfig logging;

    [[nodiscard]] static Result<RuntimeConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static Result<RuntimeConfig> from_json_string(const std::string& json_str);
    [[nodiscard]] static Result<RuntimeConfig> load(const std::filesystem::path& path);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Parse fault mode name ("tolerant" / "strict")
[[nodiscard]] Result<FaultMode> parse_fault_mode(const std::string& str);

} // namespace sim_core
