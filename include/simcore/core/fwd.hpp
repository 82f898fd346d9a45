#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sim_core module

#include <cstdint>

namespace sim_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct EntityError;
struct EventError;
struct SessionError;
struct ConfigError;
class Error;
class Fault;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Fault Handling
// =============================================================================

enum class FaultMode : std::uint8_t;
class FaultPolicy;

// =============================================================================
// Timing
// =============================================================================

struct GameTick;
class ITickClock;
class ManualTickClock;

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig;
struct RuntimeConfig;

} // namespace sim_core
