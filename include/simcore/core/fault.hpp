#pragma once

/// @file fault.hpp
/// @brief Central tolerant/strict decision for recoverable runtime faults
///
/// A handful of call sites in the runtime detect programmer errors that
/// the simulation can survive (deleting an entity that is already being
/// deleted, a network message handler throwing). Whether such a fault is
/// logged and ignored or propagated to the caller is decided here, once,
/// from RuntimeConfig::fault_mode.

#include "fwd.hpp"
#include "error.hpp"

#include <spdlog/logger.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace sim_core {

/// Fault handling mode
enum class FaultMode : std::uint8_t {
    Tolerant,  ///< Log the fault and continue
    Strict,    ///< Throw sim_core::Fault
};

/// Compile-time default fault mode
#ifdef SIM_STRICT_FAULTS
inline constexpr FaultMode k_default_fault_mode = FaultMode::Strict;
#else
inline constexpr FaultMode k_default_fault_mode = FaultMode::Tolerant;
#endif

[[nodiscard]] const char* fault_mode_name(FaultMode mode);

/// Exception raised for faults in strict mode
class Fault : public std::runtime_error {
public:
    explicit Fault(Error error);

    [[nodiscard]] const Error& error() const noexcept { return m_error; }

private:
    Error m_error;
};

/// Decides whether a detected fault is tolerated or propagated
class FaultPolicy {
public:
    FaultPolicy() = default;
    explicit FaultPolicy(FaultMode mode) : m_mode(mode) {}

    [[nodiscard]] FaultMode mode() const noexcept { return m_mode; }
    void set_mode(FaultMode mode) noexcept { m_mode = mode; }

    [[nodiscard]] bool is_strict() const noexcept { return m_mode == FaultMode::Strict; }

    /// Record and log a fault; throws Fault in strict mode
    void raise(const Error& error, spdlog::logger& logger) const;

    /// Number of faults tolerated so far
    [[nodiscard]] std::uint64_t tolerated_count() const noexcept { return m_tolerated; }

private:
    FaultMode m_mode = k_default_fault_mode;
    mutable std::uint64_t m_tolerated = 0;
};

} // namespace sim_core
