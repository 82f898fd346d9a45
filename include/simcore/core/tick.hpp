#pragma once

/// @file tick.hpp
/// @brief Simulation tick type and clock interface

#include "fwd.hpp"
#include <cstdint>
#include <compare>
#include <functional>
#include <string>

namespace sim_core {

// =============================================================================
// GameTick
// =============================================================================

/// Discrete simulation time unit
struct GameTick {
    std::uint32_t value = 0;

    constexpr GameTick() noexcept = default;
    constexpr explicit GameTick(std::uint32_t v) noexcept : value(v) {}

    /// Tick zero, used for "never modified"
    [[nodiscard]] static constexpr GameTick zero() noexcept { return GameTick{0}; }

    /// First tick a running simulation reports
    [[nodiscard]] static constexpr GameTick first() noexcept { return GameTick{1}; }

    [[nodiscard]] constexpr GameTick next() const noexcept { return GameTick{value + 1}; }

    constexpr auto operator<=>(const GameTick&) const noexcept = default;
    constexpr bool operator==(const GameTick&) const noexcept = default;

    [[nodiscard]] std::string to_string() const { return std::to_string(value); }
};

// =============================================================================
// ITickClock
// =============================================================================

/// Read-only view of the simulation clock
class ITickClock {
public:
    virtual ~ITickClock() = default;

    /// Current simulation tick
    [[nodiscard]] virtual GameTick current_tick() const = 0;
};

/// Clock advanced explicitly by its owner (the host loop or a test)
class ManualTickClock : public ITickClock {
public:
    ManualTickClock() = default;
    explicit ManualTickClock(GameTick start) : m_tick(start) {}

    [[nodiscard]] GameTick current_tick() const override { return m_tick; }

    void set(GameTick tick) { m_tick = tick; }

    GameTick advance() {
        m_tick = m_tick.next();
        return m_tick;
    }

private:
    GameTick m_tick{GameTick::first()};
};

} // namespace sim_core

template<>
struct std::hash<sim_core::GameTick> {
    [[nodiscard]] std::size_t operator()(const sim_core::GameTick& t) const noexcept {
        return std::hash<std::uint32_t>{}(t.value);
    }
};
