#pragma once

/// @file message.hpp
/// @brief Entity network message envelopes for sim_net

#include "fwd.hpp"
#include <simcore/core/tick.hpp>
#include <simcore/event/event_bus.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <typeindex>
#include <typeinfo>

namespace sim_net {

// =============================================================================
// SessionMessage
// =============================================================================

/// A system message paired with the session that sent it
///
/// Raised alongside the bare payload for every inbound system message, so
/// handlers that need the sender subscribe to SessionMessage<T>.
template<typename T>
struct SessionMessage {
    SessionId session = 0;
    T message;
};

// =============================================================================
// SystemMessage
// =============================================================================

/// Type-erased system message payload
///
/// Built from the concrete payload type, which is what lets the receiver
/// raise SessionMessage<T> without runtime reflection.
class SystemMessage {
public:
    SystemMessage() : m_type(typeid(void)) {}

    template<typename T>
    [[nodiscard]] static SystemMessage create(T payload) {
        SystemMessage msg;
        auto data = std::make_shared<const T>(std::move(payload));
        msg.m_type = std::type_index(typeid(T));
        msg.m_data = data;
        msg.m_raise = [data](sim_event::EntityEventBus& bus, SessionId session) {
            bus.raise_event(*data, sim_event::EventSource::Network);
            bus.raise_event(SessionMessage<T>{session, *data}, sim_event::EventSource::Network);
        };
        return msg;
    }

    [[nodiscard]] bool has_value() const noexcept { return m_data != nullptr; }
    [[nodiscard]] std::type_index type() const noexcept { return m_type; }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return m_data != nullptr && m_type == std::type_index(typeid(T));
    }

    template<typename T>
    [[nodiscard]] const T* try_get() const noexcept {
        return is<T>() ? static_cast<const T*>(m_data.get()) : nullptr;
    }

    /// Raise the payload and its SessionMessage on the bus (network source)
    void raise(sim_event::EntityEventBus& bus, SessionId session) const {
        if (m_raise) {
            m_raise(bus, session);
        }
    }

private:
    std::type_index m_type;
    std::shared_ptr<const void> m_data;
    std::function<void(sim_event::EntityEventBus&, SessionId)> m_raise;
};

// =============================================================================
// Envelopes
// =============================================================================

/// Kind of entity network message
enum class EntityMessageType : std::uint8_t {
    Error = 0,
    SystemMessage,
};

[[nodiscard]] const char* message_type_name(EntityMessageType type);

/// Message received from a session
struct InboundMessage {
    sim_core::GameTick source_tick;

    /// Per-session monotonic sequence; 0 = unsequenced
    std::uint32_t sequence = 0;

    SessionId session = 0;
    EntityMessageType type = EntityMessageType::SystemMessage;
    SystemMessage payload;

    /// Receipt order, assigned by the queue
    std::uint64_t arrival = 0;
};

/// Message sent to one or all sessions
struct OutboundMessage {
    sim_core::GameTick source_tick;
    EntityMessageType type = EntityMessageType::SystemMessage;
    SystemMessage payload;
};

/// Heap comparator: earliest (tick, sequence) on top
struct InboundMessageLater {
    [[nodiscard]] bool operator()(const InboundMessage& a, const InboundMessage& b) const noexcept {
        return std::tie(a.source_tick, a.sequence, a.arrival) > std::tie(b.source_tick, b.sequence, b.arrival);
    }
};

} // namespace sim_net
