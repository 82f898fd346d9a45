#pragma once

/// @file transport.hpp
/// @brief Transport-level collaborators of the entity network layer

#include "fwd.hpp"
#include "message.hpp"

namespace sim_net {

/// Connection state reported by the transport
enum class SessionStatus : std::uint8_t {
    Connecting = 0,
    Connected,
    InGame,
    Disconnected,
};

[[nodiscard]] const char* session_status_name(SessionStatus status);

/// Message channel to the connected sessions
class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual bool is_connected(SessionId session) const = 0;

    virtual void send_to_all(const OutboundMessage& message) = 0;
    virtual void send_to_one(SessionId session, const OutboundMessage& message) = 0;
};

/// Sink for broadcast messages that belong in a replay
class IReplayRecorder {
public:
    virtual ~IReplayRecorder() = default;

    virtual void record(const OutboundMessage& message) = 0;
};

} // namespace sim_net
