#pragma once

/// @file entity_network_manager.hpp
/// @brief Networked front end of the entity runtime
///
/// Drives one simulation tick: receive posted messages, release those that
/// came due, then run EntityManager::tick_update(). Inbound system messages
/// are raised on the event bus as both T and SessionMessage<T>, with
/// EventSource::Network.

#include "fwd.hpp"
#include "message.hpp"
#include "reconciliation_queue.hpp"
#include "transport.hpp"
#include <simcore/core/config.hpp>
#include <simcore/core/error.hpp>
#include <simcore/ecs/entity_manager.hpp>

#include <cstdint>

namespace sim_net {

class EntityNetworkManager {
public:
    EntityNetworkManager(sim_ecs::EntityManager& entities, ITransport& transport,
                         const sim_core::RuntimeConfig& config = sim_core::RuntimeConfig{});

    EntityNetworkManager(const EntityNetworkManager&) = delete;
    EntityNetworkManager& operator=(const EntityNetworkManager&) = delete;

    void set_replay_recorder(IReplayRecorder* recorder) noexcept { m_replay = recorder; }

    [[nodiscard]] ReconciliationQueue& queue() noexcept { return m_queue; }
    [[nodiscard]] const ReconciliationQueue& queue() const noexcept { return m_queue; }
    [[nodiscard]] sim_ecs::EntityManager& entities() noexcept { return m_entities; }

    // =========================================================================
    // Tick
    // =========================================================================

    /// Receive, release due messages, then tick the entity manager
    void tick_update();

    // =========================================================================
    // Inbound
    // =========================================================================

    /// Hand over a message received by the transport (any thread)
    void post(InboundMessage message) { m_queue.post(std::move(message)); }

    /// Receive a message on the simulation thread, bypassing the inbox
    void receive(InboundMessage message);

    void on_session_status_changed(SessionId session, SessionStatus status);

    /// Highest sequence dispatched for a session; fails with UnknownSession
    [[nodiscard]] sim_core::Result<std::uint32_t> last_message_sequence(SessionId session) const {
        return m_queue.last_sequence(session);
    }

    // =========================================================================
    // Outbound
    // =========================================================================

    /// Send to every session, stamped with the current tick
    template<typename T>
    void send_system_message(T message, bool record_replay = true) {
        send_to_all(SystemMessage::create(std::move(message)), record_replay);
    }

    /// Send to one session, stamped with the current tick
    template<typename T>
    void send_system_message_to(T message, SessionId session) {
        send_to_one(SystemMessage::create(std::move(message)), session);
    }

private:
    void send_to_all(SystemMessage payload, bool record_replay);
    void send_to_one(SystemMessage payload, SessionId session);

    sim_core::Result<void> dispatch(const InboundMessage& message);

    sim_ecs::EntityManager& m_entities;
    ITransport& m_transport;
    IReplayRecorder* m_replay = nullptr;
    ReconciliationQueue m_queue;
};

} // namespace sim_net
