/// @file entity_network_manager.cpp
/// @brief EntityNetworkManager implementation

#include <simcore/net/entity_network_manager.hpp>
#include <simcore/core/log.hpp>

namespace sim_net {

using sim_core::Err;
using sim_core::Ok;
using sim_core::Result;
using sim_core::SessionError;

EntityNetworkManager::EntityNetworkManager(sim_ecs::EntityManager& entities, ITransport& transport,
                                           const sim_core::RuntimeConfig& config)
    : m_entities(entities)
    , m_transport(transport)
    , m_queue(transport, entities.fault_policy()) {
    m_queue.set_log_late_messages(config.log_late_messages);
    m_queue.set_dispatcher([this](const InboundMessage& message) { return dispatch(message); });
}

void EntityNetworkManager::tick_update() {
    const sim_core::GameTick now = m_entities.current_tick();
    m_queue.pump(now);
    m_queue.release_due(now);

    m_entities.tick_update();
}

void EntityNetworkManager::receive(InboundMessage message) {
    m_queue.handle_message(std::move(message), m_entities.current_tick());
}

void EntityNetworkManager::on_session_status_changed(SessionId session, SessionStatus status) {
    switch (status) {
        case SessionStatus::Connected:
            m_queue.on_session_connected(session);
            break;
        case SessionStatus::Disconnected:
            m_queue.on_session_disconnected(session);
            break;
        default:
            break;
    }
    sim_core::net_logger()->debug("Session {} is now {}", session, session_status_name(status));
}

Result<void> EntityNetworkManager::dispatch(const InboundMessage& message) {
    if (message.type != EntityMessageType::SystemMessage) {
        return Err(SessionError::dispatch_failed(message.session,
            std::string("unsupported message type ") + message_type_name(message.type)));
    }
    if (!message.payload.has_value()) {
        return Err(SessionError::dispatch_failed(message.session, "empty system message"));
    }

    // The bus logs and skips throwing subscribers; report them here as one fault
    auto& bus = m_entities.event_bus();
    const auto failures_before = bus.subscriber_failure_count();
    message.payload.raise(bus, message.session);

    const auto failed = bus.subscriber_failure_count() - failures_before;
    if (failed != 0) {
        return Err(SessionError::dispatch_failed(message.session,
            std::to_string(failed) + " subscriber(s) threw"));
    }
    return Ok();
}

void EntityNetworkManager::send_to_all(SystemMessage payload, bool record_replay) {
    OutboundMessage message;
    message.source_tick = m_entities.current_tick();
    message.type = EntityMessageType::SystemMessage;
    message.payload = std::move(payload);

    if (record_replay && m_replay != nullptr) {
        m_replay->record(message);
    }
    m_transport.send_to_all(message);
}

void EntityNetworkManager::send_to_one(SystemMessage payload, SessionId session) {
    OutboundMessage message;
    message.source_tick = m_entities.current_tick();
    message.type = EntityMessageType::SystemMessage;
    message.payload = std::move(payload);

    m_transport.send_to_one(session, message);
}

} // namespace sim_net
