/// @file reconciliation_queue.cpp
/// @brief ReconciliationQueue implementation

#include <simcore/net/reconciliation_queue.hpp>
#include <simcore/net/transport.hpp>
#include <simcore/core/log.hpp>

#include <exception>

namespace sim_net {

using sim_core::Err;
using sim_core::Error;
using sim_core::GameTick;
using sim_core::Ok;
using sim_core::Result;
using sim_core::SessionError;

const char* message_type_name(EntityMessageType type) {
    switch (type) {
        case EntityMessageType::Error: return "Error";
        case EntityMessageType::SystemMessage: return "SystemMessage";
    }
    return "Unknown";
}

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Connecting: return "Connecting";
        case SessionStatus::Connected: return "Connected";
        case SessionStatus::InGame: return "InGame";
        case SessionStatus::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

ReconciliationQueue::ReconciliationQueue(const ITransport& transport, const sim_core::FaultPolicy& faults)
    : m_transport(transport)
    , m_faults(faults) {}

// =============================================================================
// Receipt
// =============================================================================

void ReconciliationQueue::post(InboundMessage message) {
    std::lock_guard<std::mutex> lock(m_inbox_mutex);
    m_inbox.push_back(std::move(message));
}

ReconciliationQueue::size_type ReconciliationQueue::pump(GameTick now) {
    std::vector<InboundMessage> received;
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        received.swap(m_inbox);
    }

    for (auto& message : received) {
        handle_message(std::move(message), now);
    }
    return received.size();
}

void ReconciliationQueue::handle_message(InboundMessage message, GameTick now) {
    message.arrival = m_next_arrival++;

    if (message.source_tick <= now) {
        if (message.source_tick < now) {
            ++m_stats.late;
            if (m_log_late) {
                sim_core::net_logger()->warn(
                    "Got late entity message! Diff: {}, msgT: {}, cT: {}, session: {}",
                    static_cast<std::int64_t>(message.source_tick.value) - static_cast<std::int64_t>(now.value),
                    message.source_tick.value, now.value, message.session);
            }
        }
        dispatch(message);
        return;
    }

    ++m_stats.deferred;
    m_queue.push(std::move(message));
}

ReconciliationQueue::size_type ReconciliationQueue::release_due(GameTick now) {
    size_type released = 0;
    while (!m_queue.empty() && m_queue.top().source_tick <= now) {
        InboundMessage message = m_queue.top();
        m_queue.pop();
        ++released;
        dispatch(message);
    }
    return released;
}

void ReconciliationQueue::dispatch(const InboundMessage& message) {
    // Don't look up the session once the client disconnected
    if (!m_transport.is_connected(message.session)) {
        ++m_stats.dropped;
        sim_core::log_structured(*sim_core::net_logger(), spdlog::level::trace, "Dropped entity message",
            {{"session", std::to_string(message.session)}, {"reason", "disconnected"},
             {"source_tick", message.source_tick.to_string()}});
        return;
    }

    auto watermark = m_watermarks.find(message.session);
    if (watermark == m_watermarks.end()) {
        ++m_stats.dropped;
        sim_core::log_structured(*sim_core::net_logger(), spdlog::level::warn, "Dropped entity message",
            {{"session", std::to_string(message.session)}, {"reason", "no connect notification"},
             {"source_tick", message.source_tick.to_string()}});
        return;
    }

    if (message.sequence != 0 && watermark->second < message.sequence) {
        watermark->second = message.sequence;
    }

    if (!m_dispatcher) {
        ++m_stats.dropped;
        return;
    }

    ++m_stats.dispatched;

    Result<void> result;
    try {
        result = m_dispatcher(message);
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        result = Err(SessionError::dispatch_failed(message.session, e.what()));
    }

    if (!result) {
        Error err = result.error();
        err.with_context("message_type", message_type_name(message.type))
           .with_context("source_tick", message.source_tick.to_string())
           .with_context("sequence", std::to_string(message.sequence));
        m_faults.raise(err, *sim_core::net_logger());
    }
}

// =============================================================================
// Sessions
// =============================================================================

void ReconciliationQueue::on_session_connected(SessionId session) {
    auto [it, inserted] = m_watermarks.emplace(session, 0);
    if (!inserted) {
        sim_core::net_logger()->warn("{}", SessionError::already_connected(session).message);
    }
}

void ReconciliationQueue::on_session_disconnected(SessionId session) {
    m_watermarks.erase(session);
}

Result<std::uint32_t> ReconciliationQueue::last_sequence(SessionId session) const {
    auto it = m_watermarks.find(session);
    if (it == m_watermarks.end()) {
        return Err<std::uint32_t>(SessionError::unknown_session(session));
    }
    return it->second;
}

// =============================================================================
// Queries
// =============================================================================

ReconciliationQueue::size_type ReconciliationQueue::inbox_count() const {
    std::lock_guard<std::mutex> lock(m_inbox_mutex);
    return m_inbox.size();
}

std::optional<GameTick> ReconciliationQueue::next_due_tick() const {
    if (m_queue.empty()) {
        return std::nullopt;
    }
    return m_queue.top().source_tick;
}

void ReconciliationQueue::clear() {
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        m_inbox.clear();
    }
    m_queue = decltype(m_queue){};
}

} // namespace sim_net
