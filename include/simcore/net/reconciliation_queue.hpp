#pragma once

/// @file reconciliation_queue.hpp
/// @brief Orders inbound entity messages against the local tick
///
/// Messages stamped with a tick at or before the current tick dispatch
/// immediately; later ones wait in a (tick, sequence) ordered heap until
/// their tick comes up. Transport threads hand messages over through
/// post(); everything else runs on the simulation thread.

#include "fwd.hpp"
#include "message.hpp"
#include <simcore/core/error.hpp>
#include <simcore/core/fault.hpp>
#include <simcore/core/tick.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace sim_net {

class ReconciliationQueue {
public:
    using size_type = std::size_t;

    /// Delivers a message to its subscribers; an error is a dispatch fault
    using Dispatcher = std::function<sim_core::Result<void>(const InboundMessage&)>;

    struct Stats {
        std::uint64_t dispatched = 0;
        std::uint64_t deferred = 0;
        std::uint64_t late = 0;
        std::uint64_t dropped = 0;
    };

    ReconciliationQueue(const ITransport& transport, const sim_core::FaultPolicy& faults);

    ReconciliationQueue(const ReconciliationQueue&) = delete;
    ReconciliationQueue& operator=(const ReconciliationQueue&) = delete;

    void set_dispatcher(Dispatcher dispatcher) { m_dispatcher = std::move(dispatcher); }
    void set_log_late_messages(bool enabled) noexcept { m_log_late = enabled; }
    [[nodiscard]] bool log_late_messages() const noexcept { return m_log_late; }

    // =========================================================================
    // Receipt
    // =========================================================================

    /// Hand over a message from any thread
    void post(InboundMessage message);

    /// Receive everything posted so far; returns the number received
    size_type pump(sim_core::GameTick now);

    /// Receive one message on the simulation thread
    void handle_message(InboundMessage message, sim_core::GameTick now);

    /// Dispatch queued messages with tick <= now in (tick, sequence) order
    size_type release_due(sim_core::GameTick now);

    // =========================================================================
    // Sessions
    // =========================================================================

    /// Seed the session's watermark with 0
    void on_session_connected(SessionId session);

    /// Forget the session's watermark
    void on_session_disconnected(SessionId session);

    /// Highest sequence dispatched for a session; fails with UnknownSession
    [[nodiscard]] sim_core::Result<std::uint32_t> last_sequence(SessionId session) const;

    [[nodiscard]] bool has_session(SessionId session) const {
        return m_watermarks.count(session) != 0;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Messages waiting for their tick
    [[nodiscard]] size_type pending_count() const noexcept { return m_queue.size(); }

    /// Messages posted but not yet pumped
    [[nodiscard]] size_type inbox_count() const;

    /// Tick of the earliest waiting message, if any
    [[nodiscard]] std::optional<sim_core::GameTick> next_due_tick() const;

    [[nodiscard]] const Stats& stats() const noexcept { return m_stats; }

    /// Drop waiting and posted messages (watermarks are kept)
    void clear();

private:
    void dispatch(const InboundMessage& message);

    const ITransport& m_transport;
    const sim_core::FaultPolicy& m_faults;
    Dispatcher m_dispatcher;
    bool m_log_late = false;

    mutable std::mutex m_inbox_mutex;
    std::vector<InboundMessage> m_inbox;

    std::priority_queue<InboundMessage, std::vector<InboundMessage>, InboundMessageLater> m_queue;
    std::unordered_map<SessionId, std::uint32_t> m_watermarks;
    std::uint64_t m_next_arrival = 0;
    Stats m_stats;
};

} // namespace sim_net
