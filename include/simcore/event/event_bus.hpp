#pragma once

/// @file event_bus.hpp
/// @brief Synchronous entity event bus for sim_event
///
/// Single-threaded dispatch with three subscription scopes:
/// - broadcast: every raised event of a type
/// - entity-scoped: local events raised on one entity
/// - component-scoped: local events raised on any entity owning a component
///
/// Broadcast and component-scoped subscribers may declare before/after
/// constraints by subscriber name; calc_ordering() sorts them once at
/// startup. Subscriber exceptions are caught and logged per subscriber.

#include "fwd.hpp"
#include "ordering.hpp"
#include <simcore/core/error.hpp>
#include <simcore/ecs/component.hpp>
#include <simcore/ecs/component_store.hpp>
#include <simcore/ecs/entity.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sim_event {

using sim_ecs::EntityUid;

// =============================================================================
// EventSource
// =============================================================================

/// Origin of a broadcast event (bitmask for subscription filters)
enum class EventSource : std::uint8_t {
    None = 0,
    Local = 1 << 0,
    Network = 1 << 1,
    All = Local | Network,
};

[[nodiscard]] constexpr bool accepts(EventSource mask, EventSource source) noexcept {
    return (static_cast<std::uint8_t>(mask) & static_cast<std::uint8_t>(source)) != 0;
}

[[nodiscard]] const char* event_source_name(EventSource source);

// =============================================================================
// SubscribeOptions
// =============================================================================

/// Name, ordering constraints and source filter for a subscription
struct SubscribeOptions {
    std::string name;
    std::vector<std::string> before;
    std::vector<std::string> after;
    EventSource sources = EventSource::All;

    [[nodiscard]] static SubscribeOptions named(std::string n) {
        SubscribeOptions opts;
        opts.name = std::move(n);
        return opts;
    }

    SubscribeOptions& runs_before(std::string other) {
        before.push_back(std::move(other));
        return *this;
    }

    SubscribeOptions& runs_after(std::string other) {
        after.push_back(std::move(other));
        return *this;
    }

    SubscribeOptions& from(EventSource mask) {
        sources = mask;
        return *this;
    }
};

// =============================================================================
// EntityEventBus
// =============================================================================

class EntityEventBus : public sim_ecs::IComponentListener {
public:
    using size_type = std::size_t;

    /// Renders an entity for log messages
    using Describer = std::function<std::string(EntityUid)>;

    EntityEventBus(const sim_ecs::ComponentRegistry& registry, const sim_ecs::ComponentStore& store);

    EntityEventBus(const EntityEventBus&) = delete;
    EntityEventBus& operator=(const EntityEventBus&) = delete;

    void set_describer(Describer describer) { m_describe = std::move(describer); }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to every broadcast of E; handler(const E&)
    template<typename E, typename F>
    SubscriptionId subscribe(F&& handler, SubscribeOptions options = {}) {
        auto entry = std::make_shared<BroadcastHandler>();
        entry->sources = options.sources;
        entry->info = make_info(std::move(options));
        entry->fn = [h = std::forward<F>(handler)](const void* event) {
            h(*static_cast<const E*>(event));
        };
        return add_broadcast(std::type_index(typeid(E)), std::move(entry));
    }

    /// Subscribe to local events E raised on one entity; handler(EntityUid, E&)
    template<typename E, typename F>
    SubscriptionId subscribe_local(EntityUid uid, F&& handler) {
        auto entry = std::make_shared<EntityHandler>();
        entry->fn = [h = std::forward<F>(handler)](EntityUid owner, void* event) {
            h(owner, *static_cast<E*>(event));
        };
        return add_entity_scoped(uid, std::type_index(typeid(E)), std::move(entry));
    }

    /// Subscribe to local events E on every entity owning TComp;
    /// handler(EntityUid, TComp&, E&)
    template<typename TComp, typename E, typename F>
    SubscriptionId subscribe_local(F&& handler, SubscribeOptions options = {}) {
        static_assert(std::is_base_of_v<sim_ecs::Component, TComp>, "TComp must be a component");
        auto comp_id = m_registry.id_of<TComp>();
        if (!comp_id) {
            log_unregistered(typeid(TComp).name());
            return SubscriptionId{};
        }

        auto entry = std::make_shared<ComponentHandler>();
        entry->info = make_info(std::move(options));
        entry->component = *comp_id;
        entry->fn = [h = std::forward<F>(handler)](EntityUid owner, sim_ecs::Component& comp, void* event) {
            h(owner, static_cast<TComp&>(comp), *static_cast<E*>(event));
        };
        return add_component_scoped(std::type_index(typeid(E)), std::move(entry));
    }

    /// Remove a subscription of any scope
    sim_core::Result<void> unsubscribe(SubscriptionId id);

    // =========================================================================
    // Raising
    // =========================================================================

    /// Dispatch E to broadcast subscribers now
    template<typename E>
    void raise_event(const E& event, EventSource source = EventSource::Local) {
        dispatch_broadcast(std::type_index(typeid(E)), &event, source, origin_of(event));
    }

    /// Deliver E at the next process_event_queue()
    template<typename E>
    void queue_event(E event, EventSource source = EventSource::Local) {
        m_queue.push_back([this, ev = std::move(event), source]() {
            raise_event(ev, source);
        });
    }

    /// Dispatch events queued before this call
    ///
    /// Events queued by subscribers while processing wait for the next call.
    void process_event_queue();

    /// Dispatch a local event: entity-scoped, then component-scoped in safe
    /// order, then broadcast when requested
    template<typename E>
    void raise_local_event(EntityUid uid, E& event, bool broadcast = false) {
        dispatch_local(uid, std::type_index(typeid(E)), &event);
        if (broadcast) {
            dispatch_broadcast(std::type_index(typeid(E)), &event, EventSource::Local, uid);
        }
    }

    // =========================================================================
    // Ordering
    // =========================================================================

    /// Sort subscribers by their constraints; fails with CyclicOrdering
    sim_core::Result<void> calc_ordering();

    [[nodiscard]] bool is_ordered() const noexcept { return m_ordered; }

    // =========================================================================
    // Entity Tracking
    // =========================================================================

    void on_entity_added(EntityUid uid);

    /// Drops the entity's scoped subscriptions
    void on_entity_deleted(EntityUid uid);

    void on_component_added(EntityUid uid, sim_ecs::ComponentTypeId type) override;
    void on_component_removed(EntityUid uid, sim_ecs::ComponentTypeId type) override;

    /// Drop every subscription, queued event and cache
    void clear_event_tables();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_type subscription_count() const noexcept;
    [[nodiscard]] size_type queued_count() const noexcept { return m_queue.size(); }

    /// Entities with cached component-dispatch tables
    [[nodiscard]] size_type dispatch_cache_size() const noexcept { return m_dispatch_cache.size(); }

    /// Number of subscriber exceptions caught so far
    [[nodiscard]] std::uint64_t subscriber_failure_count() const noexcept { return m_failures; }

private:
    struct BroadcastHandler {
        SubscriptionInfo info;
        EventSource sources = EventSource::All;
        std::function<void(const void*)> fn;
    };

    struct EntityHandler {
        SubscriptionInfo info;
        std::function<void(EntityUid, void*)> fn;
    };

    struct ComponentHandler {
        SubscriptionInfo info;
        sim_ecs::ComponentTypeId component = 0;
        std::function<void(EntityUid, sim_ecs::Component&, void*)> fn;
    };

    template<typename H>
    using HandlerList = std::vector<std::shared_ptr<H>>;

    template<typename E>
    [[nodiscard]] static EntityUid origin_of(const E& event) {
        if constexpr (requires { { event.uid } -> std::convertible_to<EntityUid>; }) {
            return event.uid;
        } else {
            return EntityUid::invalid();
        }
    }

    SubscriptionInfo make_info(SubscribeOptions options);

    SubscriptionId add_broadcast(std::type_index type, std::shared_ptr<BroadcastHandler> entry);
    SubscriptionId add_entity_scoped(EntityUid uid, std::type_index type, std::shared_ptr<EntityHandler> entry);
    SubscriptionId add_component_scoped(std::type_index type, std::shared_ptr<ComponentHandler> entry);

    void dispatch_broadcast(std::type_index type, const void* event, EventSource source, EntityUid origin);
    void dispatch_local(EntityUid uid, std::type_index type, void* event);

    const HandlerList<ComponentHandler>& component_dispatch(EntityUid uid, std::type_index type);

    template<typename F>
    void invoke_guarded(const SubscriptionInfo& info, std::type_index type, EntityUid origin, F&& call);

    void log_unregistered(const char* type_name) const;
    [[nodiscard]] std::string describe(EntityUid uid) const;

    const sim_ecs::ComponentRegistry& m_registry;
    const sim_ecs::ComponentStore& m_store;
    Describer m_describe;

    std::uint64_t m_next_id = 1;
    bool m_ordered = false;
    std::uint64_t m_failures = 0;

    std::unordered_map<std::type_index, HandlerList<BroadcastHandler>> m_broadcast;
    std::unordered_map<std::type_index, HandlerList<ComponentHandler>> m_component;
    std::unordered_map<EntityUid, std::unordered_map<std::type_index, HandlerList<EntityHandler>>> m_entity;

    /// Per-entity, per-event component handlers in safe order
    std::unordered_map<EntityUid, std::unordered_map<std::type_index, HandlerList<ComponentHandler>>> m_dispatch_cache;
    const HandlerList<ComponentHandler> m_no_component_handlers;

    std::vector<std::function<void()>> m_queue;
};

// =============================================================================
// SubscriptionGuard
// =============================================================================

/// Unsubscribes on destruction
class SubscriptionGuard {
public:
    SubscriptionGuard() = default;
    SubscriptionGuard(EntityEventBus& bus, SubscriptionId id) : m_bus(&bus), m_id(id) {}

    ~SubscriptionGuard() { reset(); }

    SubscriptionGuard(const SubscriptionGuard&) = delete;
    SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;

    SubscriptionGuard(SubscriptionGuard&& other) noexcept
        : m_bus(std::exchange(other.m_bus, nullptr)), m_id(std::exchange(other.m_id, SubscriptionId{})) {}

    SubscriptionGuard& operator=(SubscriptionGuard&& other) noexcept {
        if (this != &other) {
            reset();
            m_bus = std::exchange(other.m_bus, nullptr);
            m_id = std::exchange(other.m_id, SubscriptionId{});
        }
        return *this;
    }

    [[nodiscard]] SubscriptionId id() const noexcept { return m_id; }

    /// Forget the subscription without unsubscribing
    SubscriptionId release() noexcept {
        m_bus = nullptr;
        return std::exchange(m_id, SubscriptionId{});
    }

    void reset();

private:
    EntityEventBus* m_bus = nullptr;
    SubscriptionId m_id;
};

} // namespace sim_event
