/// @file event_bus.cpp
/// @brief EntityEventBus implementation

#include <simcore/event/event_bus.hpp>
#include <simcore/core/fault.hpp>
#include <simcore/core/log.hpp>

#include <algorithm>
#include <exception>

namespace sim_event {

using sim_core::Err;
using sim_core::EventError;
using sim_core::Ok;
using sim_core::Result;

const char* event_source_name(EventSource source) {
    switch (source) {
        case EventSource::None: return "None";
        case EventSource::Local: return "Local";
        case EventSource::Network: return "Network";
        case EventSource::All: return "All";
    }
    return "Unknown";
}

namespace {

template<typename H>
bool erase_subscription(std::vector<std::shared_ptr<H>>& list, SubscriptionId id) {
    auto it = std::find_if(list.begin(), list.end(),
        [id](const std::shared_ptr<H>& h) { return h->info.id == id; });
    if (it == list.end()) {
        return false;
    }
    (*it)->info.active = false;
    list.erase(it);
    return true;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

EntityEventBus::EntityEventBus(const sim_ecs::ComponentRegistry& registry, const sim_ecs::ComponentStore& store)
    : m_registry(registry)
    , m_store(store) {}

SubscriptionInfo EntityEventBus::make_info(SubscribeOptions options) {
    SubscriptionInfo info;
    info.id = SubscriptionId(m_next_id++);
    info.name = std::move(options.name);
    info.before = std::move(options.before);
    info.after = std::move(options.after);
    return info;
}

std::string EntityEventBus::describe(EntityUid uid) const {
    if (!uid.is_valid()) {
        return "<no entity>";
    }
    return m_describe ? m_describe(uid) : uid.to_string();
}

void EntityEventBus::log_unregistered(const char* type_name) const {
    sim_core::event_logger()->error("Cannot subscribe to unregistered component type {}", type_name);
}

// =============================================================================
// Subscribing
// =============================================================================

SubscriptionId EntityEventBus::add_broadcast(std::type_index type, std::shared_ptr<BroadcastHandler> entry) {
    SubscriptionId id = entry->info.id;
    auto& list = m_broadcast[type];
    list.push_back(std::move(entry));

    if (m_ordered && !order_subscriptions(list)) {
        sim_core::event_logger()->error(
            "Rejected subscription '{}' to {}: ordering constraints form a cycle",
            list.back()->info.name, type.name());
        list.pop_back();
        return SubscriptionId{};
    }
    return id;
}

SubscriptionId EntityEventBus::add_entity_scoped(EntityUid uid, std::type_index type, std::shared_ptr<EntityHandler> entry) {
    entry->info.id = SubscriptionId(m_next_id++);
    SubscriptionId id = entry->info.id;
    m_entity[uid][type].push_back(std::move(entry));
    return id;
}

SubscriptionId EntityEventBus::add_component_scoped(std::type_index type, std::shared_ptr<ComponentHandler> entry) {
    SubscriptionId id = entry->info.id;
    auto& list = m_component[type];
    list.push_back(std::move(entry));

    if (m_ordered && !order_subscriptions(list)) {
        sim_core::event_logger()->error(
            "Rejected subscription '{}' to local {}: ordering constraints form a cycle",
            list.back()->info.name, type.name());
        list.pop_back();
        return SubscriptionId{};
    }

    m_dispatch_cache.clear();
    return id;
}

Result<void> EntityEventBus::unsubscribe(SubscriptionId id) {
    for (auto& [type, list] : m_broadcast) {
        if (erase_subscription(list, id)) {
            return Ok();
        }
    }

    for (auto& [type, list] : m_component) {
        if (erase_subscription(list, id)) {
            m_dispatch_cache.clear();
            return Ok();
        }
    }

    for (auto& [uid, tables] : m_entity) {
        for (auto& [type, list] : tables) {
            if (erase_subscription(list, id)) {
                return Ok();
            }
        }
    }

    return Err(EventError::unknown_subscription(id.id));
}

// =============================================================================
// Dispatch
// =============================================================================

template<typename F>
void EntityEventBus::invoke_guarded(const SubscriptionInfo& info, std::type_index type, EntityUid origin, F&& call) {
    try {
        call();
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        ++m_failures;
        sim_core::event_logger()->error(
            "Caught exception in subscriber '{}' while dispatching {} for {}: {}",
            info.name.empty() ? "#" + std::to_string(info.id.id) : info.name,
            type.name(), describe(origin), e.what());
    }
}

void EntityEventBus::dispatch_broadcast(std::type_index type, const void* event, EventSource source, EntityUid origin) {
    auto it = m_broadcast.find(type);
    if (it == m_broadcast.end() || it->second.empty()) {
        return;
    }

    // Subscribing or unsubscribing from a handler must not disturb this pass
    const HandlerList<BroadcastHandler> handlers = it->second;
    for (const auto& handler : handlers) {
        if (!handler->info.active || !accepts(handler->sources, source)) {
            continue;
        }
        invoke_guarded(handler->info, type, origin, [&]() { handler->fn(event); });
    }
}

void EntityEventBus::dispatch_local(EntityUid uid, std::type_index type, void* event) {
    auto ent_it = m_entity.find(uid);
    if (ent_it != m_entity.end()) {
        auto type_it = ent_it->second.find(type);
        if (type_it != ent_it->second.end()) {
            const HandlerList<EntityHandler> handlers = type_it->second;
            for (const auto& handler : handlers) {
                if (!handler->info.active) {
                    continue;
                }
                invoke_guarded(handler->info, type, uid, [&]() { handler->fn(uid, event); });
            }
        }
    }

    const HandlerList<ComponentHandler> handlers = component_dispatch(uid, type);
    for (const auto& handler : handlers) {
        if (!handler->info.active) {
            continue;
        }
        // Removed by an earlier subscriber of this pass
        sim_ecs::Component* comp = m_store.try_get(uid, handler->component);
        if (comp == nullptr) {
            continue;
        }
        invoke_guarded(handler->info, type, uid, [&]() { handler->fn(uid, *comp, event); });
    }
}

const EntityEventBus::HandlerList<EntityEventBus::ComponentHandler>&
EntityEventBus::component_dispatch(EntityUid uid, std::type_index type) {
    auto entry = m_dispatch_cache.find(uid);
    if (entry != m_dispatch_cache.end()) {
        auto cached = entry->second.find(type);
        if (cached != entry->second.end()) {
            return cached->second;
        }
    }

    // Unknown and deleted entities are never cached
    const std::vector<sim_ecs::ComponentTypeId> types = m_store.component_types(uid);
    if (types.empty()) {
        return m_no_component_handlers;
    }

    HandlerList<ComponentHandler> table;
    auto it = m_component.find(type);
    if (it != m_component.end() && !it->second.empty()) {
        for (sim_ecs::ComponentTypeId comp : types) {
            for (const auto& handler : it->second) {
                if (handler->component == comp) {
                    table.push_back(handler);
                }
            }
        }
    }

    return m_dispatch_cache[uid].emplace(type, std::move(table)).first->second;
}

void EntityEventBus::process_event_queue() {
    std::vector<std::function<void()>> pending;
    pending.swap(m_queue);

    for (auto& deliver : pending) {
        deliver();
    }
}

// =============================================================================
// Ordering
// =============================================================================

Result<void> EntityEventBus::calc_ordering() {
    if (m_ordered) {
        return Err(EventError::already_ordered());
    }

    for (auto& [type, list] : m_broadcast) {
        if (!order_subscriptions(list)) {
            return Err(EventError::cyclic_ordering(type.name()));
        }
    }

    for (auto& [type, list] : m_component) {
        if (!order_subscriptions(list)) {
            return Err(EventError::cyclic_ordering(type.name()));
        }
    }

    m_dispatch_cache.clear();
    m_ordered = true;
    sim_core::event_logger()->debug("Ordered subscribers for {} broadcast and {} local event types",
        m_broadcast.size(), m_component.size());
    return Ok();
}

// =============================================================================
// Entity Tracking
// =============================================================================

void EntityEventBus::on_entity_added(EntityUid uid) {
    sim_core::event_logger()->trace("Tracking entity {}", uid.to_string());
}

void EntityEventBus::on_entity_deleted(EntityUid uid) {
    auto it = m_entity.find(uid);
    if (it != m_entity.end()) {
        for (auto& [type, list] : it->second) {
            for (auto& handler : list) {
                handler->info.active = false;
            }
        }
        m_entity.erase(it);
    }
    m_dispatch_cache.erase(uid);
}

void EntityEventBus::on_component_added(EntityUid uid, sim_ecs::ComponentTypeId /*type*/) {
    m_dispatch_cache.erase(uid);
}

void EntityEventBus::on_component_removed(EntityUid uid, sim_ecs::ComponentTypeId /*type*/) {
    m_dispatch_cache.erase(uid);
}

void EntityEventBus::clear_event_tables() {
    m_broadcast.clear();
    m_component.clear();
    m_entity.clear();
    m_dispatch_cache.clear();
    m_queue.clear();
    m_ordered = false;
}

EntityEventBus::size_type EntityEventBus::subscription_count() const noexcept {
    size_type count = 0;
    for (const auto& [type, list] : m_broadcast) {
        count += list.size();
    }
    for (const auto& [type, list] : m_component) {
        count += list.size();
    }
    for (const auto& [uid, tables] : m_entity) {
        for (const auto& [type, list] : tables) {
            count += list.size();
        }
    }
    return count;
}

// =============================================================================
// SubscriptionGuard
// =============================================================================

void SubscriptionGuard::reset() {
    if (m_bus != nullptr && m_id.is_valid()) {
        auto result = m_bus->unsubscribe(m_id);
        if (!result) {
            // Entity-scoped subscriptions vanish with their entity
            sim_core::event_logger()->debug("Subscription guard: {}", result.error().message());
        }
    }
    m_bus = nullptr;
    m_id = SubscriptionId{};
}

} // namespace sim_event
