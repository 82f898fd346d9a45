#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle state machine, termination and deferred deletion
///
/// EntityManager owns every piece of entity state: the id allocator, the
/// component registry and store, the event bus and the hierarchy tracker.
/// External code reads through the query functions and mutates through
/// lifecycle operations only.
///
/// Manager lifecycle: initialize() -> startup() -> tick_update()... ->
/// shutdown(). Entity deletion is ignored until startup() has run.

#include "fwd.hpp"
#include "component.hpp"
#include "component_store.hpp"
#include "entity.hpp"
#include "hierarchy.hpp"
#include "metadata.hpp"
#include "services.hpp"
#include "transform.hpp"
#include <simcore/core/config.hpp>
#include <simcore/core/error.hpp>
#include <simcore/core/fault.hpp>
#include <simcore/core/tick.hpp>
#include <simcore/event/event_bus.hpp>

#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sim_ecs {

// =============================================================================
// EntityDescriptor
// =============================================================================

/// Human readable identity of an entity, valid for just-deleted entities
struct EntityDescriptor {
    EntityUid uid;
    bool deleted = true;
    std::string name;
    std::optional<std::string> prototype_id;
    NetEntity net_entity;

    /// e.g. "crate (12/n7, Crate)" or "12/n7 D" once deleted
    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// EntityManager
// =============================================================================

class EntityManager {
public:
    using size_type = std::size_t;

    explicit EntityManager(const sim_core::ITickClock& clock,
                           const sim_core::RuntimeConfig& config = sim_core::RuntimeConfig{});
    ~EntityManager();

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    // =========================================================================
    // Services
    // =========================================================================

    void set_prototype_loader(IPrototypeLoader* loader) noexcept { prototype_loader_ = loader; }
    void set_map_service(IMapService* maps) noexcept { map_service_ = maps; }

    [[nodiscard]] ComponentRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const ComponentRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const ComponentStore& store() const noexcept { return store_; }
    [[nodiscard]] sim_event::EntityEventBus& event_bus() noexcept { return bus_; }
    [[nodiscard]] HierarchyTracker& hierarchy() noexcept { return hierarchy_; }
    [[nodiscard]] const HierarchyTracker& hierarchy() const noexcept { return hierarchy_; }
    [[nodiscard]] const IdAllocator& ids() const noexcept { return ids_; }
    [[nodiscard]] sim_core::FaultPolicy& fault_policy() noexcept { return fault_policy_; }
    [[nodiscard]] const sim_core::ITickClock& clock() const noexcept { return clock_; }

    [[nodiscard]] sim_core::GameTick current_tick() const { return clock_.current_tick(); }

    // =========================================================================
    // Manager Lifecycle
    // =========================================================================

    sim_core::Result<void> initialize();

    /// Compute subscriber ordering; fails on ordering cycles
    sim_core::Result<void> startup();

    /// Queued events, deferred deletions, component cull, gauge update
    void tick_update();

    /// Delete every entity and drop all subscriptions
    void shutdown();

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool is_started() const noexcept { return started_; }

    // =========================================================================
    // Entity Lifecycle
    // =========================================================================

    /// New entity with metadata and transform only (stage Allocated)
    sim_core::Result<EntityUid> allocate(std::optional<std::string> prototype_id = std::nullopt);

    /// Allocate and load prototype components; the entity is deleted and
    /// EntityCreationFailure returned if loading fails
    sim_core::Result<EntityUid> create_entity_uninitialized(
        std::optional<std::string> prototype_id,
        const ComponentOverrides* overrides = nullptr);

    /// Allocated -> Initialized; component initialize hooks in reverse safe order
    sim_core::Result<void> initialize_entity(EntityUid uid);

    /// Initialized -> Started; component startup hooks in reverse safe order
    sim_core::Result<void> start_entity(EntityUid uid);

    /// Started -> MapInitialized; no-op if already MapInitialized
    sim_core::Result<void> run_map_init(EntityUid uid);

    /// Initialize, start and (if the map is ready) map-init; deletes the
    /// entity on any failure
    sim_core::Result<void> initialize_and_start_entity(EntityUid uid, std::optional<MapId> map = std::nullopt);

    /// Create, place and start an entity in one call
    sim_core::Result<EntityUid> spawn_entity(
        std::optional<std::string> prototype_id,
        Vec2 position,
        MapId map = k_nullspace,
        const ComponentOverrides* overrides = nullptr);

    /// Terminate and delete an entity and all of its descendants
    ///
    /// Unknown and already deleted ids are ignored. Deleting an entity that
    /// is already terminating is a fault (see FaultPolicy).
    void delete_entity(EntityUid uid);

    /// Delete at the next tick_update(); no-op if already queued or deleted
    void queue_delete_entity(EntityUid uid);

    [[nodiscard]] bool is_queued_for_deletion(EntityUid uid) const {
        return queued_set_.count(uid) != 0;
    }

    /// Delete every live entity
    void flush_entities();

    // =========================================================================
    // Dirty Tracking
    // =========================================================================

    /// Stamp the entity's last modified tick (once per tick)
    void mark_dirty(EntityUid uid);

    /// Stamp a net-synced component and its entity
    void dirty(EntityUid uid, Component& component);

    // =========================================================================
    // Components
    // =========================================================================

    /// Add a fresh component of a registered type
    ///
    /// Components added to an initialized or started entity catch up on
    /// the hooks they missed.
    sim_core::Result<Component*> add_component(EntityUid uid, ComponentTypeId type);

    /// Add by registered name (used by prototype loaders)
    sim_core::Result<Component*> add_component(EntityUid uid, const std::string& type_name);

    /// Shut down, remove and unlink a component; metadata and transform
    /// cannot be removed
    sim_core::Result<void> remove_component(EntityUid uid, ComponentTypeId type);

    template<ComponentType T>
    sim_core::Result<T*> add_component(EntityUid uid) {
        auto id = registry_.id_of<T>();
        if (!id) {
            return sim_core::Err<T*>(unregistered_type(typeid(T).name()));
        }
        auto result = add_component(uid, *id);
        if (!result) {
            return sim_core::Err<T*>(result.error());
        }
        return static_cast<T*>(*result);
    }

    template<ComponentType T>
    sim_core::Result<void> remove_component(EntityUid uid) {
        auto id = registry_.id_of<T>();
        if (!id) {
            return sim_core::Err(unregistered_type(typeid(T).name()));
        }
        return remove_component(uid, *id);
    }

    template<ComponentType T>
    [[nodiscard]] bool has_component(EntityUid uid) const noexcept {
        return store_.has<T>(uid);
    }

    template<ComponentType T>
    [[nodiscard]] T* try_get_component(EntityUid uid) const noexcept {
        return store_.try_get<T>(uid);
    }

    /// Live component; fails with NotFound
    template<ComponentType T>
    [[nodiscard]] sim_core::Result<T*> get_component(EntityUid uid) const {
        auto id = registry_.id_of<T>();
        if (!id) {
            return sim_core::Err<T*>(unregistered_type(typeid(T).name()));
        }
        auto result = store_.get(uid, *id);
        if (!result) {
            return sim_core::Err<T*>(result.error());
        }
        return static_cast<T*>(*result);
    }

    [[nodiscard]] MetaDataComponent* try_get_metadata(EntityUid uid) const noexcept;
    [[nodiscard]] TransformComponent* try_get_transform(EntityUid uid) const noexcept;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Live (metadata present and not deleted)
    [[nodiscard]] bool entity_exists(EntityUid uid) const noexcept;

    /// Unknown or deleted
    [[nodiscard]] bool deleted(EntityUid uid) const noexcept;

    [[nodiscard]] sim_core::Result<EntityLifeStage> life_stage(EntityUid uid) const;

    [[nodiscard]] bool is_paused(EntityUid uid) const noexcept;
    sim_core::Result<void> set_paused(EntityUid uid, bool paused);

    [[nodiscard]] size_type entity_count() const noexcept { return entities_.size(); }

    /// Live entity ids in ascending order
    [[nodiscard]] std::vector<EntityUid> entities() const;

    [[nodiscard]] sim_core::Result<NetEntity> get_net_entity(EntityUid uid) const { return ids_.resolve(uid); }
    [[nodiscard]] sim_core::Result<EntityUid> get_entity(NetEntity net) const { return ids_.resolve(net); }

    [[nodiscard]] EntityDescriptor describe(EntityUid uid) const;
    [[nodiscard]] std::string to_descriptive_string(EntityUid uid) const { return describe(uid).to_string(); }

    /// Live entity count as of the last tick_update()
    [[nodiscard]] size_type live_entity_gauge() const noexcept { return live_gauge_; }

    /// Hierarchy repairs made during termination since the last call
    [[nodiscard]] std::vector<sim_core::Error> take_structural_repairs();

private:
    sim_core::Result<Component*> add_component_internal(EntityUid uid, ComponentTypeId type,
                                                        std::unique_ptr<Component> instance);

    void flag_termination(EntityUid uid, MetaDataComponent& meta);
    void flag_children(EntityUid uid);
    void delete_recursive(EntityUid uid);
    void clear_ticks(EntityUid uid, const std::string& prototype_id);

    template<typename F>
    void guarded_teardown(EntityUid uid, const char* step, F&& action);

    [[nodiscard]] sim_core::Error unregistered_type(const char* type_name) const;
    [[nodiscard]] sim_core::Result<MetaDataComponent*> live_metadata(EntityUid uid) const;

    const sim_core::ITickClock& clock_;
    sim_core::FaultPolicy fault_policy_;

    ComponentRegistry registry_;
    ComponentStore store_;
    sim_event::EntityEventBus bus_;
    HierarchyTracker hierarchy_;
    IdAllocator ids_;

    IPrototypeLoader* prototype_loader_ = nullptr;
    IMapService* map_service_ = nullptr;

    std::unordered_set<EntityUid> entities_;
    std::deque<EntityUid> queued_deletions_;
    std::unordered_set<EntityUid> queued_set_;
    std::vector<sim_core::Error> structural_repairs_;

    size_type live_gauge_ = 0;
    bool initialized_ = false;
    bool started_ = false;
};

} // namespace sim_ecs
