/// @file entity_manager.cpp
/// @brief EntityManager implementation

#include <simcore/ecs/entity_manager.hpp>
#include <simcore/ecs/events.hpp>
#include <simcore/core/log.hpp>

#include <algorithm>
#include <exception>

namespace sim_ecs {

using sim_core::Err;
using sim_core::EntityError;
using sim_core::Error;
using sim_core::ErrorCode;
using sim_core::Ok;
using sim_core::Result;

// =============================================================================
// EntityDescriptor
// =============================================================================

std::string EntityDescriptor::to_string() const {
    std::string ids = uid.to_string() + "/" + net_entity.to_string();
    std::string result;
    if (name.empty()) {
        result = ids;
    } else {
        result = name + " (" + ids;
        if (prototype_id) {
            result += ", " + *prototype_id;
        }
        result += ")";
    }
    if (deleted) {
        result += " D";
    }
    return result;
}

// =============================================================================
// Construction
// =============================================================================

EntityManager::EntityManager(const sim_core::ITickClock& clock, const sim_core::RuntimeConfig& config)
    : clock_(clock)
    , fault_policy_(config.fault_mode)
    , store_(registry_)
    , bus_(registry_, store_)
    , hierarchy_(store_, bus_) {
    store_.set_listener(&bus_);
    bus_.set_describer([this](EntityUid uid) { return to_descriptive_string(uid); });
    entities_.reserve(config.entity_capacity);
}

EntityManager::~EntityManager() {
    store_.set_listener(nullptr);
}

Error EntityManager::unregistered_type(const char* type_name) const {
    return Error(ErrorCode::NotFound, std::string("Component type not registered: ") + type_name);
}

// =============================================================================
// Manager Lifecycle
// =============================================================================

Result<void> EntityManager::initialize() {
    if (initialized_) {
        return Err(Error(ErrorCode::InvalidState, "EntityManager already initialized"));
    }
    initialized_ = true;
    sim_core::entity_logger()->debug("Entity manager initialized ({} component types, fault mode {})",
        registry_.size(), sim_core::fault_mode_name(fault_policy_.mode()));
    return Ok();
}

Result<void> EntityManager::startup() {
    if (!initialized_) {
        return Err(Error(ErrorCode::InvalidState, "EntityManager started before initialize()"));
    }
    if (started_) {
        return Err(Error(ErrorCode::InvalidState, "EntityManager already started"));
    }

    auto ordered = bus_.calc_ordering();
    if (!ordered) {
        sim_core::entity_logger()->error("Startup failed: {}", ordered.error().message());
        return ordered;
    }

    started_ = true;
    return Ok();
}

void EntityManager::tick_update() {
    bus_.process_event_queue();

    while (!queued_deletions_.empty()) {
        EntityUid uid = queued_deletions_.front();
        queued_deletions_.pop_front();
        delete_entity(uid);
    }
    queued_set_.clear();

    store_.cull_removed();
    live_gauge_ = entities_.size();
}

void EntityManager::shutdown() {
    flush_entities();
    bus_.clear_event_tables();
    store_.cull_removed();
    store_.clear();
    ids_.clear_bindings();
    live_gauge_ = 0;
    started_ = false;
    initialized_ = false;
}

// =============================================================================
// Entity Creation
// =============================================================================

Result<EntityUid> EntityManager::allocate(std::optional<std::string> prototype_id) {
    EntityUid uid = ids_.allocate_entity_id();

    // Raised before any component exists
    bus_.raise_event(EntityAddedEvent{uid});
    bus_.on_entity_added(uid);

    NetEntity net = ids_.allocate_network_id();
    auto bound = ids_.bind(uid, net);
    if (!bound) {
        return Err<EntityUid>(bound.error());
    }

    entities_.insert(uid);

    auto meta = std::make_unique<MetaDataComponent>();
    meta->net_entity = net;
    meta->prototype_id = std::move(prototype_id);
    auto meta_added = add_component_internal(uid, ComponentRegistry::k_metadata_type, std::move(meta));
    if (!meta_added) {
        return Err<EntityUid>(meta_added.error());
    }

    auto xform_added = add_component_internal(uid, ComponentRegistry::k_transform_type,
                                              std::make_unique<TransformComponent>());
    if (!xform_added) {
        return Err<EntityUid>(xform_added.error());
    }

    dirty(uid, **meta_added);
    return uid;
}

Result<EntityUid> EntityManager::create_entity_uninitialized(
    std::optional<std::string> prototype_id,
    const ComponentOverrides* overrides)
{
    if (prototype_id && (prototype_loader_ == nullptr || !prototype_loader_->has_prototype(*prototype_id))) {
        return Err<EntityUid>(Error(EntityError::creation_failure(
            "new entity", "unknown prototype '" + *prototype_id + "'")).with_context("prototype", *prototype_id));
    }

    auto allocated = allocate(prototype_id);
    if (!allocated) {
        return allocated;
    }
    EntityUid uid = *allocated;

    if (prototype_loader_ == nullptr || (!prototype_id && overrides == nullptr)) {
        return uid;
    }

    Result<void> loaded;
    try {
        loaded = prototype_loader_->load_components(*this, uid, prototype_id.value_or(""), overrides);
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        loaded = Err(Error(ErrorCode::CreationFailed, e.what()));
    }

    if (!loaded) {
        std::string desc = to_descriptive_string(uid);
        delete_entity(uid);

        Error err(EntityError::creation_failure(desc, loaded.error().message()));
        err.with_context("cause", sim_core::error_code_name(loaded.error().code()));
        if (prototype_id) {
            err.with_context("prototype", *prototype_id);
        }
        sim_core::entity_logger()->error("{}", sim_core::build_error_chain(err));
        return Err<EntityUid>(std::move(err));
    }

    if (prototype_id) {
        clear_ticks(uid, *prototype_id);
    }
    return uid;
}

void EntityManager::clear_ticks(EntityUid uid, const std::string& prototype_id) {
    // State equal to the prototype is what a remote peer deserializes anyway
    for (const auto& name : prototype_loader_->prototype_components(prototype_id)) {
        auto type = registry_.id_by_name(name);
        if (!type) {
            continue;
        }
        Component* comp = store_.try_get(uid, *type);
        if (comp != nullptr && comp->net_sync_enabled) {
            comp->clear_ticks();
        }
    }
}

// =============================================================================
// Lifecycle Transitions
// =============================================================================

Result<MetaDataComponent*> EntityManager::live_metadata(EntityUid uid) const {
    MetaDataComponent* meta = try_get_metadata(uid);
    if (meta == nullptr || meta->entity_deleted()) {
        return Err<MetaDataComponent*>(EntityError::unknown_id(uid.to_string()));
    }
    return meta;
}

Result<void> EntityManager::initialize_entity(EntityUid uid) {
    auto meta = live_metadata(uid);
    if (!meta) {
        return Err(meta.error());
    }
    MetaDataComponent& md = **meta;
    if (md.life_stage != EntityLifeStage::Allocated) {
        return Err(EntityError::invalid_transition(to_descriptive_string(uid),
            to_string(EntityLifeStage::Allocated), to_string(md.life_stage)));
    }

    md.life_stage = EntityLifeStage::Initializing;

    // Reverse safe order: metadata, transform, then the rest
    auto types = store_.component_types(uid);
    std::reverse(types.begin(), types.end());
    try {
        for (ComponentTypeId type : types) {
            Component* comp = store_.try_get(uid, type);
            if (comp != nullptr && comp->life_stage() == ComponentLifeStage::Added) {
                comp->life_initialize(*this);
            }
        }
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        return Err(Error(EntityError::creation_failure(to_descriptive_string(uid), e.what()))
            .with_context("stage", to_string(EntityLifeStage::Initializing)));
    }

    md.life_stage = EntityLifeStage::Initialized;
    bus_.raise_event(EntityInitializedEvent{uid});
    return Ok();
}

Result<void> EntityManager::start_entity(EntityUid uid) {
    auto meta = live_metadata(uid);
    if (!meta) {
        return Err(meta.error());
    }
    MetaDataComponent& md = **meta;
    if (md.life_stage != EntityLifeStage::Initialized) {
        return Err(EntityError::invalid_transition(to_descriptive_string(uid),
            to_string(EntityLifeStage::Initialized), to_string(md.life_stage)));
    }

    md.life_stage = EntityLifeStage::Starting;

    auto types = store_.component_types(uid);
    std::reverse(types.begin(), types.end());
    try {
        for (ComponentTypeId type : types) {
            Component* comp = store_.try_get(uid, type);
            if (comp != nullptr && comp->life_stage() == ComponentLifeStage::Initialized) {
                comp->life_startup(*this);
            }
        }
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        return Err(Error(EntityError::creation_failure(to_descriptive_string(uid), e.what()))
            .with_context("stage", to_string(EntityLifeStage::Starting)));
    }

    md.life_stage = EntityLifeStage::Started;
    return Ok();
}

Result<void> EntityManager::run_map_init(EntityUid uid) {
    auto meta = live_metadata(uid);
    if (!meta) {
        return Err(meta.error());
    }
    MetaDataComponent& md = **meta;
    if (md.life_stage == EntityLifeStage::MapInitialized) {
        return Ok();
    }
    if (md.life_stage != EntityLifeStage::Started) {
        return Err(EntityError::invalid_transition(to_descriptive_string(uid),
            to_string(EntityLifeStage::Started), to_string(md.life_stage)));
    }

    md.life_stage = EntityLifeStage::MapInitialized;
    MapInitEvent event{uid};
    bus_.raise_local_event(uid, event, false);
    return Ok();
}

Result<void> EntityManager::initialize_and_start_entity(EntityUid uid, std::optional<MapId> map) {
    Result<void> result = initialize_entity(uid);
    if (result) {
        result = start_entity(uid);
    }
    if (result) {
        TransformComponent* xform = try_get_transform(uid);
        MapId target = map ? *map : (xform != nullptr ? xform->map_id : k_nullspace);
        if (map_service_ != nullptr && map_service_->is_map_initialized(target)) {
            result = run_map_init(uid);
        }
    }

    if (result) {
        return Ok();
    }

    std::string desc = to_descriptive_string(uid);
    delete_entity(uid);

    if (result.error().is_entity_error(EntityError::Kind::EntityCreationFailure)) {
        sim_core::entity_logger()->error("{}", sim_core::build_error_chain(result.error()));
        return result;
    }

    Error err(EntityError::creation_failure(desc, result.error().message()));
    err.with_context("cause", sim_core::error_code_name(result.error().code()));
    sim_core::entity_logger()->error("{}", sim_core::build_error_chain(err));
    return Err(std::move(err));
}

Result<EntityUid> EntityManager::spawn_entity(
    std::optional<std::string> prototype_id,
    Vec2 position,
    MapId map,
    const ComponentOverrides* overrides)
{
    auto created = create_entity_uninitialized(std::move(prototype_id), overrides);
    if (!created) {
        return created;
    }
    EntityUid uid = *created;

    if (TransformComponent* xform = try_get_transform(uid)) {
        xform->local_position = position;
        xform->map_id = map;
    }

    auto started = initialize_and_start_entity(uid, map);
    if (!started) {
        return Err<EntityUid>(started.error());
    }
    return uid;
}

// =============================================================================
// Deletion
// =============================================================================

template<typename F>
void EntityManager::guarded_teardown(EntityUid uid, const char* step, F&& action) {
    try {
        action();
    } catch (const sim_core::Fault&) {
        throw;
    } catch (const std::exception& e) {
        sim_core::entity_logger()->error("Caught exception while {} {}: {}",
            step, to_descriptive_string(uid), e.what());
    }
}

void EntityManager::delete_entity(EntityUid uid) {
    // Late callers may still delete after shutdown
    if (!started_) {
        return;
    }

    MetaDataComponent* meta = try_get_metadata(uid);
    if (meta == nullptr || meta->entity_deleted()) {
        return;
    }

    if (meta->life_stage == EntityLifeStage::Terminating) {
        Error err(EntityError::invalid_transition(to_descriptive_string(uid),
            "a live entity", to_string(EntityLifeStage::Terminating)));
        err.with_context("operation", "delete_entity");
        fault_policy_.raise(err, *sim_core::entity_logger());
        // Tolerated: the entity is flagged but its children may not be yet
        flag_children(uid);
        delete_recursive(uid);
        return;
    }

    flag_termination(uid, *meta);
    delete_recursive(uid);
}

void EntityManager::flag_termination(EntityUid uid, MetaDataComponent& meta) {
    meta.life_stage = EntityLifeStage::Terminating;

    EntityTerminatingEvent event{uid};
    bus_.raise_local_event(uid, event, true);

    flag_children(uid);
}

void EntityManager::flag_children(EntityUid uid) {
    TransformComponent* xform = try_get_transform(uid);
    if (xform == nullptr) {
        return;
    }

    const std::vector<EntityUid> children = xform->children();
    for (EntityUid child : children) {
        MetaDataComponent* child_meta = try_get_metadata(child);
        if (child_meta == nullptr || child_meta->entity_deleted()) {
            hierarchy_.remove_child_reference(uid, child);

            Error err(EntityError::structural_inconsistency(to_descriptive_string(uid),
                "child " + child.to_string() + " was already deleted"));
            err.with_context("child", child.to_string());
            sim_core::debug::record_error(err);
            sim_core::entity_logger()->error("{}", sim_core::build_error_chain(err));
            structural_repairs_.push_back(std::move(err));
            continue;
        }

        if (child_meta->life_stage == EntityLifeStage::Terminating) {
            continue;
        }
        flag_termination(child, *child_meta);
    }
}

void EntityManager::delete_recursive(EntityUid uid) {
    MetaDataComponent* meta = try_get_metadata(uid);
    if (meta == nullptr || meta->entity_deleted()) {
        return;
    }

    // Detach from the parent first so it never lists a deleted child
    TransformComponent* xform = try_get_transform(uid);
    if (xform != nullptr && xform->parent().is_valid()) {
        guarded_teardown(uid, "detaching", [&]() {
            auto detached = hierarchy_.detach_to_null(uid);
            if (!detached) {
                sim_core::entity_logger()->error("Failed to detach {}: {}",
                    to_descriptive_string(uid), detached.error().message());
            }
        });
    }

    if (xform != nullptr) {
        const std::vector<EntityUid> children = xform->children();
        for (EntityUid child : children) {
            guarded_teardown(child, "deleting", [&]() { delete_recursive(child); });
        }

        if (xform->child_count() != 0) {
            sim_core::entity_logger()->error("Failed to delete all children of {}: {} remain",
                to_descriptive_string(uid), xform->child_count());
        }
    }

    // A hook may have re-entered the deletion of this entity
    if (meta->entity_deleted()) {
        return;
    }

    for (Component* comp : store_.enumerate(uid)) {
        if (comp->running()) {
            guarded_teardown(uid, "shutting down", [&]() { comp->life_shutdown(*this); });
        }
    }

    // Metadata sorts last and is disposed last
    for (ComponentTypeId type : store_.component_types(uid)) {
        Component* comp = store_.try_get(uid, type);
        if (comp == nullptr) {
            continue;
        }
        guarded_teardown(uid, "removing components of", [&]() { comp->life_remove(*this); });
        auto removed = store_.remove(uid, type);
        if (!removed) {
            sim_core::entity_logger()->error("{}", removed.error().message());
        }
    }

    if (meta->entity_deleted()) {
        return;
    }
    meta->life_stage = EntityLifeStage::Deleted;

    bus_.raise_event(EntityDeletedEvent{uid, *meta});
    bus_.on_entity_deleted(uid);
    entities_.erase(uid);

    // Released last so the id resolves for every deletion subscriber
    auto unbound = ids_.unbind(meta->net_entity);
    if (!unbound) {
        sim_core::entity_logger()->warn("Deleted {} without a network binding: {}",
            to_descriptive_string(uid), unbound.error().message());
    }
}

void EntityManager::queue_delete_entity(EntityUid uid) {
    if (deleted(uid) || !queued_set_.insert(uid).second) {
        return;
    }
    queued_deletions_.push_back(uid);
    bus_.raise_event(EntityQueuedForDeletionEvent{uid});
}

void EntityManager::flush_entities() {
    queued_deletions_.clear();
    queued_set_.clear();

    for (EntityUid uid : entities()) {
        delete_entity(uid);
    }

    if (!entities_.empty()) {
        sim_core::entity_logger()->error("{} entities were spawned while flushing entities", entities_.size());
    }
}

// =============================================================================
// Dirty Tracking
// =============================================================================

void EntityManager::mark_dirty(EntityUid uid) {
    // Deleted metadata is still stamped
    auto* meta = static_cast<MetaDataComponent*>(
        store_.get_including_deleted(uid, ComponentRegistry::k_metadata_type));
    if (meta == nullptr) {
        return;
    }

    sim_core::GameTick now = clock_.current_tick();
    if (meta->entity_last_modified_tick == now) {
        return;
    }
    meta->entity_last_modified_tick = now;

    if (meta->life_stage > EntityLifeStage::Initializing) {
        bus_.raise_event(EntityDirtiedEvent{uid});
    }
}

void EntityManager::dirty(EntityUid uid, Component& component) {
    if (component.life_stage() >= ComponentLifeStage::Removing || !component.net_sync_enabled) {
        return;
    }
    mark_dirty(uid);
    component.last_modified_tick = clock_.current_tick();
}

// =============================================================================
// Components
// =============================================================================

Result<Component*> EntityManager::add_component(EntityUid uid, ComponentTypeId type) {
    auto meta = live_metadata(uid);
    if (!meta) {
        return Err<Component*>(meta.error());
    }
    if ((*meta)->life_stage >= EntityLifeStage::Terminating) {
        return Err<Component*>(EntityError::invalid_transition(to_descriptive_string(uid),
            "a live entity", to_string((*meta)->life_stage)));
    }

    auto instance = registry_.create(type);
    if (!instance) {
        return Err<Component*>(Error(ErrorCode::NotFound,
            "Component type id not registered: " + std::to_string(type)));
    }
    return add_component_internal(uid, type, std::move(instance));
}

Result<Component*> EntityManager::add_component(EntityUid uid, const std::string& type_name) {
    auto type = registry_.id_by_name(type_name);
    if (!type) {
        return Err<Component*>(unregistered_type(type_name.c_str()));
    }
    return add_component(uid, *type);
}

Result<Component*> EntityManager::add_component_internal(EntityUid uid, ComponentTypeId type,
                                                         std::unique_ptr<Component> instance) {
    instance->creation_tick = clock_.current_tick();

    auto added = store_.add(uid, type, std::move(instance));
    if (!added) {
        return added;
    }
    Component* comp = *added;
    comp->life_add(*this);

    // Catch up with the entity's stage
    const MetaDataComponent* meta = try_get_metadata(uid);
    if (meta != nullptr && type != ComponentRegistry::k_metadata_type) {
        if (meta->life_stage >= EntityLifeStage::Initializing && comp->life_stage() == ComponentLifeStage::Added) {
            comp->life_initialize(*this);
        }
        if (meta->life_stage >= EntityLifeStage::Starting && comp->life_stage() == ComponentLifeStage::Initialized) {
            comp->life_startup(*this);
        }
        dirty(uid, *comp);
    }
    return comp;
}

Result<void> EntityManager::remove_component(EntityUid uid, ComponentTypeId type) {
    if (type == ComponentRegistry::k_metadata_type || type == ComponentRegistry::k_transform_type) {
        return Err(EntityError::mandatory_component(to_descriptive_string(uid), registry_.name_of(type)));
    }

    Component* comp = store_.try_get(uid, type);
    if (comp == nullptr) {
        return Err(EntityError::not_found(to_descriptive_string(uid), registry_.name_of(type)));
    }

    if (comp->running()) {
        guarded_teardown(uid, "shutting down", [&]() { comp->life_shutdown(*this); });
    }
    guarded_teardown(uid, "removing a component of", [&]() { comp->life_remove(*this); });

    auto removed = store_.remove(uid, type);
    if (!removed) {
        return removed;
    }
    mark_dirty(uid);
    return Ok();
}

MetaDataComponent* EntityManager::try_get_metadata(EntityUid uid) const noexcept {
    return static_cast<MetaDataComponent*>(store_.try_get(uid, ComponentRegistry::k_metadata_type));
}

TransformComponent* EntityManager::try_get_transform(EntityUid uid) const noexcept {
    return static_cast<TransformComponent*>(store_.try_get(uid, ComponentRegistry::k_transform_type));
}

// =============================================================================
// Queries
// =============================================================================

bool EntityManager::entity_exists(EntityUid uid) const noexcept {
    const MetaDataComponent* meta = try_get_metadata(uid);
    return meta != nullptr && !meta->entity_deleted();
}

bool EntityManager::deleted(EntityUid uid) const noexcept {
    return !entity_exists(uid);
}

Result<EntityLifeStage> EntityManager::life_stage(EntityUid uid) const {
    auto* meta = static_cast<const MetaDataComponent*>(
        store_.get_including_deleted(uid, ComponentRegistry::k_metadata_type));
    if (meta == nullptr) {
        return Err<EntityLifeStage>(EntityError::unknown_id(uid.to_string()));
    }
    return meta->life_stage;
}

bool EntityManager::is_paused(EntityUid uid) const noexcept {
    const MetaDataComponent* meta = try_get_metadata(uid);
    return meta != nullptr && meta->paused;
}

Result<void> EntityManager::set_paused(EntityUid uid, bool paused) {
    auto meta = live_metadata(uid);
    if (!meta) {
        return Err(meta.error());
    }
    if ((*meta)->paused != paused) {
        (*meta)->paused = paused;
        dirty(uid, **meta);
    }
    return Ok();
}

std::vector<EntityUid> EntityManager::entities() const {
    std::vector<EntityUid> result(entities_.begin(), entities_.end());
    std::sort(result.begin(), result.end());
    return result;
}

EntityDescriptor EntityManager::describe(EntityUid uid) const {
    EntityDescriptor desc;
    desc.uid = uid;

    auto* meta = static_cast<const MetaDataComponent*>(
        store_.get_including_deleted(uid, ComponentRegistry::k_metadata_type));
    if (meta == nullptr) {
        desc.deleted = true;
        return desc;
    }

    desc.deleted = meta->entity_deleted();
    desc.name = meta->name;
    desc.prototype_id = meta->prototype_id;
    desc.net_entity = meta->net_entity;
    return desc;
}

std::vector<Error> EntityManager::take_structural_repairs() {
    std::vector<Error> repairs;
    repairs.swap(structural_repairs_);
    return repairs;
}

} // namespace sim_ecs
