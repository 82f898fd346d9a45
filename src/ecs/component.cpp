/// @file component.cpp
/// @brief Component lifecycle drivers and ComponentRegistry

#include <simcore/ecs/component.hpp>
#include <simcore/ecs/metadata.hpp>
#include <simcore/ecs/transform.hpp>

namespace sim_ecs {

// =============================================================================
// Stage Names
// =============================================================================

const char* to_string(ComponentLifeStage stage) {
    switch (stage) {
        case ComponentLifeStage::PreAdd: return "PreAdd";
        case ComponentLifeStage::Added: return "Added";
        case ComponentLifeStage::Initializing: return "Initializing";
        case ComponentLifeStage::Initialized: return "Initialized";
        case ComponentLifeStage::Starting: return "Starting";
        case ComponentLifeStage::Running: return "Running";
        case ComponentLifeStage::Stopping: return "Stopping";
        case ComponentLifeStage::Stopped: return "Stopped";
        case ComponentLifeStage::Removing: return "Removing";
        case ComponentLifeStage::Deleted: return "Deleted";
    }
    return "Unknown";
}

const char* to_string(EntityLifeStage stage) {
    switch (stage) {
        case EntityLifeStage::Allocated: return "Allocated";
        case EntityLifeStage::Initializing: return "Initializing";
        case EntityLifeStage::Initialized: return "Initialized";
        case EntityLifeStage::Starting: return "Starting";
        case EntityLifeStage::Started: return "Started";
        case EntityLifeStage::MapInitialized: return "MapInitialized";
        case EntityLifeStage::Terminating: return "Terminating";
        case EntityLifeStage::Deleted: return "Deleted";
    }
    return "Unknown";
}

// =============================================================================
// Component Lifecycle
// =============================================================================

void Component::life_add(EntityManager& manager) {
    life_stage_ = ComponentLifeStage::Added;
    on_add(manager);
}

void Component::life_initialize(EntityManager& manager) {
    life_stage_ = ComponentLifeStage::Initializing;
    on_initialize(manager);
    life_stage_ = ComponentLifeStage::Initialized;
}

void Component::life_startup(EntityManager& manager) {
    life_stage_ = ComponentLifeStage::Starting;
    on_startup(manager);
    life_stage_ = ComponentLifeStage::Running;
}

void Component::life_shutdown(EntityManager& manager) {
    life_stage_ = ComponentLifeStage::Stopping;
    // Stopped even if the hook throws; shutdown is never retried
    struct StageGuard {
        ComponentLifeStage& stage;
        ~StageGuard() { stage = ComponentLifeStage::Stopped; }
    } guard{life_stage_};
    on_shutdown(manager);
}

// Deleted is set by ComponentStore::remove once the instance is unlinked.
void Component::life_remove(EntityManager& manager) {
    life_stage_ = ComponentLifeStage::Removing;
    on_remove(manager);
}

// =============================================================================
// ComponentRegistry
// =============================================================================

ComponentRegistry::ComponentRegistry() {
    register_component<MetaDataComponent>("MetaData", true);
    register_component<TransformComponent>("Transform", true);
}

ComponentTypeId ComponentRegistry::register_info(ComponentRegistration reg) {
    ComponentTypeId id = static_cast<ComponentTypeId>(registrations_.size());
    reg.id = id;

    type_map_[reg.type] = id;
    name_map_[reg.name] = id;
    registrations_.push_back(std::move(reg));

    return id;
}

std::optional<ComponentTypeId> ComponentRegistry::id_by_name(const std::string& name) const {
    auto it = name_map_.find(name);
    if (it != name_map_.end()) {
        return it->second;
    }
    return std::nullopt;
}

const ComponentRegistration* ComponentRegistry::get(ComponentTypeId id) const noexcept {
    if (id >= registrations_.size()) {
        return nullptr;
    }
    return &registrations_[id];
}

const std::string& ComponentRegistry::name_of(ComponentTypeId id) const noexcept {
    static const std::string unregistered = "<unregistered>";
    if (id >= registrations_.size()) {
        return unregistered;
    }
    return registrations_[id].name;
}

std::unique_ptr<Component> ComponentRegistry::create(ComponentTypeId id) const {
    const auto* reg = get(id);
    if (reg == nullptr || !reg->factory) {
        return nullptr;
    }
    auto component = reg->factory();
    component->net_sync_enabled = reg->net_sync;
    return component;
}

} // namespace sim_ecs
