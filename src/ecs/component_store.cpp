/// @file component_store.cpp
/// @brief ComponentStore implementation

#include <simcore/ecs/component_store.hpp>

#include <algorithm>

namespace sim_ecs {

using sim_core::Err;
using sim_core::EntityError;
using sim_core::Ok;
using sim_core::Result;

// =============================================================================
// ComponentRange
// =============================================================================

void ComponentRange::Iterator::skip_missing() {
    current_ = nullptr;
    if (range_ == nullptr) {
        return;
    }
    while (index_ < range_->types_.size()) {
        current_ = range_->store_->try_get(range_->uid_, range_->types_[index_]);
        if (current_ != nullptr) {
            return;
        }
        ++index_;
    }
}

// =============================================================================
// ComponentStore
// =============================================================================

ComponentStore::ComponentStore(const ComponentRegistry& registry)
    : registry_(registry) {}

std::string ComponentStore::describe(EntityUid uid) const {
    return "entity " + uid.to_string();
}

const ComponentStore::Table* ComponentStore::table(ComponentTypeId type) const noexcept {
    if (type >= tables_.size()) {
        return nullptr;
    }
    return &tables_[type];
}

Result<Component*> ComponentStore::add(EntityUid uid, ComponentTypeId type, std::unique_ptr<Component> instance) {
    if (!uid.is_valid()) {
        return Err<Component*>(EntityError::unknown_id(uid.to_string()));
    }
    if (!instance) {
        return Err<Component*>(sim_core::Error(sim_core::ErrorCode::InvalidArgument,
            "Null component instance for " + describe(uid)));
    }

    if (type >= tables_.size()) {
        tables_.resize(static_cast<std::size_t>(type) + 1);
    }
    auto& tbl = tables_[type];

    auto it = tbl.find(uid);
    if (it != tbl.end()) {
        if (!it->second->deleted()) {
            return Err<Component*>(EntityError::duplicate_component(describe(uid), registry_.name_of(type)));
        }
        // Removed earlier this tick; keep it alive until the cull.
        graveyard_.push_back(std::move(it->second));
        tbl.erase(it);
    }

    instance->owner_ = uid;
    instance->type_id_ = type;
    Component* raw = instance.get();
    tbl.emplace(uid, std::move(instance));

    auto& types = entity_types_[uid];
    auto pos = std::lower_bound(types.begin(), types.end(), type, ComponentRegistry::safe_order_less);
    types.insert(pos, type);

    if (listener_ != nullptr) {
        listener_->on_component_added(uid, type);
    }
    return raw;
}

Result<void> ComponentStore::remove(EntityUid uid, ComponentTypeId type) {
    Component* comp = try_get(uid, type);
    if (comp == nullptr) {
        return Err(EntityError::not_found(describe(uid), registry_.name_of(type)));
    }

    comp->life_stage_ = ComponentLifeStage::Deleted;
    removed_.emplace_back(uid, type);

    auto types_it = entity_types_.find(uid);
    if (types_it != entity_types_.end()) {
        auto& types = types_it->second;
        types.erase(std::remove(types.begin(), types.end(), type), types.end());
        if (types.empty()) {
            entity_types_.erase(types_it);
        }
    }

    if (listener_ != nullptr) {
        listener_->on_component_removed(uid, type);
    }
    return Ok();
}

void ComponentStore::cull_removed() {
    for (const auto& [uid, type] : removed_) {
        if (type >= tables_.size()) {
            continue;
        }
        auto& tbl = tables_[type];
        auto it = tbl.find(uid);
        // A fresh instance may have been added after the removal.
        if (it != tbl.end() && it->second->deleted()) {
            tbl.erase(it);
        }
    }
    removed_.clear();
    graveyard_.clear();
}

void ComponentStore::clear() {
    tables_.clear();
    entity_types_.clear();
    removed_.clear();
    graveyard_.clear();
}

Result<Component*> ComponentStore::get(EntityUid uid, ComponentTypeId type) const {
    Component* comp = try_get(uid, type);
    if (comp == nullptr) {
        return Err<Component*>(EntityError::not_found(describe(uid), registry_.name_of(type)));
    }
    return comp;
}

Component* ComponentStore::try_get(EntityUid uid, ComponentTypeId type) const noexcept {
    Component* comp = get_including_deleted(uid, type);
    if (comp == nullptr || comp->deleted()) {
        return nullptr;
    }
    return comp;
}

Component* ComponentStore::get_including_deleted(EntityUid uid, ComponentTypeId type) const noexcept {
    const Table* tbl = table(type);
    if (tbl == nullptr) {
        return nullptr;
    }
    auto it = tbl->find(uid);
    if (it == tbl->end()) {
        return nullptr;
    }
    return it->second.get();
}

ComponentRange ComponentStore::enumerate(EntityUid uid) const {
    return ComponentRange(this, uid, component_types(uid));
}

std::vector<ComponentTypeId> ComponentStore::component_types(EntityUid uid) const {
    auto it = entity_types_.find(uid);
    if (it == entity_types_.end()) {
        return {};
    }
    return it->second;
}

std::vector<EntityUid> ComponentStore::entities_with(ComponentTypeId type) const {
    std::vector<EntityUid> result;
    const Table* tbl = table(type);
    if (tbl == nullptr) {
        return result;
    }

    result.reserve(tbl->size());
    for (const auto& [uid, comp] : *tbl) {
        if (!comp->deleted()) {
            result.push_back(uid);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

ComponentStore::size_type ComponentStore::component_count(EntityUid uid) const noexcept {
    auto it = entity_types_.find(uid);
    return it != entity_types_.end() ? it->second.size() : 0;
}

} // namespace sim_ecs
