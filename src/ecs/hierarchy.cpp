/// @file hierarchy.cpp
/// @brief HierarchyTracker implementation

#include <simcore/ecs/hierarchy.hpp>
#include <simcore/ecs/component_store.hpp>
#include <simcore/ecs/events.hpp>
#include <simcore/event/event_bus.hpp>

namespace sim_ecs {

using sim_core::Err;
using sim_core::EntityError;
using sim_core::Error;
using sim_core::ErrorCode;
using sim_core::Ok;
using sim_core::Result;

HierarchyTracker::HierarchyTracker(ComponentStore& store, sim_event::EntityEventBus& bus)
    : store_(store)
    , bus_(bus) {}

TransformComponent* HierarchyTracker::transform(EntityUid uid) const noexcept {
    return static_cast<TransformComponent*>(store_.try_get(uid, ComponentRegistry::k_transform_type));
}

Result<void> HierarchyTracker::set_parent(EntityUid child, EntityUid parent) {
    TransformComponent* child_xform = transform(child);
    if (child_xform == nullptr) {
        return Err(EntityError::unknown_id(child.to_string()));
    }

    TransformComponent* parent_xform = nullptr;
    if (parent.is_valid()) {
        if (parent == child) {
            return Err(Error(ErrorCode::InvalidArgument,
                "Entity " + child.to_string() + " cannot be its own parent"));
        }
        parent_xform = transform(parent);
        if (parent_xform == nullptr) {
            return Err(EntityError::unknown_id(parent.to_string()));
        }
        if (is_ancestor(child, parent)) {
            return Err(Error(ErrorCode::InvalidArgument,
                "Parenting " + child.to_string() + " to " + parent.to_string() + " would create a cycle"));
        }
    }

    EntityUid old_parent = child_xform->parent_;
    if (old_parent == parent) {
        return Ok();
    }

    if (old_parent.is_valid()) {
        if (TransformComponent* old_xform = transform(old_parent)) {
            old_xform->remove_child(child);
        }
    }

    child_xform->parent_ = parent;
    if (parent_xform != nullptr) {
        parent_xform->add_child(child);
        child_xform->map_id = parent_xform->map_id;
    }

    EntParentChangedEvent event{child, old_parent, parent};
    bus_.raise_local_event(child, event, true);
    return Ok();
}

Result<void> HierarchyTracker::detach_to_null(EntityUid child) {
    return set_parent(child, EntityUid::invalid());
}

Result<EntityUid> HierarchyTracker::parent(EntityUid uid) const {
    const TransformComponent* xform = transform(uid);
    if (xform == nullptr) {
        return Err<EntityUid>(EntityError::unknown_id(uid.to_string()));
    }
    return xform->parent();
}

Result<std::vector<EntityUid>> HierarchyTracker::children(EntityUid uid) const {
    const TransformComponent* xform = transform(uid);
    if (xform == nullptr) {
        return Err<std::vector<EntityUid>>(EntityError::unknown_id(uid.to_string()));
    }
    return xform->children();
}

bool HierarchyTracker::is_ancestor(EntityUid ancestor, EntityUid uid) const {
    const TransformComponent* xform = transform(uid);
    while (xform != nullptr && xform->parent().is_valid()) {
        if (xform->parent() == ancestor) {
            return true;
        }
        xform = transform(xform->parent());
    }
    return false;
}

Result<void> HierarchyTracker::attach_unchecked(EntityUid parent, EntityUid child) {
    TransformComponent* parent_xform = transform(parent);
    if (parent_xform == nullptr) {
        return Err(EntityError::unknown_id(parent.to_string()));
    }
    parent_xform->add_child(child);
    if (TransformComponent* child_xform = transform(child)) {
        child_xform->parent_ = parent;
    }
    return Ok();
}

bool HierarchyTracker::remove_child_reference(EntityUid parent, EntityUid child) {
    TransformComponent* parent_xform = transform(parent);
    if (parent_xform == nullptr) {
        return false;
    }
    return parent_xform->remove_child(child);
}

} // namespace sim_ecs
