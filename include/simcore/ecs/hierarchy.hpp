#pragma once

/// @file hierarchy.hpp
/// @brief Parent/child links between entities
///
/// The only writer of TransformComponent parent and child fields. Both
/// sides of a link are updated before EntParentChangedEvent is raised.

#include "fwd.hpp"
#include "entity.hpp"
#include "transform.hpp"
#include <simcore/core/error.hpp>
#include <simcore/event/fwd.hpp>

#include <vector>

namespace sim_test {
struct HierarchyAccess;
}

namespace sim_ecs {

class HierarchyTracker {
public:
    HierarchyTracker(ComponentStore& store, sim_event::EntityEventBus& bus);

    HierarchyTracker(const HierarchyTracker&) = delete;
    HierarchyTracker& operator=(const HierarchyTracker&) = delete;

    /// Re-parent an entity; an invalid parent detaches it
    ///
    /// Fails with UnknownId if either entity has no live transform and with
    /// InvalidArgument if the link would create a cycle.
    sim_core::Result<void> set_parent(EntityUid child, EntityUid parent);

    /// Detach from the current parent (no-op for roots)
    sim_core::Result<void> detach_to_null(EntityUid child);

    /// Parent of a live entity (invalid for roots); fails with UnknownId
    [[nodiscard]] sim_core::Result<EntityUid> parent(EntityUid uid) const;

    /// Children of a live entity; fails with UnknownId
    [[nodiscard]] sim_core::Result<std::vector<EntityUid>> children(EntityUid uid) const;

    /// True if ancestor appears on the parent chain of uid
    [[nodiscard]] bool is_ancestor(EntityUid ancestor, EntityUid uid) const;

    /// Drop a dangling child reference from a parent's list
    bool remove_child_reference(EntityUid parent, EntityUid child);

private:
    friend struct sim_test::HierarchyAccess;

    /// Append a child reference without validating the child
    sim_core::Result<void> attach_unchecked(EntityUid parent, EntityUid child);

    [[nodiscard]] TransformComponent* transform(EntityUid uid) const noexcept;

    ComponentStore& store_;
    sim_event::EntityEventBus& bus_;
};

} // namespace sim_ecs
