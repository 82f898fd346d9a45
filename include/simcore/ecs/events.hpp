#pragma once

/// @file events.hpp
/// @brief Events raised by the entity runtime

#include "fwd.hpp"
#include "entity.hpp"
#include "metadata.hpp"

namespace sim_ecs {

// =============================================================================
// Broadcast Events
// =============================================================================

/// Raised when an id is allocated, before metadata and transform exist
struct EntityAddedEvent {
    EntityUid uid;
};

/// Raised after all component initialize hooks ran
struct EntityInitializedEvent {
    EntityUid uid;
};

/// Raised once the entity reached Deleted; carries its final metadata
struct EntityDeletedEvent {
    EntityUid uid;
    MetaDataComponent metadata;
};

/// Raised when an entity enters the deferred deletion queue
struct EntityQueuedForDeletionEvent {
    EntityUid uid;
};

/// Raised when a replicated mutation stamps the entity's tick
struct EntityDirtiedEvent {
    EntityUid uid;
};

// =============================================================================
// Local (entity-scoped) Events
// =============================================================================

/// Raised on each entity of a hierarchy when termination starts
struct EntityTerminatingEvent {
    EntityUid uid;
};

/// Raised once when the entity's map is ready
struct MapInitEvent {
    EntityUid uid;
};

/// Raised after both sides of a parent link were updated
struct EntParentChangedEvent {
    EntityUid uid;
    EntityUid old_parent;
    EntityUid new_parent;
};

} // namespace sim_ecs
