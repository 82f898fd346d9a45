#pragma once

/// @file metadata.hpp
/// @brief Entity lifecycle stage and the mandatory metadata component

#include "fwd.hpp"
#include "component.hpp"

#include <optional>
#include <string>

namespace sim_ecs {

// =============================================================================
// EntityLifeStage
// =============================================================================

/// Lifecycle of an entity; strictly monotonic
enum class EntityLifeStage : std::uint8_t {
    Allocated = 0,
    Initializing,
    Initialized,
    Starting,
    Started,
    MapInitialized,
    Terminating,
    Deleted,
};

[[nodiscard]] const char* to_string(EntityLifeStage stage);

// =============================================================================
// MetaDataComponent
// =============================================================================

/// Identity bookkeeping present on every live entity
///
/// Added first and removed last. After deletion it stays readable (with
/// life_stage == Deleted) until the store culls removed components at the
/// end of the tick.
class MetaDataComponent final : public Component {
public:
    EntityLifeStage life_stage = EntityLifeStage::Allocated;
    bool paused = false;

    /// Tick the entity was last dirtied on
    sim_core::GameTick entity_last_modified_tick{};

    std::optional<std::string> prototype_id;
    std::string name;
    std::string description;
    NetEntity net_entity{};

    [[nodiscard]] bool entity_deleted() const noexcept {
        return life_stage >= EntityLifeStage::Deleted;
    }
};

} // namespace sim_ecs
