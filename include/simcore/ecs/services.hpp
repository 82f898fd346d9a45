#pragma once

/// @file services.hpp
/// @brief External collaborators of the entity runtime

#include "fwd.hpp"
#include "entity.hpp"
#include <simcore/core/error.hpp>

#include <map>
#include <string>
#include <vector>

namespace sim_ecs {

/// Per-component field overrides applied on top of a prototype
/// (component name -> field name -> serialized value)
using ComponentOverrides = std::map<std::string, std::map<std::string, std::string>>;

// =============================================================================
// IPrototypeLoader
// =============================================================================

/// Creates the components a prototype defines on an allocated entity
class IPrototypeLoader {
public:
    virtual ~IPrototypeLoader() = default;

    /// Add the prototype's components (through EntityManager::add_component)
    /// and apply overrides; an empty prototype id loads overrides only
    virtual sim_core::Result<void> load_components(
        EntityManager& manager,
        EntityUid uid,
        const std::string& prototype_id,
        const ComponentOverrides* overrides) = 0;

    [[nodiscard]] virtual bool has_prototype(const std::string& prototype_id) const = 0;

    /// Registered names of the components the prototype defines
    [[nodiscard]] virtual std::vector<std::string> prototype_components(const std::string& prototype_id) const = 0;
};

// =============================================================================
// IMapService
// =============================================================================

class IMapService {
public:
    virtual ~IMapService() = default;

    [[nodiscard]] virtual bool is_map_initialized(MapId map) const = 0;
};

} // namespace sim_ecs
