#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sim_ecs
///
/// All ECS types are declared here for header dependency management.

#include <cstdint>
#include <cstddef>

namespace sim_ecs {

// =============================================================================
// Identity
// =============================================================================

/// Process-local entity identifier
struct EntityUid;

/// Network-stable entity identifier
struct NetEntity;

/// Issues and maps entity and network ids
class IdAllocator;

// =============================================================================
// Components
// =============================================================================

enum class ComponentLifeStage : std::uint8_t;
class Component;
struct ComponentRegistration;
class ComponentRegistry;
class ComponentStore;

enum class EntityLifeStage : std::uint8_t;
class MetaDataComponent;
class TransformComponent;
struct Vec2;

// =============================================================================
// Runtime
// =============================================================================

class HierarchyTracker;
class EntityManager;
struct EntityDescriptor;

class IPrototypeLoader;
class IMapService;

// =============================================================================
// Common Type Aliases
// =============================================================================

using ComponentTypeId = std::uint32_t;
using MapId = std::uint32_t;

/// Map id meaning "no map"
inline constexpr MapId k_nullspace = 0;

} // namespace sim_ecs
