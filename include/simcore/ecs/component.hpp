#pragma once

/// @file component.hpp
/// @brief Component base class and component type registry for sim_ecs
///
/// Components are polymorphic records owned by the ComponentStore. Each
/// concrete type is registered once with the ComponentRegistry, which hands
/// out a dense ComponentTypeId and keeps a factory so that data loaders can
/// create components by name.

#include "fwd.hpp"
#include "entity.hpp"
#include <simcore/core/tick.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace sim_ecs {

// =============================================================================
// ComponentLifeStage
// =============================================================================

/// Lifecycle of a single component instance
enum class ComponentLifeStage : std::uint8_t {
    PreAdd = 0,
    Added,
    Initializing,
    Initialized,
    Starting,
    Running,
    Stopping,
    Stopped,
    Removing,
    Deleted,
};

[[nodiscard]] const char* to_string(ComponentLifeStage stage);

// =============================================================================
// Component
// =============================================================================

/// Base class of every component
///
/// Hooks run in a fixed order: on_add, on_initialize, on_startup while the
/// owning entity is being built; on_shutdown, on_remove while it is torn
/// down. Hooks may throw; construction-time failures abort entity creation,
/// teardown failures are logged and skipped.
class Component {
public:
    Component() = default;
    virtual ~Component() = default;

    Component(const Component&) = default;
    Component& operator=(const Component&) = default;

    [[nodiscard]] EntityUid owner() const noexcept { return owner_; }
    [[nodiscard]] ComponentTypeId type_id() const noexcept { return type_id_; }
    [[nodiscard]] ComponentLifeStage life_stage() const noexcept { return life_stage_; }

    /// Initialize has begun (and the component has not been deleted)
    [[nodiscard]] bool initialized() const noexcept {
        return life_stage_ >= ComponentLifeStage::Initializing && life_stage_ < ComponentLifeStage::Deleted;
    }

    /// Started and not yet shut down
    [[nodiscard]] bool running() const noexcept {
        return life_stage_ == ComponentLifeStage::Running;
    }

    [[nodiscard]] bool deleted() const noexcept {
        return life_stage_ == ComponentLifeStage::Deleted;
    }

    /// Whether mutations of this component are replicated
    bool net_sync_enabled = true;

    /// Tick of the last replicated mutation (zero = never / equals prototype)
    sim_core::GameTick last_modified_tick{};

    /// Tick the component was added on
    sim_core::GameTick creation_tick{};

    /// Reset replication ticks to "unmodified"
    void clear_ticks() noexcept {
        last_modified_tick = sim_core::GameTick::zero();
        creation_tick = sim_core::GameTick::zero();
    }

protected:
    virtual void on_add(EntityManager&) {}
    virtual void on_initialize(EntityManager&) {}
    virtual void on_startup(EntityManager&) {}
    virtual void on_shutdown(EntityManager&) {}
    virtual void on_remove(EntityManager&) {}

private:
    friend class ComponentStore;
    friend class EntityManager;

    void life_add(EntityManager& manager);
    void life_initialize(EntityManager& manager);
    void life_startup(EntityManager& manager);
    void life_shutdown(EntityManager& manager);
    void life_remove(EntityManager& manager);

    EntityUid owner_{};
    ComponentTypeId type_id_{0};
    ComponentLifeStage life_stage_{ComponentLifeStage::PreAdd};
};

/// Concept for registrable component types
template<typename T>
concept ComponentType = std::is_base_of_v<Component, T> && std::is_default_constructible_v<T>;

// =============================================================================
// ComponentRegistration
// =============================================================================

/// Metadata for a registered component type
struct ComponentRegistration {
    ComponentTypeId id{0};
    std::string name;
    std::type_index type{typeid(void)};

    /// Default net_sync for new instances
    bool net_sync = true;

    /// Creates a default-constructed instance
    std::function<std::unique_ptr<Component>()> factory;
};

// =============================================================================
// ComponentRegistry
// =============================================================================

/// Registry of all component types
///
/// MetaDataComponent and TransformComponent are registered on construction
/// and always receive ids 0 and 1.
class ComponentRegistry {
public:
    using size_type = std::size_t;

    static constexpr ComponentTypeId k_metadata_type = 0;
    static constexpr ComponentTypeId k_transform_type = 1;

    ComponentRegistry();

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a component type
    /// @return Component type id (existing id if already registered)
    template<ComponentType T>
    ComponentTypeId register_component(const std::string& name, bool net_sync = true) {
        std::type_index type_idx = std::type_index(typeid(T));

        auto it = type_map_.find(type_idx);
        if (it != type_map_.end()) {
            return it->second;
        }

        ComponentRegistration reg;
        reg.name = name;
        reg.type = type_idx;
        reg.net_sync = net_sync;
        reg.factory = []() -> std::unique_ptr<Component> { return std::make_unique<T>(); };
        return register_info(std::move(reg));
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    template<typename T>
    [[nodiscard]] std::optional<ComponentTypeId> id_of() const {
        auto it = type_map_.find(std::type_index(typeid(T)));
        if (it != type_map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<ComponentTypeId> id_by_name(const std::string& name) const;

    /// Registration by id (nullptr if unknown)
    [[nodiscard]] const ComponentRegistration* get(ComponentTypeId id) const noexcept;

    /// Registered name, or "<unregistered>"
    [[nodiscard]] const std::string& name_of(ComponentTypeId id) const noexcept;

    /// Create a fresh instance of a registered type
    [[nodiscard]] std::unique_ptr<Component> create(ComponentTypeId id) const;

    [[nodiscard]] size_type size() const noexcept { return registrations_.size(); }

    // =========================================================================
    // Safe Order
    // =========================================================================

    /// Ordering key: other components by id, then transform, then metadata
    [[nodiscard]] static constexpr std::uint64_t safe_order_rank(ComponentTypeId id) noexcept {
        if (id == k_metadata_type) return UINT64_MAX;
        if (id == k_transform_type) return UINT64_MAX - 1;
        return id;
    }

    [[nodiscard]] static constexpr bool safe_order_less(ComponentTypeId a, ComponentTypeId b) noexcept {
        return safe_order_rank(a) < safe_order_rank(b);
    }

private:
    ComponentTypeId register_info(ComponentRegistration reg);

    std::vector<ComponentRegistration> registrations_;
    std::unordered_map<std::type_index, ComponentTypeId> type_map_;
    std::unordered_map<std::string, ComponentTypeId> name_map_;
};

} // namespace sim_ecs
