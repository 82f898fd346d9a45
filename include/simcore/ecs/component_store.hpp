#pragma once

/// @file component_store.hpp
/// @brief Per-type component tables for sim_ecs
///
/// One table per registered component type, keyed by owning entity. Removal
/// is two-step: remove() marks the instance Deleted and unlinks it from the
/// entity's live set, cull_removed() frees it at the end of the tick. This
/// keeps just-deleted metadata readable for diagnostics within the tick.

#include "fwd.hpp"
#include "component.hpp"
#include "entity.hpp"
#include <simcore/core/error.hpp>

#include <iterator>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sim_ecs {

// =============================================================================
// IComponentListener
// =============================================================================

/// Observer notified after every successful add/remove
class IComponentListener {
public:
    virtual ~IComponentListener() = default;

    virtual void on_component_added(EntityUid uid, ComponentTypeId type) = 0;
    virtual void on_component_removed(EntityUid uid, ComponentTypeId type) = 0;
};

// =============================================================================
// ComponentRange
// =============================================================================

/// Lazy forward range over an entity's live components in safe order
///
/// The type list is captured when the range is created; each component is
/// resolved as the iterator reaches it, so components removed while
/// iterating are skipped.
class ComponentRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Component*;
        using difference_type = std::ptrdiff_t;
        using pointer = Component**;
        using reference = Component*;

        Iterator() = default;
        Iterator(const ComponentRange* range, std::size_t index)
            : range_(range), index_(index) { skip_missing(); }

        [[nodiscard]] Component* operator*() const { return current_; }

        Iterator& operator++() {
            ++index_;
            skip_missing();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] bool operator==(const Iterator& other) const noexcept {
            return index_ == other.index_;
        }

        [[nodiscard]] bool operator!=(const Iterator& other) const noexcept {
            return index_ != other.index_;
        }

    private:
        void skip_missing();

        const ComponentRange* range_ = nullptr;
        std::size_t index_ = 0;
        Component* current_ = nullptr;
    };

    ComponentRange(const ComponentStore* store, EntityUid uid, std::vector<ComponentTypeId> types)
        : store_(store), uid_(uid), types_(std::move(types)) {}

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, types_.size()); }

    /// Type ids captured at creation
    [[nodiscard]] const std::vector<ComponentTypeId>& types() const noexcept { return types_; }

private:
    friend class Iterator;

    const ComponentStore* store_;
    EntityUid uid_;
    std::vector<ComponentTypeId> types_;
};

// =============================================================================
// ComponentStore
// =============================================================================

/// Storage for all component instances
class ComponentStore {
public:
    using size_type = std::size_t;

    explicit ComponentStore(const ComponentRegistry& registry);

    ComponentStore(const ComponentStore&) = delete;
    ComponentStore& operator=(const ComponentStore&) = delete;

    /// Listener for add/remove notifications (nullptr to detach)
    void set_listener(IComponentListener* listener) noexcept { listener_ = listener; }

    [[nodiscard]] const ComponentRegistry& registry() const noexcept { return registry_; }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Attach an instance; fails with DuplicateComponent if a live one exists
    sim_core::Result<Component*> add(EntityUid uid, ComponentTypeId type, std::unique_ptr<Component> instance);

    /// Mark an instance Deleted and unlink it; fails with NotFound
    sim_core::Result<void> remove(EntityUid uid, ComponentTypeId type);

    /// Free every instance removed since the last cull
    void cull_removed();

    /// Drop everything (no listener notifications)
    void clear();

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Live component; fails with NotFound
    [[nodiscard]] sim_core::Result<Component*> get(EntityUid uid, ComponentTypeId type) const;

    /// Live component or nullptr
    [[nodiscard]] Component* try_get(EntityUid uid, ComponentTypeId type) const noexcept;

    /// Live or removed-but-not-yet-culled component, or nullptr
    [[nodiscard]] Component* get_including_deleted(EntityUid uid, ComponentTypeId type) const noexcept;

    [[nodiscard]] bool has(EntityUid uid, ComponentTypeId type) const noexcept {
        return try_get(uid, type) != nullptr;
    }

    /// Live components of an entity in safe order
    [[nodiscard]] ComponentRange enumerate(EntityUid uid) const;

    /// Live component type ids of an entity in safe order
    [[nodiscard]] std::vector<ComponentTypeId> component_types(EntityUid uid) const;

    /// Entities owning a live component of the given type
    [[nodiscard]] std::vector<EntityUid> entities_with(ComponentTypeId type) const;

    [[nodiscard]] size_type component_count(EntityUid uid) const noexcept;

    /// Instances awaiting cull
    [[nodiscard]] size_type pending_cull_count() const noexcept {
        return removed_.size() + graveyard_.size();
    }

    // =========================================================================
    // Typed Helpers
    // =========================================================================

    template<ComponentType T>
    [[nodiscard]] T* try_get(EntityUid uid) const noexcept {
        auto id = registry_.id_of<T>();
        if (!id) {
            return nullptr;
        }
        return static_cast<T*>(try_get(uid, *id));
    }

    template<ComponentType T>
    [[nodiscard]] bool has(EntityUid uid) const noexcept {
        return try_get<T>(uid) != nullptr;
    }

private:
    using Table = std::unordered_map<EntityUid, std::unique_ptr<Component>>;

    [[nodiscard]] std::string describe(EntityUid uid) const;
    [[nodiscard]] const Table* table(ComponentTypeId type) const noexcept;

    const ComponentRegistry& registry_;
    IComponentListener* listener_ = nullptr;

    std::vector<Table> tables_;
    std::unordered_map<EntityUid, std::vector<ComponentTypeId>> entity_types_;
    std::vector<std::pair<EntityUid, ComponentTypeId>> removed_;
    std::vector<std::unique_ptr<Component>> graveyard_;
};

} // namespace sim_ecs
