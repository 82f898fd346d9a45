#pragma once

/// @file transform.hpp
/// @brief Mandatory transform component (hierarchy link + placement)

#include "fwd.hpp"
#include "component.hpp"

#include <algorithm>
#include <vector>

namespace sim_ecs {

/// 2D local coordinates
struct Vec2 {
    float x{0}, y{0};

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }

    [[nodiscard]] constexpr bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }

    static constexpr Vec2 zero() { return {0, 0}; }
};

/// Parent link, ordered children and local placement of an entity
///
/// The parent/children fields are owned by HierarchyTracker; everything
/// else may be mutated directly.
class TransformComponent final : public Component {
public:
    [[nodiscard]] EntityUid parent() const noexcept { return parent_; }
    [[nodiscard]] const std::vector<EntityUid>& children() const noexcept { return children_; }
    [[nodiscard]] std::size_t child_count() const noexcept { return children_.size(); }

    [[nodiscard]] bool has_child(EntityUid child) const {
        return std::find(children_.begin(), children_.end(), child) != children_.end();
    }

    [[nodiscard]] bool is_root() const noexcept { return !parent_.is_valid(); }

    Vec2 local_position{};
    float local_rotation = 0.0f;
    bool anchored = false;
    MapId map_id = k_nullspace;

private:
    friend class HierarchyTracker;

    void add_child(EntityUid child) {
        if (!has_child(child)) {
            children_.push_back(child);
        }
    }

    bool remove_child(EntityUid child) {
        auto it = std::find(children_.begin(), children_.end(), child);
        if (it == children_.end()) {
            return false;
        }
        children_.erase(it);
        return true;
    }

    EntityUid parent_{};
    std::vector<EntityUid> children_;
};

} // namespace sim_ecs
