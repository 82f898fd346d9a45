#pragma once

/// @file entity.hpp
/// @brief Entity identifiers and IdAllocator for sim_ecs
///
/// Local entity ids and network ids are separate, monotonically issued
/// counters. Neither is ever reissued, so a stale id can never alias a
/// newer entity.

#include "fwd.hpp"
#include <simcore/core/error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace sim_ecs {

// =============================================================================
// EntityUid
// =============================================================================

/// Process-local entity identifier
struct EntityUid {
    std::uint32_t value;

    /// First id handed out by the allocator
    static constexpr std::uint32_t FIRST = 1;

    constexpr EntityUid() noexcept : value(0) {}
    constexpr explicit EntityUid(std::uint32_t v) noexcept : value(v) {}

    /// Invalid entity (also the "no parent" sentinel)
    [[nodiscard]] static constexpr EntityUid invalid() noexcept { return EntityUid{}; }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return is_valid(); }

    [[nodiscard]] constexpr bool operator==(const EntityUid& other) const noexcept { return value == other.value; }
    [[nodiscard]] constexpr bool operator!=(const EntityUid& other) const noexcept { return value != other.value; }
    [[nodiscard]] constexpr bool operator<(const EntityUid& other) const noexcept { return value < other.value; }

    /// Format as string (e.g. "5" or "invalid")
    [[nodiscard]] std::string to_string() const {
        return is_valid() ? std::to_string(value) : std::string("invalid");
    }
};

// =============================================================================
// NetEntity
// =============================================================================

/// Network-stable entity identifier used on the wire
struct NetEntity {
    std::uint32_t value;

    static constexpr std::uint32_t FIRST = 1;

    constexpr NetEntity() noexcept : value(0) {}
    constexpr explicit NetEntity(std::uint32_t v) noexcept : value(v) {}

    [[nodiscard]] static constexpr NetEntity invalid() noexcept { return NetEntity{}; }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return is_valid(); }

    [[nodiscard]] constexpr bool operator==(const NetEntity& other) const noexcept { return value == other.value; }
    [[nodiscard]] constexpr bool operator!=(const NetEntity& other) const noexcept { return value != other.value; }
    [[nodiscard]] constexpr bool operator<(const NetEntity& other) const noexcept { return value < other.value; }

    [[nodiscard]] std::string to_string() const {
        return is_valid() ? "n" + std::to_string(value) : std::string("n-invalid");
    }
};

} // namespace sim_ecs

// =============================================================================
// std::hash Specializations
// =============================================================================

template<>
struct std::hash<sim_ecs::EntityUid> {
    [[nodiscard]] std::size_t operator()(const sim_ecs::EntityUid& e) const noexcept {
        return std::hash<std::uint32_t>{}(e.value);
    }
};

template<>
struct std::hash<sim_ecs::NetEntity> {
    [[nodiscard]] std::size_t operator()(const sim_ecs::NetEntity& e) const noexcept {
        return std::hash<std::uint32_t>{}(e.value);
    }
};

namespace sim_ecs {

// =============================================================================
// IdAllocator
// =============================================================================

/// Issues entity and network ids and keeps the 1:1 binding between them
class IdAllocator {
public:
    using size_type = std::size_t;

    IdAllocator() = default;

    // =========================================================================
    // Allocation
    // =========================================================================

    /// Fresh, never reused entity id
    [[nodiscard]] EntityUid allocate_entity_id() noexcept {
        return EntityUid{next_entity_++};
    }

    /// Fresh, never reused network id
    [[nodiscard]] NetEntity allocate_network_id() noexcept {
        return NetEntity{next_network_++};
    }

    // =========================================================================
    // Binding
    // =========================================================================

    /// Bind a network id to an entity; both must be unbound
    sim_core::Result<void> bind(EntityUid uid, NetEntity net);

    /// Release a binding by network id
    sim_core::Result<void> unbind(NetEntity net);

    /// Resolve network id -> entity; fails with UnknownId if unbound
    [[nodiscard]] sim_core::Result<EntityUid> resolve(NetEntity net) const;

    /// Resolve entity -> network id; fails with UnknownId if unbound
    [[nodiscard]] sim_core::Result<NetEntity> resolve(EntityUid uid) const;

    [[nodiscard]] std::optional<EntityUid> try_resolve(NetEntity net) const noexcept;
    [[nodiscard]] std::optional<NetEntity> try_resolve(EntityUid uid) const noexcept;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_type binding_count() const noexcept { return net_to_uid_.size(); }

    /// Id the next allocate_entity_id() call will return
    [[nodiscard]] EntityUid peek_next_entity_id() const noexcept { return EntityUid{next_entity_}; }

    /// Drop all bindings (counters keep running)
    void clear_bindings() noexcept {
        net_to_uid_.clear();
        uid_to_net_.clear();
    }

private:
    std::uint32_t next_entity_{EntityUid::FIRST};
    std::uint32_t next_network_{NetEntity::FIRST};
    std::unordered_map<NetEntity, EntityUid> net_to_uid_;
    std::unordered_map<EntityUid, NetEntity> uid_to_net_;
};

} // namespace sim_ecs
