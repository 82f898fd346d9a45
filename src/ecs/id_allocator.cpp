/// @file id_allocator.cpp
/// @brief Entity / network id binding

#include <simcore/ecs/entity.hpp>

namespace sim_ecs {

using sim_core::Err;
using sim_core::EntityError;
using sim_core::Ok;
using sim_core::Result;

Result<void> IdAllocator::bind(EntityUid uid, NetEntity net) {
    if (!uid.is_valid()) {
        return Err(EntityError::unknown_id(uid.to_string()));
    }
    if (!net.is_valid()) {
        return Err(EntityError::unknown_id(net.to_string()));
    }
    if (net_to_uid_.count(net) != 0) {
        return Err(EntityError::duplicate_binding(net.to_string()));
    }
    if (uid_to_net_.count(uid) != 0) {
        return Err(EntityError::duplicate_binding(uid.to_string()));
    }

    net_to_uid_.emplace(net, uid);
    uid_to_net_.emplace(uid, net);
    return Ok();
}

Result<void> IdAllocator::unbind(NetEntity net) {
    auto it = net_to_uid_.find(net);
    if (it == net_to_uid_.end()) {
        return Err(EntityError::unknown_id(net.to_string()));
    }

    uid_to_net_.erase(it->second);
    net_to_uid_.erase(it);
    return Ok();
}

Result<EntityUid> IdAllocator::resolve(NetEntity net) const {
    auto it = net_to_uid_.find(net);
    if (it == net_to_uid_.end()) {
        return Err<EntityUid>(EntityError::unknown_id(net.to_string()));
    }
    return it->second;
}

Result<NetEntity> IdAllocator::resolve(EntityUid uid) const {
    auto it = uid_to_net_.find(uid);
    if (it == uid_to_net_.end()) {
        return Err<NetEntity>(EntityError::unknown_id(uid.to_string()));
    }
    return it->second;
}

std::optional<EntityUid> IdAllocator::try_resolve(NetEntity net) const noexcept {
    auto it = net_to_uid_.find(net);
    if (it == net_to_uid_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<NetEntity> IdAllocator::try_resolve(EntityUid uid) const noexcept {
    auto it = uid_to_net_.find(uid);
    if (it == uid_to_net_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sim_ecs
