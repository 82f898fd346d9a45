#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sim_event

#include <cstdint>

namespace sim_event {

enum class EventSource : std::uint8_t;
struct SubscriptionId;
struct SubscribeOptions;
class EntityEventBus;
class SubscriptionGuard;

} // namespace sim_event
