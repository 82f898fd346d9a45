#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sim_net

#include <cstdint>

namespace sim_net {

/// Connected peer identifier
using SessionId = std::uint32_t;

template<typename T>
struct SessionMessage;

class SystemMessage;
enum class EntityMessageType : std::uint8_t;
struct InboundMessage;
struct OutboundMessage;

enum class SessionStatus : std::uint8_t;
class ITransport;
class IReplayRecorder;

class ReconciliationQueue;
class EntityNetworkManager;

} // namespace sim_net
