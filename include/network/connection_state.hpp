// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace draftops {
namespace network {

/**
 * Connection lifecycle
 *
 *   DISCONNECTED -> CONNECTING -> CONNECTED <-> RECONNECTING -> FAILED
 *
 * FAILED is terminal until the manager is restarted.
 */
enum class ConnectionState {
  DISCONNECTED,
  CONNECTING,
  CONNECTED,
  RECONNECTING,
  FAILED,
};

std::string ConnectionStateToString(ConnectionState state);

} // namespace network
} // namespace draftops
