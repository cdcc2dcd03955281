// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <string>

namespace draftops {
namespace network {

// Abstract frame source for the draft-room stream
// Allows dependency injection of different implementations:
// - TcpFrameTransport: newline-delimited frames over TCP via boost::asio
// - MockFrameTransport: scripted frames and failures for testing (in test/)

enum class FrameDirection {
  INBOUND,
  OUTBOUND,
};

// Callback types for transport events
using FrameCallback = std::function<void(FrameDirection direction, const std::string &frame)>;
using DisconnectCallback = std::function<void(const std::string &reason)>;

// FrameTransport - Abstract interface for one draft-room connection
// Implementations deliver raw frames only; they do no parsing.
class FrameTransport {
public:
  virtual ~FrameTransport() = default;

  // Open a connection to target (implementation-defined, e.g. "host:port").
  // Blocks until connected or failed. Closes any previous connection first.
  virtual bool connect(const std::string &target) = 0;

  // Lightweight session refresh on the existing connection.
  // Returns false if there is no usable connection.
  virtual bool refresh() = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Frame callbacks may run on a transport-owned thread
  virtual void set_frame_callback(FrameCallback callback) = 0;

  // Invoked at most once per connection, when it drops unexpectedly.
  // Not invoked for close().
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

} // namespace network
} // namespace draftops
