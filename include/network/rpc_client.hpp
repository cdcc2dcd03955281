// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace draftops {
namespace rpc {

/**
 * Simple JSON-RPC client for querying the daemon
 *
 * Uses Unix domain sockets for IPC between cli and daemon
 */
class RPCClient {
public:
  /**
   * Constructor
   * @param socket_path Path to Unix domain socket (e.g.,
   * ~/.draftops/draftops.sock)
   */
  explicit RPCClient(const std::string &socket_path);
  ~RPCClient();

  RPCClient(const RPCClient &) = delete;
  RPCClient &operator=(const RPCClient &) = delete;

  /**
   * Connect to the daemon
   * @return true if connected successfully
   */
  bool Connect();

  /**
   * Execute RPC command
   * @param method Method name (e.g., "getstate", "getroster")
   * @param params Command parameters
   * @return Response string (JSON)
   * @throws std::runtime_error if not connected or the socket fails
   */
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params = {});

  bool IsConnected() const { return socket_fd_ >= 0; }

  void Disconnect();

private:
  std::string socket_path_;
  int socket_fd_;
};

} // namespace rpc
} // namespace draftops
