// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace draftops {

// Forward declarations
namespace draft {
class ConsistencyValidator;
class DraftStateStore;
class EventProcessor;
class PlayerResolutionService;
} // namespace draft
namespace network {
class ConnectionResilienceManager;
}

namespace rpc {

/**
 * RPC Server using Unix Domain Sockets (Local-Only Access)
 *
 * Serves the draft query surface to draftops-cli and local consumers (UIs,
 * recommendation engines). There is no TCP listener; access control is the
 * socket file's permissions (0600).
 *
 * The socket is created at: datadir/draftops.sock
 *
 * Request:  {"method": "<name>", "params": ["...", ...]}
 * Response: JSON document, or {"error": "..."} on failure.
 * One request per connection; the server closes after replying.
 */
class RPCServer {
public:
  using CommandHandler = std::function<std::string(const std::vector<std::string> &)>;

  // Optional collaborators; a null pointer disables the methods that need it
  struct Components {
    draft::DraftStateStore *store{nullptr};
    draft::EventProcessor *processor{nullptr};
    draft::ConsistencyValidator *validator{nullptr};
    draft::PlayerResolutionService *resolver{nullptr};
    network::ConnectionResilienceManager *connection{nullptr};
    // Writes the state file; returns its path, nullopt on failure
    std::function<std::optional<std::string>()> export_state;
  };

  RPCServer(const std::string &socket_path, Components components,
            std::function<void()> shutdown_callback = nullptr);
  ~RPCServer();

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Run one command as if received over the socket
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params);

  std::vector<std::string> GetMethods() const;

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  // Command handlers - Draft state
  std::string HandleGetState(const std::vector<std::string> &params);
  std::string HandleGetCurrentPick(const std::vector<std::string> &params);
  std::string HandleGetRoster(const std::vector<std::string> &params);
  std::string HandleGetRosters(const std::vector<std::string> &params);
  std::string HandleGetAvailable(const std::vector<std::string> &params);
  std::string HandleGetPicks(const std::vector<std::string> &params);
  std::string HandleGetMyPicks(const std::vector<std::string> &params);

  // Command handlers - Diagnostics
  std::string HandleGetStats(const std::vector<std::string> &params);
  std::string HandleValidate(const std::vector<std::string> &params);
  std::string HandleGetSnapshot(const std::vector<std::string> &params);
  std::string HandleRollback(const std::vector<std::string> &params);
  std::string HandleGetConnection(const std::vector<std::string> &params);
  std::string HandleExportState(const std::vector<std::string> &params);

  // Command handlers - Control
  std::string HandleStop(const std::vector<std::string> &params);

  std::string socket_path_;
  Components components_;
  std::function<void()> shutdown_callback_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;

  std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace draftops
