// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

/**
 * RPC Server Implementation - Unix Domain Sockets
 *
 * This RPC server uses Unix domain sockets (filesystem-based IPC) instead
 * of TCP/IP networking. This means:
 * - RPC is only accessible locally on the same machine
 * - No network port is opened
 * - Authentication is handled by filesystem permissions
 * - The socket file is created at: datadir/draftops.sock
 *
 * Every query reads a consistent copy of the draft state; the only
 * mutating method (rollback) goes through the EventProcessor so it is
 * serialised with frame processing.
 */

#include "network/rpc_server.hpp"
#include "draft/consistency_validator.hpp"
#include "draft/draft_state.hpp"
#include "draft/event_processor.hpp"
#include "draft/player_resolution.hpp"
#include "network/connection_manager.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <cstring>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace draftops {
namespace rpc {

namespace {

// Largest request accepted from a client
constexpr size_t MAX_REQUEST_SIZE = 4096;

// Upper bound on list-style results (getpicks, getavailable)
constexpr int MAX_LIST_LIMIT = 10000;

std::string Reply(const nlohmann::json &j) { return j.dump(2) + "\n"; }

std::string ErrorReply(const std::string &message) {
  return Reply(nlohmann::json{{"error", message}});
}

void SendAll(int fd, const std::string &data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t sent = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (sent <= 0) {
      LOG_NET_DEBUG("RPC client went away before the reply was sent");
      return;
    }
    offset += static_cast<size_t>(sent);
  }
}

} // namespace

RPCServer::RPCServer(const std::string &socket_path, Components components,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), components_(std::move(components)),
      shutdown_callback_(std::move(shutdown_callback)), server_fd_(-1),
      running_(false), shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  // Draft state
  handlers_["getstate"] = [this](const auto &p) { return HandleGetState(p); };
  handlers_["getcurrentpick"] = [this](const auto &p) {
    return HandleGetCurrentPick(p);
  };
  handlers_["getroster"] = [this](const auto &p) { return HandleGetRoster(p); };
  handlers_["getrosters"] = [this](const auto &p) { return HandleGetRosters(p); };
  handlers_["getavailable"] = [this](const auto &p) {
    return HandleGetAvailable(p);
  };
  handlers_["getpicks"] = [this](const auto &p) { return HandleGetPicks(p); };
  handlers_["getmypicks"] = [this](const auto &p) { return HandleGetMyPicks(p); };

  // Diagnostics
  handlers_["getstats"] = [this](const auto &p) { return HandleGetStats(p); };
  handlers_["validate"] = [this](const auto &p) { return HandleValidate(p); };
  handlers_["getsnapshot"] = [this](const auto &p) {
    return HandleGetSnapshot(p);
  };
  handlers_["rollback"] = [this](const auto &p) { return HandleRollback(p); };
  handlers_["getconnection"] = [this](const auto &p) {
    return HandleGetConnection(p);
  };
  handlers_["exportstate"] = [this](const auto &p) {
    return HandleExportState(p);
  };

  // Control
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
}

std::vector<std::string> RPCServer::GetMethods() const {
  std::vector<std::string> methods;
  methods.reserve(handlers_.size());
  for (const auto &[name, handler] : handlers_) {
    methods.push_back(name);
  }
  return methods;
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  // Remove old socket file if it exists
  unlink(socket_path_.c_str());

  // rw------- for the socket file
  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_ERROR("Failed to create RPC socket");
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    LOG_ERROR("RPC socket path too long: {}", socket_path_);
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("Failed to bind RPC socket to {}", socket_path_);
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }

  umask(old_umask);
  chmod(socket_path_.c_str(), 0600);

  if (listen(server_fd_, 5) < 0) {
    LOG_ERROR("Failed to listen on RPC socket");
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  shutting_down_.store(false, std::memory_order_release);
  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_NET_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  if (server_fd_ >= 0) {
    // Wakes the blocking accept()
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  unlink(socket_path_.c_str());

  LOG_NET_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept(server_fd_, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_NET_WARN("failed to accept RPC connection");
      }
      continue;
    }

    HandleClient(client_fd);
    close(client_fd);
  }
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendAll(client_fd, ErrorReply("Server shutting down"));
    return;
  }

  std::vector<char> buffer(MAX_REQUEST_SIZE);
  ssize_t received = recv(client_fd, buffer.data(), buffer.size(), 0);

  if (received <= 0) {
    return;
  }

  if (received >= static_cast<ssize_t>(buffer.size())) {
    LOG_NET_ERROR("RPC request too large: {} bytes", received);
    SendAll(client_fd, ErrorReply("Request too large"));
    return;
  }

  std::string request(buffer.data(), static_cast<size_t>(received));

  std::string method;
  std::vector<std::string> params;

  try {
    nlohmann::json j = nlohmann::json::parse(request);

    if (!j.contains("method") || !j["method"].is_string()) {
      SendAll(client_fd, ErrorReply("Missing or invalid method field"));
      return;
    }

    method = j["method"].get<std::string>();

    if (j.contains("params")) {
      if (j["params"].is_array()) {
        for (const auto &param : j["params"]) {
          if (param.is_string()) {
            params.push_back(param.get<std::string>());
          } else {
            params.push_back(param.dump());
          }
        }
      } else if (j["params"].is_string()) {
        params.push_back(j["params"].get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_NET_WARN("RPC JSON parse error: {}", e.what());
    SendAll(client_fd, ErrorReply("Invalid JSON"));
    return;
  }

  SendAll(client_fd, ExecuteCommand(method, params));
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return ErrorReply("Unknown command");
  }

  try {
    return it->second(params);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("RPC command '{}' failed: {}", method, e.what());
    return ErrorReply(e.what());
  }
}

// ============================================================================
// Draft state
// ============================================================================

std::string RPCServer::HandleGetState(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  return Reply(components_.store->ToJson());
}

std::string RPCServer::HandleGetCurrentPick(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  const auto &store = *components_.store;
  nlohmann::json j;
  j["current_pick"] = store.GetCurrentPick();
  j["on_the_clock"] = store.GetOnTheClock();
  j["time_remaining"] = store.GetTimeRemaining();
  j["picks_until_next"] = store.GetPicksUntilNext();
  j["status"] = draft::DraftStatusToString(store.GetStatus());
  j["my_turn"] = !store.GetOnTheClock().empty() &&
                 store.GetOnTheClock() == store.session().team_id;
  return Reply(j);
}

std::string RPCServer::HandleGetRoster(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  const auto &store = *components_.store;
  const std::string team = params.empty() ? store.session().team_id : params[0];

  auto roster = store.GetRoster(team);
  if (!roster) {
    return ErrorReply("No roster for team " + team);
  }

  nlohmann::json j;
  j["team_id"] = team;
  j["size"] = draft::RosterSize(*roster);
  j["roster"] = draft::RosterToJson(*roster);
  return Reply(j);
}

std::string RPCServer::HandleGetRosters(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  const auto &store = *components_.store;

  nlohmann::json rosters = nlohmann::json::object();
  rosters[store.session().team_id] = draft::RosterToJson(store.GetMyRoster());
  for (const auto &[team, roster] : store.GetOtherRosters()) {
    rosters[team] = draft::RosterToJson(roster);
  }
  return Reply(rosters);
}

std::string RPCServer::HandleGetAvailable(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }

  std::optional<std::string> position;
  if (!params.empty() && params[0] != "*" && !params[0].empty()) {
    position = draft::NormalizeRosterSlot(params[0]);
    if (!position) {
      return ErrorReply("Unknown position: " + params[0]);
    }
  }

  size_t limit = 50;
  if (params.size() > 1) {
    auto parsed = util::SafeParseInt(params[1], 0, MAX_LIST_LIMIT);
    if (!parsed) {
      return ErrorReply("Invalid limit (must be 0-10000)");
    }
    limit = static_cast<size_t>(*parsed);
  }

  auto *resolver = components_.resolver;
  if (position && !resolver) {
    return ErrorReply("Position filter requires player resolution");
  }

  std::function<bool(const std::string &)> filter;
  if (position) {
    filter = [resolver, &position](const std::string &player_id) {
      auto info = resolver->Describe(player_id);
      return info && info->position == *position;
    };
  }

  auto ids = components_.store->GetAvailablePlayers(filter, limit);

  nlohmann::json players = nlohmann::json::array();
  for (const auto &id : ids) {
    std::optional<draft::PlayerInfo> info;
    if (resolver) {
      info = resolver->GetCached(id);
    }
    players.push_back(info ? info->ToJson() : nlohmann::json{{"id", id}});
  }

  nlohmann::json j;
  j["position"] = position ? nlohmann::json(*position) : nlohmann::json(nullptr);
  j["count"] = players.size();
  j["players"] = std::move(players);
  return Reply(j);
}

std::string RPCServer::HandleGetPicks(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }

  std::vector<draft::Pick> picks;
  if (params.empty()) {
    picks = components_.store->GetPickHistory();
  } else {
    auto count = util::SafeParseInt(params[0], 1, MAX_LIST_LIMIT);
    if (!count) {
      return ErrorReply("Invalid count (must be 1-10000)");
    }
    picks = components_.store->GetRecentPicks(static_cast<size_t>(*count));
  }

  nlohmann::json arr = nlohmann::json::array();
  for (const auto &pick : picks) {
    arr.push_back(draft::PickToJson(pick));
  }
  return Reply(arr);
}

std::string RPCServer::HandleGetMyPicks(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  const auto &store = *components_.store;
  const int current = store.GetCurrentPick();

  nlohmann::json upcoming = nlohmann::json::array();
  nlohmann::json all = nlohmann::json::array();
  for (int pick : store.GetMyPickNumbers()) {
    all.push_back(pick);
    if (pick > current) {
      upcoming.push_back(pick);
    }
  }

  nlohmann::json j;
  j["team_id"] = store.session().team_id;
  j["pick_numbers"] = std::move(all);
  j["upcoming"] = std::move(upcoming);
  j["picks_until_next"] = store.GetPicksUntilNext();
  return Reply(j);
}

// ============================================================================
// Diagnostics
// ============================================================================

std::string RPCServer::HandleGetStats(const std::vector<std::string> &params) {
  nlohmann::json j;
  if (components_.store) {
    j["draft"] = components_.store->GetStats().ToJson();
  }
  if (components_.processor) {
    j["processor"] = components_.processor->GetStats().ToJson();
  }
  if (components_.validator) {
    j["validator"] = components_.validator->GetStats().ToJson();
  }
  if (components_.resolver) {
    j["resolver"] = components_.resolver->GetStats().ToJson();
  }
  if (components_.connection) {
    j["connection"] = components_.connection->get_stats().ToJson();
  }
  return Reply(j);
}

std::string RPCServer::HandleValidate(const std::vector<std::string> &params) {
  if (!components_.validator) {
    return ErrorReply("Validator not available");
  }
  return Reply(components_.validator->Validate().ToJson());
}

std::string RPCServer::HandleGetSnapshot(const std::vector<std::string> &params) {
  if (!components_.store) {
    return ErrorReply("Draft state not available");
  }
  if (params.empty()) {
    return ErrorReply("Missing snapshot index parameter");
  }
  auto index = util::SafeParseInt64(params[0], -1000000, 1000000);
  if (!index) {
    return ErrorReply("Invalid snapshot index");
  }

  auto snapshot = components_.store->GetSnapshot(*index);
  if (!snapshot) {
    return ErrorReply("Snapshot index out of range (have " +
                           std::to_string(components_.store->SnapshotCount()) + ")");
  }
  return Reply(snapshot->ToJson());
}

std::string RPCServer::HandleRollback(const std::vector<std::string> &params) {
  if (!components_.processor || !components_.store) {
    return ErrorReply("Draft state not available");
  }
  if (params.empty()) {
    return ErrorReply("Missing snapshot index parameter");
  }
  auto index = util::SafeParseInt64(params[0], -1000000, 1000000);
  if (!index) {
    return ErrorReply("Invalid snapshot index");
  }

  LOG_WARN("Rollback to snapshot {} requested via RPC", *index);
  if (!components_.processor->RollbackToSnapshot(*index)) {
    return ErrorReply("Snapshot index out of range");
  }

  nlohmann::json j;
  j["success"] = true;
  j["current_pick"] = components_.store->GetCurrentPick();
  j["snapshots"] = components_.store->SnapshotCount();
  return Reply(j);
}

std::string RPCServer::HandleGetConnection(const std::vector<std::string> &params) {
  if (!components_.connection) {
    return ErrorReply("No feed connection configured");
  }
  return Reply(components_.connection->health_report());
}

std::string RPCServer::HandleExportState(const std::vector<std::string> &params) {
  if (!components_.export_state) {
    return ErrorReply("State export not configured");
  }
  auto path = components_.export_state();
  if (!path) {
    return ErrorReply("Failed to write state file");
  }
  nlohmann::json j;
  j["success"] = true;
  j["path"] = *path;
  return Reply(j);
}

// ============================================================================
// Control
// ============================================================================

std::string RPCServer::HandleStop(const std::vector<std::string> &params) {
  LOG_INFO("Received stop command via RPC");

  // Reject anything that arrives while shutting down
  shutting_down_.store(true, std::memory_order_release);

  if (shutdown_callback_) {
    shutdown_callback_();
  }

  return "\"draftops stopping\"\n";
}

} // namespace rpc
} // namespace draftops
