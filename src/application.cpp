// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "draft/consistency_validator.hpp"
#include "network/rpc_server.hpp"
#include "network/tcp_transport.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace draftops {
namespace app {

// ============================================================================
// Configuration file
// ============================================================================

namespace {

constexpr int MAX_TEAM_COUNT = 32;
constexpr int MAX_ROUNDS = 50;
constexpr size_t MAX_SNAPSHOT_CAPACITY = 10000;

// Reads key into out when present; throws nlohmann::json::type_error on a
// wrongly typed value
template <typename T>
void ReadKey(const nlohmann::json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->template get<T>();
  }
}

bool ReadSeconds(const nlohmann::json &j, const char *key, std::chrono::milliseconds &out,
                 std::string &error) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  const double seconds = it->get<double>();
  if (seconds <= 0.0) {
    error = std::string(key) + " must be positive";
    return false;
  }
  out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
  return true;
}

} // namespace

bool ApplyConfigJson(const std::string &text, AppConfig &config, std::string &error) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    error = std::string("malformed JSON: ") + e.what();
    return false;
  }

  if (!j.is_object()) {
    error = "config root must be a JSON object";
    return false;
  }

  // Work on a copy so a bad file leaves config untouched
  AppConfig next = config;
  try {
    ReadKey(j, "league_id", next.session.league_id);
    ReadKey(j, "team_id", next.session.team_id);
    ReadKey(j, "team_count", next.session.team_count);
    ReadKey(j, "rounds", next.session.rounds);
    ReadKey(j, "draft_order", next.draft_order);
    ReadKey(j, "player_pool", next.player_pool);
    ReadKey(j, "stream", next.stream);
    ReadKey(j, "snapshot_capacity", next.store_config.snapshot_capacity);
    ReadKey(j, "validate_every_picks", next.processor_config.validate_every_picks);
    ReadKey(j, "clock_warning_sec", next.processor_config.clock_warning_seconds);
    ReadKey(j, "max_reconnect_attempts", next.connection_config.max_reconnect_attempts);
    ReadKey(j, "enable_recovery", next.connection_config.enable_recovery);
    ReadKey(j, "resolver_batch_size", next.resolver_config.batch_size);

    if (!ReadSeconds(j, "heartbeat_timeout_sec", next.connection_config.heartbeat_timeout,
                     error) ||
        !ReadSeconds(j, "heartbeat_check_interval_sec",
                     next.connection_config.heartbeat_check_interval, error) ||
        !ReadSeconds(j, "resync_settle_sec", next.connection_config.resync_settle, error)) {
      return false;
    }

    if (auto it = j.find("reconnect_delays_sec"); it != j.end() && !it->is_null()) {
      std::vector<std::chrono::milliseconds> delays;
      for (const auto &value : it->get<std::vector<double>>()) {
        if (value < 0.0) {
          error = "reconnect_delays_sec entries must not be negative";
          return false;
        }
        delays.emplace_back(static_cast<long long>(value * 1000.0));
      }
      if (delays.empty()) {
        error = "reconnect_delays_sec must not be empty";
        return false;
      }
      next.connection_config.reconnect_delays = std::move(delays);
    }

    if (auto it = j.find("export_interval_sec"); it != j.end() && !it->is_null()) {
      const int seconds = it->get<int>();
      if (seconds < 0) {
        error = "export_interval_sec must not be negative";
        return false;
      }
      next.export_interval = std::chrono::seconds(seconds);
    }

    if (auto it = j.find("players"); it != j.end() && !it->is_null()) {
      if (!it->is_object()) {
        error = "players must be an object of id -> {name, position}";
        return false;
      }
      next.players.clear();
      for (const auto &[id, entry] : it->items()) {
        draft::PlayerInfo info;
        info.id = id;
        info.name = entry.value("name", std::string{});
        info.position = entry.value("position", std::string{});
        next.players.push_back(std::move(info));
      }
    }
  } catch (const nlohmann::json::exception &e) {
    error = std::string("invalid value: ") + e.what();
    return false;
  }

  if (next.session.team_count < 1 || next.session.team_count > MAX_TEAM_COUNT) {
    error = "team_count must be between 1 and " + std::to_string(MAX_TEAM_COUNT);
    return false;
  }
  if (next.session.rounds < 1 || next.session.rounds > MAX_ROUNDS) {
    error = "rounds must be between 1 and " + std::to_string(MAX_ROUNDS);
    return false;
  }
  if (next.connection_config.max_reconnect_attempts < 0) {
    error = "max_reconnect_attempts must not be negative";
    return false;
  }
  if (next.store_config.snapshot_capacity == 0 ||
      next.store_config.snapshot_capacity > MAX_SNAPSHOT_CAPACITY) {
    error = "snapshot_capacity must be between 1 and " + std::to_string(MAX_SNAPSHOT_CAPACITY);
    return false;
  }
  if (next.resolver_config.batch_size == 0 || next.resolver_config.batch_size > 10000) {
    error = "resolver_batch_size must be between 1 and 10000";
    return false;
  }

  config = std::move(next);
  return true;
}

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config, std::string &error) {
  auto text = util::read_file_string(path);
  if (!text) {
    error = "cannot read " + path.string();
    return false;
  }
  return ApplyConfigJson(*text, config, error);
}

// ============================================================================
// Application
// ============================================================================

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(config_.session.league_id, config_.session.team_id)
            << std::flush;

  LOG_INFO("Initializing draftops...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_draft()) {
    LOG_ERROR("Failed to initialize draft state");
    return false;
  }

  if (!init_connection()) {
    LOG_ERROR("Failed to initialize feed connection");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  subscribe_notifications();

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting draftops...");

  setup_signal_handlers();

  resolver_->Start();

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    return false;
  }

  running_ = true;

  if (connection_) {
    // A failed first connect is handled by the recovery loop
    if (!connection_->start(config_.stream)) {
      LOG_WARN("Initial connection to {} failed, recovering", config_.stream);
    }
  } else {
    LOG_INFO("No stream configured; serving queries only");
  }

  start_periodic_exports();

  LOG_INFO("draftops started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down draftops...");

  running_ = false;

  stop_periodic_exports();

  // Unsubscribe from notifications BEFORE stopping components
  completed_sub_.Unsubscribe();
  recovered_sub_.Unsubscribe();
  missed_sub_.Unsubscribe();
  connection_sub_.Unsubscribe();

  // Stop RPC server first (stop accepting new requests)
  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  // Stop the feed so no frame arrives after this point
  if (connection_) {
    LOG_INFO("Stopping feed connection...");
    connection_->stop();
  }

  if (resolver_) {
    LOG_INFO("Stopping player resolution...");
    resolver_->Shutdown();
  }

  if (store_) {
    LOG_INFO("Saving draft state...");
    if (!export_state()) {
      LOG_ERROR("Failed to save draft state");
    }
  }

  if (datadir_lock_) {
    LOG_INFO("Releasing data directory lock...");
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  datadir_lock_ = std::make_unique<util::DataDirLock>(config_.datadir, ".lock");
  util::LockResult lock_result = datadir_lock_->Acquire();

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "draftopsd is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_draft() {
  const auto &session = config_.session;
  if (session.team_id.empty()) {
    LOG_ERROR("No team configured (set team_id or pass --team=)");
    return false;
  }

  LOG_INFO("League {}: tracking team {} ({} teams, {} rounds)", session.league_id,
           session.team_id, session.team_count, session.rounds);

  notifications_ = std::make_unique<draft::DraftNotifications>();
  store_ = std::make_unique<draft::DraftStateStore>(session, config_.store_config);

  store_->InitializePlayerPool(config_.player_pool);
  LOG_INFO("Player pool: {} players", config_.player_pool.size());

  if (!config_.draft_order.empty()) {
    if (static_cast<int>(config_.draft_order.size()) != session.team_count) {
      LOG_WARN("Draft order lists {} teams, expected {}", config_.draft_order.size(),
               session.team_count);
    }
    if (!store_->SetDraftOrder(config_.draft_order)) {
      LOG_WARN("Team {} is not in the draft order; pick tracking disabled", session.team_id);
    }
  } else {
    LOG_WARN("No draft order configured; pick tracking disabled");
  }

  validator_ = std::make_unique<draft::ConsistencyValidator>(*store_, notifications_.get());

  auto directory = std::make_shared<draft::StaticPlayerDirectory>(config_.players);
  LOG_INFO("Player directory: {} entries", directory->Size());
  resolver_ = std::make_unique<draft::PlayerResolutionService>(
      directory, *store_, *notifications_, config_.resolver_config);

  processor_ = std::make_unique<draft::EventProcessor>(*store_, *validator_, *notifications_,
                                                       config_.processor_config);
  auto *resolver = resolver_.get();
  processor_->SetPositionResolver(
      [resolver](const std::string &player_id) { return resolver->ResolvePosition(player_id); });

  return true;
}

bool Application::init_connection() {
  if (config_.stream.empty()) {
    return true;
  }

  if (!network::ParseEndpoint(config_.stream)) {
    LOG_ERROR("Invalid stream endpoint '{}' (expected host:port)", config_.stream);
    return false;
  }

  transport_ = std::make_shared<network::TcpFrameTransport>();
  connection_ = std::make_unique<network::ConnectionResilienceManager>(
      config_.connection_config, transport_, notifications_.get());
  connection_->set_frame_handler([this](const std::string &frame) { on_frame(frame); });
  return true;
}

bool Application::init_rpc() {
  LOG_INFO("Initializing RPC server...");

  std::string socket_path = (config_.datadir / "draftops.sock").string();

  rpc::RPCServer::Components components;
  components.store = store_.get();
  components.processor = processor_.get();
  components.validator = validator_.get();
  components.resolver = resolver_.get();
  components.connection = connection_.get();
  components.export_state = [this]() { return export_state(); };

  rpc_server_ = std::make_unique<rpc::RPCServer>(socket_path, std::move(components),
                                                 [this]() { request_shutdown(); });
  return true;
}

void Application::subscribe_notifications() {
  completed_sub_ = notifications_->SubscribeDraftCompleted([this](size_t total_picks) {
    LOG_INFO("Draft complete after {} picks; saving final state", total_picks);
    if (!export_state()) {
      LOG_ERROR("Failed to save final draft state");
    }
  });

  recovered_sub_ = notifications_->SubscribeStateRecovered([](long long snapshot_index) {
    LOG_WARN("Draft state recovered from snapshot {}", snapshot_index);
  });

  missed_sub_ = notifications_->SubscribePicksMissed([](int missed) {
    LOG_WARN("{} pick(s) were made while the feed was down", missed);
  });

  connection_sub_ = notifications_->SubscribeConnectionState(
      [this](network::ConnectionState old_state, network::ConnectionState new_state) {
        LOG_INFO("Feed connection: {} -> {}", network::ConnectionStateToString(old_state),
                 network::ConnectionStateToString(new_state));
        if (new_state == network::ConnectionState::FAILED) {
          LOG_ERROR("Feed connection to {} failed permanently; draft state is frozen",
                    config_.stream);
        }
      });
}

void Application::on_frame(const std::string &frame) {
  try {
    processor_->ProcessFrame(frame);
  } catch (const draft::ConsistencyViolation &e) {
    LOG_ERROR("Unrecoverable draft state inconsistency: {}", e.what());
    for (const auto &error : e.errors()) {
      LOG_ERROR("  {}", error);
    }
    request_shutdown();
  }
}

std::optional<std::string> Application::export_state() {
  if (!store_) {
    return std::nullopt;
  }
  const auto path = config_.datadir / "draft_state.json";
  if (!util::atomic_write_file(path, store_->ToJson().dump(2) + "\n")) {
    LOG_ERROR("Failed to write {}", path.string());
    return std::nullopt;
  }
  LOG_DEBUG("Draft state written to {}", path.string());
  return path.string();
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

void Application::start_periodic_exports() {
  if (config_.export_interval.count() <= 0) {
    return;
  }
  LOG_INFO("Starting periodic state export (every {}s)", config_.export_interval.count());
  export_thread_ = std::make_unique<std::thread>(&Application::periodic_export_loop, this);
}

void Application::stop_periodic_exports() {
  if (export_thread_ && export_thread_->joinable()) {
    LOG_DEBUG("Stopping periodic export thread");
    export_thread_->join();
    export_thread_.reset();
  }
}

void Application::periodic_export_loop() {
  using namespace std::chrono;

  auto last_export = steady_clock::now();

  while (running_) {
    std::this_thread::sleep_for(seconds(1));

    if (!running_)
      break;

    auto now = steady_clock::now();
    if (now - last_export >= config_.export_interval) {
      if (!export_state()) {
        LOG_ERROR("Periodic state export failed");
      }
      last_export = now;
    }
  }
}

} // namespace app
} // namespace draftops
