// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "draft/draft_state.hpp"
#include "draft/draft_types.hpp"
#include "draft/event_processor.hpp"
#include "draft/notifications.hpp"
#include "draft/player_resolution.hpp"
#include "network/connection_manager.hpp"
#include "util/files.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace draftops {

namespace draft {
class ConsistencyValidator;
}
namespace network {
class FrameTransport;
}
namespace rpc {
class RPCServer;
}
namespace util {
class DataDirLock;
}

namespace app {

// Application configuration
struct AppConfig {
  // Data directory
  std::filesystem::path datadir;

  // Config file; empty means <datadir>/draftops.json if it exists
  std::filesystem::path conf_file;

  // League, tracked team and draft shape
  draft::DraftSession session;
  std::vector<std::string> draft_order;
  std::vector<std::string> player_pool;
  std::vector<draft::PlayerInfo> players;

  // Feed endpoint (host:port); empty runs without a feed
  std::string stream;

  // Component configuration
  draft::DraftStateStore::Config store_config;
  draft::EventProcessor::Config processor_config;
  draft::PlayerResolutionService::Config resolver_config;
  network::ConnectionResilienceManager::Config connection_config;

  // Periodic state file export (0 = only on shutdown)
  std::chrono::seconds export_interval{60};

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

/**
 * Merge a JSON config file into config.
 *
 * Keys missing from the file keep their current value. Returns false and
 * sets error on unreadable files, malformed JSON, wrongly typed values and
 * out-of-range numbers.
 */
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config, std::string &error);

// Same as LoadConfigFile() for an already-read document
bool ApplyConfigJson(const std::string &text, AppConfig &config, std::string &error);

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  draft::DraftStateStore &store() { return *store_; }
  draft::EventProcessor &processor() { return *processor_; }
  draft::DraftNotifications &notifications() { return *notifications_; }

  // Status
  bool is_running() const { return running_; }

  // Shutdown request (for RPC stop command and fatal consistency errors)
  void request_shutdown() { shutdown_requested_ = true; }

  // Write <datadir>/draft_state.json; returns its path, nullopt on failure
  std::optional<std::string> export_state();

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<util::DataDirLock> datadir_lock_;

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<draft::DraftNotifications> notifications_;
  std::unique_ptr<draft::DraftStateStore> store_;
  std::unique_ptr<draft::ConsistencyValidator> validator_;
  std::unique_ptr<draft::PlayerResolutionService> resolver_;
  std::unique_ptr<draft::EventProcessor> processor_;
  std::shared_ptr<network::FrameTransport> transport_;
  std::unique_ptr<network::ConnectionResilienceManager> connection_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  // Periodic export thread
  std::unique_ptr<std::thread> export_thread_;

  // Notification subscriptions
  // IMPORTANT: Must be declared AFTER components so they are destroyed BEFORE
  draft::DraftNotifications::Subscription completed_sub_;
  draft::DraftNotifications::Subscription recovered_sub_;
  draft::DraftNotifications::Subscription missed_sub_;
  draft::DraftNotifications::Subscription connection_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_draft();
  bool init_connection();
  bool init_rpc();
  void subscribe_notifications();

  // Frame pipeline entry point (IO thread)
  void on_frame(const std::string &frame);

  // Periodic export
  void start_periodic_exports();
  void stop_periodic_exports();
  void periodic_export_loop();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace draftops
