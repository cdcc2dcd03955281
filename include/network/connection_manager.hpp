// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_state.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace draftops {

namespace draft {
class DraftNotifications;
}

namespace network {

// Default resilience parameters
static constexpr std::chrono::seconds DEFAULT_HEARTBEAT_TIMEOUT{30};
static constexpr std::chrono::seconds DEFAULT_HEARTBEAT_CHECK_INTERVAL{5};
static constexpr int DEFAULT_MAX_RECONNECT_ATTEMPTS = 5;
static constexpr std::chrono::seconds DEFAULT_RESYNC_SETTLE{2};

// What we knew when the connection dropped
struct PreDisconnectState {
  int last_pick{0};
  uint64_t message_count{0};
  int64_t timestamp{0}; // unix seconds

  nlohmann::json ToJson() const;
};

struct ConnectionStats {
  uint64_t reconnect_successes{0};
  uint64_t reconnect_failures{0}; // recoveries that ended in FAILED
  uint64_t total_disconnects{0};
  uint64_t missed_picks_detected{0};

  nlohmann::json ToJson() const;
};

/**
 * ConnectionResilienceManager - keeps the draft stream alive
 *
 * Architecture:
 * - Wraps a FrameTransport; every inbound frame refreshes the heartbeat and
 *   is forwarded to the frame handler (the processing pipeline)
 * - A heartbeat steady_timer checks staleness every heartbeat_check_interval
 * - handle_disconnection() moves to RECONNECTING and runs bounded backoff
 *   reconnection; a second call while RECONNECTING is a no-op, so
 *   overlapping timeouts and transport errors start only one recovery
 * - After reconnecting, the server replays picks made during the outage on
 *   its own schedule. Each replayed SELECTED restarts a settle timer; once
 *   the stream has been quiet for resync_settle, resynchronize() compares
 *   the last pick seen before and after the outage and reports the gap.
 *   An outage during that window keeps the original baseline.
 *
 * Threading:
 * - Timers, reconnect attempts and resynchronisation run on the io_context
 * - handle_disconnection() and check_heartbeat() may be called from any
 *   thread; the state transition is made under mutex_
 * - With an external io_context (tests) the caller drives run()/poll();
 *   otherwise one owned IO thread is started by start()
 *
 * State flow:
 *   DISCONNECTED -> CONNECTING -> CONNECTED <-> RECONNECTING -> FAILED
 */
class ConnectionResilienceManager {
public:
  using FrameHandler = std::function<void(const std::string &frame)>;

  struct Config {
    std::chrono::milliseconds heartbeat_timeout{DEFAULT_HEARTBEAT_TIMEOUT};
    std::chrono::milliseconds heartbeat_check_interval{DEFAULT_HEARTBEAT_CHECK_INTERVAL};
    int max_reconnect_attempts{DEFAULT_MAX_RECONNECT_ATTEMPTS};
    // Delay before attempt k (k >= 1); the last entry repeats
    std::vector<std::chrono::milliseconds> reconnect_delays{
        std::chrono::seconds(1), std::chrono::seconds(2), std::chrono::seconds(4),
        std::chrono::seconds(8), std::chrono::seconds(16)};
    bool enable_recovery{true};
    // Quiet period after a reconnect before missed picks are counted
    std::chrono::milliseconds resync_settle{DEFAULT_RESYNC_SETTLE};
  };

  // notifications may be null; a null io_context means use an owned one
  ConnectionResilienceManager(Config config, std::shared_ptr<FrameTransport> transport,
                              draft::DraftNotifications *notifications = nullptr,
                              std::shared_ptr<boost::asio::io_context> external_io_context =
                                  nullptr);
  ~ConnectionResilienceManager();

  ConnectionResilienceManager(const ConnectionResilienceManager &) = delete;
  ConnectionResilienceManager &operator=(const ConnectionResilienceManager &) = delete;

  // Must be set before start()
  void set_frame_handler(FrameHandler handler);

  /**
   * Connect to target and start heartbeat monitoring.
   * A failed first connect enters recovery like any other disconnect.
   * @return true if the first connect succeeded
   */
  bool start(const std::string &target);

  // Cancel timers and any backoff wait, close the transport, join IO thread
  void stop();

  /**
   * Begin recovery. No-op while RECONNECTING or FAILED, or when stopped.
   * With recovery disabled, goes straight to FAILED.
   */
  void handle_disconnection(const std::string &reason);

  // One heartbeat staleness check (the timer calls this)
  void check_heartbeat();

  /**
   * Compare the pick seen before the outage with the latest one, report
   * any gap and clear the pre-disconnect snapshot.
   * @return number of picks missed (0 if none or nothing to compare)
   */
  int resynchronize();

  // Transport frame callback entry point
  void on_frame(FrameDirection direction, const std::string &frame);

  ConnectionState state() const;
  bool is_running() const { return running_.load(std::memory_order_acquire); }
  bool is_healthy() const;
  nlohmann::json health_report() const;
  ConnectionStats get_stats() const;

  std::optional<PreDisconnectState> pre_disconnect_state() const;
  int last_known_pick() const { return last_known_pick_.load(); }
  uint64_t message_count() const { return message_count_.load(); }
  int reconnect_attempts() const;
  int last_missed_picks() const;
  // Reconnected, waiting for the replay to settle before comparing picks
  bool resync_pending() const;

  // Seconds since the last inbound frame (nullopt before the first one)
  std::optional<double> seconds_since_heartbeat() const;

  // Delay before 0-based attempt (attempt 0 is immediate)
  std::chrono::milliseconds backoff_delay(int attempt) const;

  const std::string &target() const { return target_; }

private:
  // Caller holds mutex_; returns the previous state
  ConnectionState set_state_locked(ConnectionState new_state);
  void notify_state(ConnectionState old_state, ConnectionState new_state);

  void schedule_heartbeat_check();
  void schedule_reconnect(int attempt);
  void schedule_resync();
  void attempt_reconnect(int attempt);
  void on_reconnected();
  void on_recovery_exhausted();

  const Config config_;
  std::shared_ptr<FrameTransport> transport_;
  draft::DraftNotifications *notifications_;

  std::shared_ptr<boost::asio::io_context> io_context_;
  const bool external_io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  // Timers are only touched on the io_context or under timer_mutex_
  std::mutex timer_mutex_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer backoff_timer_;
  boost::asio::steady_timer resync_timer_;

  FrameHandler frame_handler_;
  std::string target_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  ConnectionState state_{ConnectionState::DISCONNECTED};
  std::optional<std::chrono::steady_clock::time_point> last_heartbeat_;
  std::optional<PreDisconnectState> pre_disconnect_;
  bool resync_pending_{false};
  int reconnect_attempts_{0};
  int last_missed_picks_{0};
  ConnectionStats stats_;

  std::atomic<int> last_known_pick_{0};
  std::atomic<uint64_t> message_count_{0};
};

} // namespace network
} // namespace draftops
