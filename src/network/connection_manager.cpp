// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_manager.hpp"
#include "draft/notifications.hpp"
#include "protocol/protocol.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace draftops {
namespace network {

std::string ConnectionStateToString(ConnectionState state) {
  switch (state) {
  case ConnectionState::DISCONNECTED:
    return "disconnected";
  case ConnectionState::CONNECTING:
    return "connecting";
  case ConnectionState::CONNECTED:
    return "connected";
  case ConnectionState::RECONNECTING:
    return "reconnecting";
  case ConnectionState::FAILED:
    return "failed";
  }
  return "unknown";
}

nlohmann::json PreDisconnectState::ToJson() const {
  return nlohmann::json{
      {"last_pick", last_pick}, {"message_count", message_count}, {"timestamp", timestamp}};
}

nlohmann::json ConnectionStats::ToJson() const {
  return nlohmann::json{{"reconnect_successes", reconnect_successes},
                        {"reconnect_failures", reconnect_failures},
                        {"total_disconnects", total_disconnects},
                        {"missed_picks_detected", missed_picks_detected}};
}

ConnectionResilienceManager::ConnectionResilienceManager(
    Config config, std::shared_ptr<FrameTransport> transport,
    draft::DraftNotifications *notifications,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      notifications_(notifications),
      io_context_(external_io_context ? external_io_context
                                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      heartbeat_timer_(*io_context_),
      backoff_timer_(*io_context_),
      resync_timer_(*io_context_) {
  LOG_NET_TRACE("ConnectionResilienceManager initialized (heartbeat timeout {}ms, "
                "{} attempts, recovery {}, external_io_context: {})",
                config_.heartbeat_timeout.count(), config_.max_reconnect_attempts,
                config_.enable_recovery ? "on" : "off", external_io_context_ ? "yes" : "no");
}

ConnectionResilienceManager::~ConnectionResilienceManager() { stop(); }

void ConnectionResilienceManager::set_frame_handler(FrameHandler handler) {
  frame_handler_ = std::move(handler);
}

bool ConnectionResilienceManager::start(const std::string &target) {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  target_ = target;

  transport_->set_frame_callback(
      [this](FrameDirection direction, const std::string &frame) { on_frame(direction, frame); });
  transport_->set_disconnect_callback(
      [this](const std::string &reason) { handle_disconnection(reason); });

  // Only spawn a thread for an owned io_context; tests drive external ones
  if (!external_io_context_) {
    io_context_->restart();
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    io_thread_ = std::thread([this]() { io_context_->run(); });
  }

  ConnectionState old_state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_state = set_state_locked(ConnectionState::CONNECTING);
  }
  notify_state(old_state, ConnectionState::CONNECTING);
  LOG_NET_INFO("Connecting to draft stream {}", target);

  if (!transport_->connect(target)) {
    LOG_NET_WARN("Initial connect to {} failed", target);
    handle_disconnection("initial connect failed");
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_state = set_state_locked(ConnectionState::CONNECTED);
    last_heartbeat_ = util::GetSteadyTime();
    reconnect_attempts_ = 0;
  }
  notify_state(old_state, ConnectionState::CONNECTED);
  schedule_heartbeat_check();
  return true;
}

void ConnectionResilienceManager::stop() {
  // Set running_ = false FIRST so in-flight handlers bail out
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  transport_->set_frame_callback({});
  transport_->set_disconnect_callback({});

  // Cancel heartbeat and any backoff wait in progress
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    heartbeat_timer_.cancel();
    backoff_timer_.cancel();
    resync_timer_.cancel();
  }

  if (!external_io_context_) {
    work_guard_.reset();
    io_context_->stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
  }

  transport_->close();

  ConnectionState old_state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_state = set_state_locked(ConnectionState::DISCONNECTED);
  }
  notify_state(old_state, ConnectionState::DISCONNECTED);
  LOG_NET_INFO("Connection manager stopped");
}

// ============================================================================
// State
// ============================================================================

ConnectionState ConnectionResilienceManager::set_state_locked(ConnectionState new_state) {
  ConnectionState old_state = state_;
  state_ = new_state;
  if (old_state != new_state) {
    LOG_NET_DEBUG("Connection state {} -> {}", ConnectionStateToString(old_state),
                  ConnectionStateToString(new_state));
  }
  return old_state;
}

void ConnectionResilienceManager::notify_state(ConnectionState old_state,
                                               ConnectionState new_state) {
  if (notifications_ && old_state != new_state) {
    notifications_->NotifyConnectionState(old_state, new_state);
  }
}

ConnectionState ConnectionResilienceManager::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

// ============================================================================
// Heartbeat
// ============================================================================

void ConnectionResilienceManager::on_frame(FrameDirection direction, const std::string &frame) {
  if (direction != FrameDirection::INBOUND) {
    LOG_NET_TRACE("-> {}", frame);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_heartbeat_ = util::GetSteadyTime();
  }
  message_count_.fetch_add(1);

  // Track the pick counter for gap detection; malformed frames are the
  // pipeline's to count, so a cheap token check is enough here
  auto tokens = util::SplitWhitespace(frame);
  if (tokens.size() >= 4 && util::ToUpper(tokens[0]) == protocol::commands::SELECTED) {
    if (auto pick = util::SafeParseInt(tokens[3], 1, protocol::MAX_PICK_NUMBER)) {
      int current = last_known_pick_.load();
      while (*pick > current && !last_known_pick_.compare_exchange_weak(current, *pick)) {
      }

      bool pending = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = resync_pending_;
      }
      if (pending) {
        schedule_resync();
      }
    }
  }

  if (frame_handler_) {
    frame_handler_(frame);
  }
}

std::optional<double> ConnectionResilienceManager::seconds_since_heartbeat() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!last_heartbeat_) {
    return std::nullopt;
  }
  return std::chrono::duration<double>(util::GetSteadyTime() - *last_heartbeat_).count();
}

void ConnectionResilienceManager::check_heartbeat() {
  std::chrono::milliseconds elapsed{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::CONNECTED || !last_heartbeat_) {
      return;
    }
    elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::GetSteadyTime() -
                                                                    *last_heartbeat_);
    if (elapsed <= config_.heartbeat_timeout) {
      return;
    }
  }

  LOG_NET_WARN("No frames for {}ms (timeout {}ms)", elapsed.count(),
               config_.heartbeat_timeout.count());
  handle_disconnection("heartbeat timeout");
}

void ConnectionResilienceManager::schedule_heartbeat_check() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::lock_guard<std::mutex> lock(timer_mutex_);
  heartbeat_timer_.expires_after(config_.heartbeat_check_interval);
  heartbeat_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    check_heartbeat();
    // Recovery restarts monitoring itself once reconnected
    if (state() == ConnectionState::CONNECTED) {
      schedule_heartbeat_check();
    }
  });
}

bool ConnectionResilienceManager::is_healthy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != ConnectionState::CONNECTED) {
    return false;
  }
  if (!last_heartbeat_) {
    return true;
  }
  return util::GetSteadyTime() - *last_heartbeat_ <= config_.heartbeat_timeout;
}

// ============================================================================
// Recovery
// ============================================================================

void ConnectionResilienceManager::handle_disconnection(const std::string &reason) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  ConnectionState old_state;
  ConnectionState new_state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::RECONNECTING || state_ == ConnectionState::FAILED) {
      LOG_NET_DEBUG("Ignoring disconnect ({}), already {}", reason,
                    ConnectionStateToString(state_));
      return;
    }

    stats_.total_disconnects++;
    // A drop before the last outage was resynchronised keeps that baseline
    if (!pre_disconnect_) {
      PreDisconnectState snapshot;
      snapshot.last_pick = last_known_pick_.load();
      snapshot.message_count = message_count_.load();
      snapshot.timestamp = util::GetTime();
      pre_disconnect_ = snapshot;
    }
    resync_pending_ = false;
    reconnect_attempts_ = 0;

    new_state = config_.enable_recovery ? ConnectionState::RECONNECTING
                                        : ConnectionState::FAILED;
    old_state = set_state_locked(new_state);
  }

  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    heartbeat_timer_.cancel();
    resync_timer_.cancel();
  }

  notify_state(old_state, new_state);

  if (!config_.enable_recovery) {
    LOG_NET_ERROR("Connection lost ({}), recovery disabled", reason);
    return;
  }

  LOG_NET_WARN("Connection lost ({}), starting recovery (last pick {}, {} messages)", reason,
               last_known_pick_.load(), message_count_.load());
  schedule_reconnect(0);
}

std::chrono::milliseconds ConnectionResilienceManager::backoff_delay(int attempt) const {
  if (attempt <= 0 || config_.reconnect_delays.empty()) {
    return std::chrono::milliseconds{0};
  }
  size_t index = std::min(static_cast<size_t>(attempt - 1), config_.reconnect_delays.size() - 1);
  return config_.reconnect_delays[index];
}

void ConnectionResilienceManager::schedule_reconnect(int attempt) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto delay = backoff_delay(attempt);
  if (delay.count() == 0) {
    boost::asio::post(*io_context_, [this, attempt]() {
      if (running_.load(std::memory_order_acquire)) {
        attempt_reconnect(attempt);
      }
    });
    return;
  }

  LOG_NET_DEBUG("Next reconnect attempt in {}ms", delay.count());
  std::lock_guard<std::mutex> lock(timer_mutex_);
  backoff_timer_.expires_after(delay);
  backoff_timer_.async_wait([this, attempt](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    attempt_reconnect(attempt);
  });
}

void ConnectionResilienceManager::attempt_reconnect(int attempt) {
  if (attempt >= config_.max_reconnect_attempts) {
    on_recovery_exhausted();
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_attempts_ = attempt + 1;
  }
  LOG_NET_INFO("Reconnect attempt {}/{} to {}", attempt + 1, config_.max_reconnect_attempts,
               target_);

  bool ok = transport_->refresh();
  if (!ok) {
    LOG_NET_DEBUG("Session refresh failed, reconnecting from scratch");
    transport_->close();
    ok = transport_->connect(target_);
  }

  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  if (ok) {
    on_reconnected();
    return;
  }

  LOG_NET_WARN("Reconnect attempt {}/{} failed", attempt + 1, config_.max_reconnect_attempts);
  schedule_reconnect(attempt + 1);
}

void ConnectionResilienceManager::on_reconnected() {
  ConnectionState old_state;
  bool pending = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_state = set_state_locked(ConnectionState::CONNECTED);
    reconnect_attempts_ = 0;
    last_heartbeat_ = util::GetSteadyTime();
    stats_.reconnect_successes++;
    resync_pending_ = pre_disconnect_.has_value();
    pending = resync_pending_;
  }
  LOG_NET_INFO("Reconnected to {}", target_);
  notify_state(old_state, ConnectionState::CONNECTED);

  schedule_heartbeat_check();
  if (pending) {
    schedule_resync();
  }
}

void ConnectionResilienceManager::schedule_resync() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // Restarting the wait cancels the previous one
  std::lock_guard<std::mutex> lock(timer_mutex_);
  resync_timer_.expires_after(config_.resync_settle);
  resync_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    {
      std::lock_guard<std::mutex> state_lock(mutex_);
      if (!resync_pending_ || state_ != ConnectionState::CONNECTED) {
        return;
      }
    }
    resynchronize();
  });
}

void ConnectionResilienceManager::on_recovery_exhausted() {
  ConnectionState old_state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_state = set_state_locked(ConnectionState::FAILED);
    stats_.reconnect_failures++;
  }
  LOG_NET_ERROR("Giving up on {} after {} reconnect attempts", target_,
                config_.max_reconnect_attempts);
  notify_state(old_state, ConnectionState::FAILED);
}

int ConnectionResilienceManager::resynchronize() {
  int before = 0;
  int after = 0;
  int missed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pre_disconnect_) {
      return 0;
    }
    before = pre_disconnect_->last_pick;
    after = last_known_pick_.load();
    missed = std::max(0, after - before);
    last_missed_picks_ = missed;
    stats_.missed_picks_detected += static_cast<uint64_t>(missed);
    pre_disconnect_.reset();
    resync_pending_ = false;
  }

  if (missed == 0) {
    LOG_NET_INFO("Resynchronized, no picks missed (last pick {})", after);
    return 0;
  }

  LOG_NET_WARN("Missed {} picks during outage (pick {} -> {})", missed, before, after);
  if (notifications_) {
    notifications_->NotifyPicksMissed(missed);
  }
  return missed;
}

// ============================================================================
// Reporting
// ============================================================================

std::optional<PreDisconnectState> ConnectionResilienceManager::pre_disconnect_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pre_disconnect_;
}

int ConnectionResilienceManager::reconnect_attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reconnect_attempts_;
}

int ConnectionResilienceManager::last_missed_picks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_missed_picks_;
}

bool ConnectionResilienceManager::resync_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resync_pending_;
}

ConnectionStats ConnectionResilienceManager::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

nlohmann::json ConnectionResilienceManager::health_report() const {
  nlohmann::json report;
  auto since = seconds_since_heartbeat();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    report["state"] = ConnectionStateToString(state_);
    report["reconnect_attempts"] = reconnect_attempts_;
    if (pre_disconnect_) {
      report["pre_disconnect"] = pre_disconnect_->ToJson();
    }
    report["resync_pending"] = resync_pending_;
  }
  report["healthy"] = is_healthy();
  report["target"] = target_;
  report["seconds_since_heartbeat"] = since ? nlohmann::json(*since) : nlohmann::json(nullptr);
  report["message_count"] = message_count_.load();
  report["last_known_pick"] = last_known_pick_.load();
  report["stats"] = get_stats().ToJson();
  return report;
}

} // namespace network
} // namespace draftops
