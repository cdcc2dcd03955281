// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "draft/draft_types.hpp"
#include "network/connection_state.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace draftops {
namespace draft {

/**
 * Notification system for draft events
 *
 * - Simple observer pattern with std::function
 * - Thread-safe using std::mutex
 * - Synchronous callbacks, no background queue
 * - RAII-based subscription management
 *
 * Callbacks run on the notifying thread while the registry lock is held.
 * A callback must not subscribe, unsubscribe or notify on the same
 * instance. Notifiers never hold the draft store lock when calling in.
 * Subscriptions must be released before the registry is destroyed.
 *
 * Events:
 * - PickProcessed: a SELECTED frame was applied (resolved = position came
 *   from the resolver cache)
 * - PickUpdated: a recorded pick's position was patched after background
 *   resolution
 * - TeamSelecting: a team went on the clock
 * - ClockUpdate: countdown tick
 * - AutodraftChanged: a team toggled autodraft
 * - DraftCompleted: the final pick was made
 * - StateRecovered: the validator rolled back to a snapshot
 * - ConnectionStateChanged: resilience manager state transition
 * - PicksMissed: picks were made while disconnected
 */
class DraftNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class DraftNotifications;
    Subscription(DraftNotifications *owner, size_t id);

    DraftNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  // Callback types
  using PickProcessedCallback = std::function<void(const Pick &pick, bool resolved)>;
  using PickUpdatedCallback = std::function<void(const Pick &pick)>;
  using TeamSelectingCallback =
      std::function<void(const std::string &team_id, int pick_number, double seconds)>;
  using ClockUpdateCallback =
      std::function<void(const std::string &team_id, double seconds_remaining)>;
  using AutodraftCallback = std::function<void(const std::string &team_id, bool enabled)>;
  using DraftCompletedCallback = std::function<void(size_t total_picks)>;
  using StateRecoveredCallback = std::function<void(long long snapshot_index)>;
  using ConnectionStateCallback = std::function<void(network::ConnectionState old_state,
                                                     network::ConnectionState new_state)>;
  using PicksMissedCallback = std::function<void(int missed)>;

  DraftNotifications() = default;

  DraftNotifications(const DraftNotifications &) = delete;
  DraftNotifications &operator=(const DraftNotifications &) = delete;

  [[nodiscard]] Subscription SubscribePickProcessed(PickProcessedCallback callback);
  [[nodiscard]] Subscription SubscribePickUpdated(PickUpdatedCallback callback);
  [[nodiscard]] Subscription SubscribeTeamSelecting(TeamSelectingCallback callback);
  [[nodiscard]] Subscription SubscribeClockUpdate(ClockUpdateCallback callback);
  [[nodiscard]] Subscription SubscribeAutodraftChanged(AutodraftCallback callback);
  [[nodiscard]] Subscription SubscribeDraftCompleted(DraftCompletedCallback callback);
  [[nodiscard]] Subscription SubscribeStateRecovered(StateRecoveredCallback callback);
  [[nodiscard]] Subscription
  SubscribeConnectionState(ConnectionStateCallback callback);
  [[nodiscard]] Subscription SubscribePicksMissed(PicksMissedCallback callback);

  /**
   * Called by EventProcessor after ApplyPick() succeeds.
   * GetPickHistory() already contains the pick.
   */
  void NotifyPickProcessed(const Pick &pick, bool resolved);

  /**
   * Called by PlayerResolutionService after PatchRosterPosition().
   * The pick carries the patched position.
   */
  void NotifyPickUpdated(const Pick &pick);

  void NotifyTeamSelecting(const std::string &team_id, int pick_number, double seconds);
  void NotifyClockUpdate(const std::string &team_id, double seconds_remaining);
  void NotifyAutodraftChanged(const std::string &team_id, bool enabled);
  void NotifyDraftCompleted(size_t total_picks);
  void NotifyStateRecovered(long long snapshot_index);
  void NotifyConnectionState(network::ConnectionState old_state,
                             network::ConnectionState new_state);
  void NotifyPicksMissed(int missed);

  size_t SubscriberCount() const;

private:
  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id{0};
    PickProcessedCallback pick_processed;
    PickUpdatedCallback pick_updated;
    TeamSelectingCallback team_selecting;
    ClockUpdateCallback clock_update;
    AutodraftCallback autodraft;
    DraftCompletedCallback draft_completed;
    StateRecoveredCallback state_recovered;
    ConnectionStateCallback connection_state;
    PicksMissedCallback picks_missed;
  };

  Subscription Add(CallbackEntry entry);

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace draft
} // namespace draftops
