// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/notifications.hpp"
#include <algorithm>

namespace draftops {
namespace draft {

// ============================================================================
// DraftNotifications::Subscription
// ============================================================================

DraftNotifications::Subscription::Subscription(DraftNotifications *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

DraftNotifications::Subscription::~Subscription() { Unsubscribe(); }

DraftNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

DraftNotifications::Subscription &
DraftNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void DraftNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// DraftNotifications
// ============================================================================

DraftNotifications::Subscription DraftNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;
  entry.id = id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

DraftNotifications::Subscription
DraftNotifications::SubscribePickProcessed(PickProcessedCallback callback) {
  CallbackEntry entry;
  entry.pick_processed = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribePickUpdated(PickUpdatedCallback callback) {
  CallbackEntry entry;
  entry.pick_updated = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeTeamSelecting(TeamSelectingCallback callback) {
  CallbackEntry entry;
  entry.team_selecting = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeClockUpdate(ClockUpdateCallback callback) {
  CallbackEntry entry;
  entry.clock_update = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeAutodraftChanged(AutodraftCallback callback) {
  CallbackEntry entry;
  entry.autodraft = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeDraftCompleted(DraftCompletedCallback callback) {
  CallbackEntry entry;
  entry.draft_completed = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeStateRecovered(StateRecoveredCallback callback) {
  CallbackEntry entry;
  entry.state_recovered = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribeConnectionState(ConnectionStateCallback callback) {
  CallbackEntry entry;
  entry.connection_state = std::move(callback);
  return Add(std::move(entry));
}

DraftNotifications::Subscription
DraftNotifications::SubscribePicksMissed(PicksMissedCallback callback) {
  CallbackEntry entry;
  entry.picks_missed = std::move(callback);
  return Add(std::move(entry));
}

void DraftNotifications::NotifyPickProcessed(const Pick &pick, bool resolved) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.pick_processed) {
      entry.pick_processed(pick, resolved);
    }
  }
}

void DraftNotifications::NotifyPickUpdated(const Pick &pick) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.pick_updated) {
      entry.pick_updated(pick);
    }
  }
}

void DraftNotifications::NotifyTeamSelecting(const std::string &team_id, int pick_number,
                                             double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.team_selecting) {
      entry.team_selecting(team_id, pick_number, seconds);
    }
  }
}

void DraftNotifications::NotifyClockUpdate(const std::string &team_id,
                                           double seconds_remaining) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.clock_update) {
      entry.clock_update(team_id, seconds_remaining);
    }
  }
}

void DraftNotifications::NotifyAutodraftChanged(const std::string &team_id, bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.autodraft) {
      entry.autodraft(team_id, enabled);
    }
  }
}

void DraftNotifications::NotifyDraftCompleted(size_t total_picks) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.draft_completed) {
      entry.draft_completed(total_picks);
    }
  }
}

void DraftNotifications::NotifyStateRecovered(long long snapshot_index) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.state_recovered) {
      entry.state_recovered(snapshot_index);
    }
  }
}

void DraftNotifications::NotifyConnectionState(network::ConnectionState old_state,
                                               network::ConnectionState new_state) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.connection_state) {
      entry.connection_state(old_state, new_state);
    }
  }
}

void DraftNotifications::NotifyPicksMissed(int missed) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.picks_missed) {
      entry.picks_missed(missed);
    }
  }
}

size_t DraftNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void DraftNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                         [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace draft
} // namespace draftops
