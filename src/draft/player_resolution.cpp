// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/player_resolution.hpp"
#include "draft/draft_state.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace draftops {
namespace draft {

namespace {

// Directory entries may use feed spellings ("D/ST") or unknown positions
void NormalizeInfo(PlayerInfo &info, const std::string &player_id) {
  auto slot = NormalizeRosterSlot(info.position);
  info.id = player_id;
  info.position = slot ? *slot : std::string(slots::BENCH);
}

} // namespace

nlohmann::json PlayerInfo::ToJson() const {
  return nlohmann::json{
      {"id", id}, {"name", name}, {"position", position}, {"placeholder", placeholder}};
}

PlayerInfo PlaceholderPlayer(const std::string &player_id) {
  PlayerInfo info;
  info.id = player_id;
  info.name = "Player #" + player_id;
  info.position = slots::BENCH;
  info.placeholder = true;
  return info;
}

nlohmann::json ResolverStats::ToJson() const {
  return nlohmann::json{{"queued", queued},   {"resolved", resolved},
                        {"failed", failed},   {"patched", patched},
                        {"pending", pending}, {"cache_size", cache_size}};
}

// ============================================================================
// StaticPlayerDirectory
// ============================================================================

StaticPlayerDirectory::StaticPlayerDirectory(const std::vector<PlayerInfo> &players) {
  for (const auto &info : players) {
    players_[info.id] = info;
  }
}

void StaticPlayerDirectory::Add(const PlayerInfo &info) {
  std::lock_guard<std::mutex> lock(mutex_);
  players_[info.id] = info;
}

size_t StaticPlayerDirectory::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.size();
}

std::optional<PlayerInfo> StaticPlayerDirectory::Lookup(const std::string &player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ============================================================================
// PlayerResolutionService
// ============================================================================

PlayerResolutionService::PlayerResolutionService(std::shared_ptr<PlayerDirectory> directory,
                                                 DraftStateStore &store,
                                                 DraftNotifications &notifications)
    : PlayerResolutionService(std::move(directory), store, notifications, Config{}) {}

PlayerResolutionService::PlayerResolutionService(std::shared_ptr<PlayerDirectory> directory,
                                                 DraftStateStore &store,
                                                 DraftNotifications &notifications,
                                                 Config config)
    : directory_(std::move(directory)),
      store_(store),
      notifications_(notifications),
      batch_size_(std::max<size_t>(1, config.batch_size)),
      pool_(1) {}

PlayerResolutionService::~PlayerResolutionService() { Shutdown(); }

void PlayerResolutionService::Start() {
  pick_subscription_ =
      notifications_.SubscribePickProcessed([this](const Pick &pick, bool resolved) {
        if (!resolved) {
          Enqueue(pick.player_id);
        }
      });
  LOG_RESOLVER_INFO("Player resolution started (batch size {})", batch_size_);
}

void PlayerResolutionService::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }

  pick_subscription_.Unsubscribe();

  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    dropped = pending_.size();
    pending_.clear();
  }
  pool_.shutdown();
  pool_.discard_pending();
  pool_.wait_for_completion();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    worker_scheduled_ = false;
  }
  idle_cv_.notify_all();

  if (dropped > 0) {
    LOG_RESOLVER_INFO("Player resolution stopped, discarded {} queued ids", dropped);
  }
}

std::optional<std::string>
PlayerResolutionService::ResolvePosition(const std::string &player_id) const {
  std::optional<std::string> position;
  cache_.Read(player_id, [&](const PlayerInfo &info) { position = info.position; });
  return position;
}

void PlayerResolutionService::Enqueue(const std::string &player_id) {
  if (stopping_.load() || cache_.Contains(player_id)) {
    return;
  }
  if (!queued_ids_.Insert(player_id)) {
    return;
  }

  bool schedule = false;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    pending_.push_back(player_id);
    if (!worker_scheduled_) {
      worker_scheduled_ = true;
      schedule = true;
    }
  }
  queued_.fetch_add(1, std::memory_order_relaxed);
  LOG_RESOLVER_DEBUG("Queued player {} for resolution", player_id);

  if (!schedule) {
    return;
  }

  try {
    pool_.enqueue([this] { ProcessQueue(); });
  } catch (const std::runtime_error &e) {
    // Pool already stopped
    std::lock_guard<std::mutex> lock(queue_mutex_);
    worker_scheduled_ = false;
    LOG_RESOLVER_DEBUG("Resolution worker not scheduled: {}", e.what());
  }
}

void PlayerResolutionService::ProcessQueue() {
  while (!stopping_.load()) {
    std::vector<std::string> batch;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (pending_.empty()) {
        worker_scheduled_ = false;
        idle_cv_.notify_all();
        return;
      }
      const size_t n = std::min(batch_size_, pending_.size());
      batch.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
      pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
    }
    ResolveBatch(batch);
  }
}

PlayerInfo PlayerResolutionService::LookupOrPlaceholder(const std::string &player_id) {
  if (!directory_) {
    return PlaceholderPlayer(player_id);
  }
  try {
    if (auto info = directory_->Lookup(player_id)) {
      NormalizeInfo(*info, player_id);
      return *info;
    }
    LOG_RESOLVER_WARN("Player {} not found in directory, using placeholder", player_id);
  } catch (const std::exception &e) {
    LOG_RESOLVER_WARN("Lookup of player {} failed: {}, using placeholder", player_id,
                      e.what());
  }
  return PlaceholderPlayer(player_id);
}

void PlayerResolutionService::ResolveBatch(const std::vector<std::string> &batch) {
  LOG_RESOLVER_DEBUG("Resolving batch of {} players", batch.size());

  for (const auto &id : batch) {
    if (stopping_.load()) {
      return;
    }

    PlayerInfo info = LookupOrPlaceholder(id);
    cache_.Insert(id, info);
    queued_ids_.Erase(id);

    if (info.placeholder) {
      failed_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    resolved_.fetch_add(1, std::memory_order_relaxed);

    if (!store_.IsDrafted(id) || !store_.PatchRosterPosition(id, info.position)) {
      continue;
    }
    if (auto pick = store_.FindPick(id)) {
      patched_.fetch_add(1, std::memory_order_relaxed);
      LOG_RESOLVER_INFO("Resolved pick {}: {} ({})", pick->pick_number, info.name,
                        info.position);
      notifications_.NotifyPickUpdated(*pick);
    }
  }
}

std::optional<PlayerInfo> PlayerResolutionService::GetCached(const std::string &player_id) const {
  return cache_.Get(player_id);
}

std::optional<PlayerInfo> PlayerResolutionService::Describe(const std::string &player_id) {
  if (auto cached = cache_.Get(player_id)) {
    return cached;
  }
  if (!directory_) {
    return std::nullopt;
  }
  try {
    auto info = directory_->Lookup(player_id);
    if (info) {
      NormalizeInfo(*info, player_id);
      cache_.Insert(player_id, *info);
    }
    return info;
  } catch (const std::exception &e) {
    LOG_RESOLVER_WARN("Lookup of player {} failed: {}", player_id, e.what());
    return std::nullopt;
  }
}

void PlayerResolutionService::Flush() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_cv_.wait(lock, [this] { return !worker_scheduled_ || stopping_.load(); });
}

ResolverStats PlayerResolutionService::GetStats() const {
  ResolverStats stats;
  stats.queued = queued_.load(std::memory_order_relaxed);
  stats.resolved = resolved_.load(std::memory_order_relaxed);
  stats.failed = failed_.load(std::memory_order_relaxed);
  stats.patched = patched_.load(std::memory_order_relaxed);
  stats.pending = queued_ids_.Size();
  stats.cache_size = cache_.Size();
  return stats;
}

} // namespace draft
} // namespace draftops
