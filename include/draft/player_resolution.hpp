// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "draft/notifications.hpp"
#include "util/threadpool.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace draftops {
namespace draft {

class DraftStateStore;

struct PlayerInfo {
  std::string id;
  std::string name;
  std::string position;
  bool placeholder{false}; // lookup failed, name/position are stand-ins

  nlohmann::json ToJson() const;
};

// Stand-in identity for a player the directory could not resolve
PlayerInfo PlaceholderPlayer(const std::string &player_id);

/**
 * Source of player names and positions
 *
 * Lookup() may block and may throw; callers keep it off the event path.
 */
class PlayerDirectory {
public:
  virtual ~PlayerDirectory() = default;

  // std::nullopt if the id is unknown
  virtual std::optional<PlayerInfo> Lookup(const std::string &player_id) = 0;
};

// In-memory directory seeded from configuration
class StaticPlayerDirectory : public PlayerDirectory {
public:
  StaticPlayerDirectory() = default;
  explicit StaticPlayerDirectory(const std::vector<PlayerInfo> &players);

  void Add(const PlayerInfo &info);
  size_t Size() const;

  std::optional<PlayerInfo> Lookup(const std::string &player_id) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, PlayerInfo> players_;
};

struct ResolverStats {
  uint64_t queued{0};
  uint64_t resolved{0};
  uint64_t failed{0};
  uint64_t patched{0};
  size_t pending{0};
  size_t cache_size{0};

  nlohmann::json ToJson() const;
};

/**
 * PlayerResolutionService - asynchronous player position resolution
 *
 * The event path only ever calls ResolvePosition(), a cache lookup that
 * never blocks. A pick recorded without a cached position (PickProcessed
 * with resolved == false) queues its player id. A single background worker
 * drains the queue in batches through the PlayerDirectory, caches results,
 * patches the recorded roster entry and re-emits the pick as PickUpdated.
 *
 * Ids are queued from the PickProcessed notification rather than from
 * ResolvePosition() so that a patch can never run ahead of the ApplyPick()
 * that records the player.
 *
 * Unresolvable ids are cached as placeholders ("Player #<id>", BENCH) and
 * are not retried.
 */
class PlayerResolutionService {
public:
  struct Config {
    size_t batch_size{25};
  };

  PlayerResolutionService(std::shared_ptr<PlayerDirectory> directory, DraftStateStore &store,
                          DraftNotifications &notifications);
  PlayerResolutionService(std::shared_ptr<PlayerDirectory> directory, DraftStateStore &store,
                          DraftNotifications &notifications, Config config);
  ~PlayerResolutionService();

  PlayerResolutionService(const PlayerResolutionService &) = delete;
  PlayerResolutionService &operator=(const PlayerResolutionService &) = delete;

  // Subscribe to PickProcessed and start accepting work
  void Start();

  // Stop intake, drop queued ids and join the worker
  void Shutdown();

  // Cache-only position lookup for the event path; nullopt on a miss
  std::optional<std::string> ResolvePosition(const std::string &player_id) const;

  // Queue an id for background resolution (no-op if cached or queued)
  void Enqueue(const std::string &player_id);

  /**
   * Cached info, falling back to a synchronous directory lookup.
   * For query paths only, never for frame processing.
   */
  std::optional<PlayerInfo> Describe(const std::string &player_id);

  std::optional<PlayerInfo> GetCached(const std::string &player_id) const;

  // Block until the queue is empty and no batch is running
  void Flush();

  ResolverStats GetStats() const;

private:
  void ProcessQueue();
  void ResolveBatch(const std::vector<std::string> &batch);
  PlayerInfo LookupOrPlaceholder(const std::string &player_id);

  std::shared_ptr<PlayerDirectory> directory_;
  DraftStateStore &store_;
  DraftNotifications &notifications_;
  const size_t batch_size_;

  util::ThreadSafeMap<std::string, PlayerInfo> cache_;
  util::ThreadSafeSet<std::string> queued_ids_;

  std::mutex queue_mutex_;
  std::condition_variable idle_cv_;
  std::vector<std::string> pending_;
  bool worker_scheduled_{false};

  util::ThreadPool pool_;
  DraftNotifications::Subscription pick_subscription_;
  std::atomic<bool> stopping_{false};

  std::atomic<uint64_t> queued_{0};
  std::atomic<uint64_t> resolved_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> patched_{0};
};

} // namespace draft
} // namespace draftops
