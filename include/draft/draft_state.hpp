// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "draft/draft_types.hpp"
#include "draft/snake_order.hpp"
#include "draft/snapshot_ring.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace draftops {
namespace draft {

/**
 * Immutable copy of the full draft state, taken before a mutation
 */
struct StateSnapshot {
  uint64_t sequence{0}; // monotonically increasing per store
  int64_t timestamp{0}; // unix seconds
  DraftStateData state;

  nlohmann::json ToJson() const;
};

struct DraftStats {
  std::string league_id;
  std::string team_id;
  DraftStatus status{DraftStatus::WAITING};
  int current_pick{0};
  size_t total_picks{0};
  size_t my_picks{0};
  int picks_until_next{0};
  size_t available_players{0};
  double time_remaining{0.0};
  std::string on_the_clock;
  size_t snapshot_count{0};
  std::map<std::string, size_t> my_roster_counts;

  nlohmann::json ToJson() const;
};

/**
 * DraftStateStore - single authoritative owner of draft state
 *
 * All mutable state lives in one DraftStateData value. Every mutator except
 * UpdateClock() copies that value into the snapshot ring before changing it,
 * so any pre-mutation state can be restored with RollbackToSnapshot().
 *
 * Concurrency:
 * - Mutators hold an exclusive lock for the whole call, snapshot included;
 *   a reader sees either the pre- or the post-mutation state, never a mix
 * - Queries hold a shared lock and return copies
 * - The store never calls out to listeners; callers notify after the
 *   mutator returns
 *
 * Failed mutations (duplicate pick, bad arguments) return false and leave
 * state and snapshots untouched.
 */
class DraftStateStore {
public:
  struct Config {
    size_t snapshot_capacity{100};
  };

  explicit DraftStateStore(DraftSession session);
  DraftStateStore(DraftSession session, Config config);

  DraftStateStore(const DraftStateStore &) = delete;
  DraftStateStore &operator=(const DraftStateStore &) = delete;

  // === Setup ===

  // Seed the available pool (replaces any previous pool)
  void InitializePlayerPool(const std::vector<std::string> &player_ids);

  /**
   * Record team order and precompute the tracked team's snake picks.
   * Returns false if the tracked team is not in the order (the order is
   * still recorded, but no picks are precomputed).
   */
  bool SetDraftOrder(const std::vector<std::string> &team_ids);

  // === Mutations ===

  /**
   * Apply a completed pick.
   *
   * Fails without mutation if the player is already drafted, the player or
   * team id is empty, or pick_number < 1. A player missing from the
   * available pool is accepted with a warning. Unknown positions are
   * recorded as BENCH.
   */
  bool ApplyPick(const std::string &player_id, const std::string &team_id,
                 int pick_number, const std::string &position = slots::BENCH);

  /**
   * Put a team on the clock for pick_number. Moves WAITING to IN_PROGRESS.
   */
  bool StartNewPick(int pick_number, const std::string &team_id,
                    double time_limit_seconds);

  // Clamp to >= 0. No snapshot.
  void UpdateClock(double seconds_remaining);

  // Mark COMPLETED and clear on-the-clock and time remaining
  void CompleteDraft();

  /**
   * Restore the snapshot at index (negative counts from the newest, valid
   * range [-N, N-1]) and drop every snapshot newer than it. The restored
   * snapshot itself stays in the ring.
   */
  bool RollbackToSnapshot(long long index);

  /**
   * Move an already-drafted player to the bucket for position and update
   * its pick-history entry. No-op (true) if it is already there.
   */
  bool PatchRosterPosition(const std::string &player_id, const std::string &position);

  // === Snapshots ===

  // Same indexing as RollbackToSnapshot(); nullptr if out of range
  std::shared_ptr<const StateSnapshot> GetSnapshot(long long index) const;
  size_t SnapshotCount() const;

  // === Queries ===

  // Consistent copy of the whole state
  DraftStateData GetState() const;

  const DraftSession &session() const { return session_; }
  int GetCurrentPick() const;
  int GetPicksUntilNext() const;
  double GetTimeRemaining() const;
  std::string GetOnTheClock() const;
  DraftStatus GetStatus() const;
  bool IsDrafted(const std::string &player_id) const;
  size_t DraftedCount() const;

  /**
   * Available pool in draft-board order.
   * @param filter Keep only ids for which filter returns true (optional)
   * @param limit Maximum number of ids returned (0 = no limit)
   */
  std::vector<std::string>
  GetAvailablePlayers(const std::function<bool(const std::string &)> &filter = {},
                      size_t limit = 0) const;

  RosterView GetMyRoster() const;
  std::map<std::string, RosterView> GetOtherRosters() const;
  // Roster for any team (tracked team included); nullopt if it has none
  std::optional<RosterView> GetRoster(const std::string &team_id) const;

  std::vector<Pick> GetPickHistory() const;
  // Last count picks, oldest first
  std::vector<Pick> GetRecentPicks(size_t count) const;
  std::optional<Pick> FindPick(const std::string &player_id) const;

  std::vector<std::string> GetDraftOrder() const;
  std::vector<int> GetMyPickNumbers() const;

  DraftStats GetStats() const;
  nlohmann::json ToJson() const;

private:
  // Caller holds mutex_ exclusively
  void TakeSnapshotLocked();
  void UpdatePicksUntilNextLocked();
  RosterView *RosterForTeamLocked(const std::string &team_id, bool create);

  const DraftSession session_;

  mutable std::shared_mutex mutex_;
  DraftStateData state_;
  std::vector<std::string> draft_order_;
  SnakeDraftCalculator snake_;
  SnapshotRing<StateSnapshot> snapshots_;
  uint64_t next_snapshot_sequence_{1};
};

} // namespace draft
} // namespace draftops
