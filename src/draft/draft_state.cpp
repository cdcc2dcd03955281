// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/draft_state.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <fmt/ranges.h>
#include <mutex>

namespace draftops {
namespace draft {

nlohmann::json StateSnapshot::ToJson() const {
  nlohmann::json j = StateToJson(state);
  j["sequence"] = sequence;
  j["timestamp"] = timestamp;
  return j;
}

nlohmann::json DraftStats::ToJson() const {
  return nlohmann::json{{"league_id", league_id},
                        {"team_id", team_id},
                        {"draft_status", DraftStatusToString(status)},
                        {"current_pick", current_pick},
                        {"total_picks", total_picks},
                        {"my_picks", my_picks},
                        {"picks_until_next", picks_until_next},
                        {"available_players", available_players},
                        {"time_remaining", time_remaining},
                        {"on_the_clock", on_the_clock},
                        {"snapshots_count", snapshot_count},
                        {"my_roster_counts", my_roster_counts}};
}

DraftStateStore::DraftStateStore(DraftSession session)
    : DraftStateStore(std::move(session), Config{}) {}

DraftStateStore::DraftStateStore(DraftSession session, Config config)
    : session_(std::move(session)), snapshots_(config.snapshot_capacity) {
  LOG_DRAFT_INFO("Draft state created: league={} team={} teams={} rounds={} snapshots={}",
                 session_.league_id, session_.team_id, session_.team_count,
                 session_.rounds, config.snapshot_capacity);
}

// ============================================================================
// Setup
// ============================================================================

void DraftStateStore::InitializePlayerPool(const std::vector<std::string> &player_ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  state_.available_players = player_ids;
  LOG_DRAFT_INFO("Initialized player pool with {} players", player_ids.size());
}

bool DraftStateStore::SetDraftOrder(const std::vector<std::string> &team_ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  draft_order_ = team_ids;

  auto it = std::find(team_ids.begin(), team_ids.end(), session_.team_id);
  if (it == team_ids.end()) {
    snake_ = SnakeDraftCalculator();
    UpdatePicksUntilNextLocked();
    LOG_DRAFT_WARN("Tracked team {} is not in the draft order ({} teams)",
                   session_.team_id, team_ids.size());
    return false;
  }

  int my_index = static_cast<int>(std::distance(team_ids.begin(), it));
  snake_ = SnakeDraftCalculator(session_.team_count, session_.rounds, my_index);
  UpdatePicksUntilNextLocked();

  LOG_DRAFT_INFO("Set draft order, slot {} of {}, our picks: [{}]", my_index + 1,
                 team_ids.size(), fmt::join(snake_.PickNumbers(), ", "));
  return true;
}

// ============================================================================
// Mutations
// ============================================================================

bool DraftStateStore::ApplyPick(const std::string &player_id, const std::string &team_id,
                                int pick_number, const std::string &position) {
  if (player_id.empty() || team_id.empty()) {
    LOG_DRAFT_WARN("Rejected pick {}: empty player or team id", pick_number);
    return false;
  }
  if (pick_number < 1) {
    LOG_DRAFT_WARN("Rejected pick of {}: invalid pick number {}", player_id, pick_number);
    return false;
  }

  std::string slot = slots::BENCH;
  if (auto normalized = NormalizeRosterSlot(position)) {
    slot = *normalized;
  } else {
    LOG_DRAFT_WARN("Unknown roster position '{}' for player {}, using BENCH", position,
                   player_id);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (state_.drafted_players.count(player_id) > 0) {
    LOG_DRAFT_WARN("Player {} already drafted, rejecting pick {}", player_id, pick_number);
    return false;
  }

  auto avail = std::find(state_.available_players.begin(),
                         state_.available_players.end(), player_id);
  if (avail == state_.available_players.end()) {
    LOG_DRAFT_WARN("Player {} not in available pool", player_id);
  }

  TakeSnapshotLocked();

  state_.drafted_players.insert(player_id);
  if (avail != state_.available_players.end()) {
    state_.available_players.erase(avail);
  }

  RosterForTeamLocked(team_id, true)->at(slot).push_back(player_id);

  state_.current_pick = pick_number;
  UpdatePicksUntilNextLocked();

  Pick pick;
  pick.pick_number = pick_number;
  pick.player_id = player_id;
  pick.team_id = team_id;
  pick.position = slot;
  pick.timestamp = util::GetTime();
  state_.pick_history.push_back(std::move(pick));

  LOG_DRAFT_INFO("Applied pick {}: player {} to team {} ({})", pick_number, player_id,
                 team_id, slot);
  return true;
}

bool DraftStateStore::StartNewPick(int pick_number, const std::string &team_id,
                                   double time_limit_seconds) {
  if (pick_number < 1 || team_id.empty()) {
    LOG_DRAFT_WARN("Rejected start of pick {} for team '{}'", pick_number, team_id);
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  TakeSnapshotLocked();

  state_.current_pick = pick_number;
  state_.on_the_clock = team_id;
  state_.time_remaining = std::max(0.0, time_limit_seconds);
  UpdatePicksUntilNextLocked();

  if (state_.status == DraftStatus::WAITING) {
    state_.status = DraftStatus::IN_PROGRESS;
    LOG_DRAFT_INFO("Draft started");
  }

  LOG_DRAFT_DEBUG("Pick {} started: team {} on the clock ({:.1f}s)", pick_number, team_id,
                  state_.time_remaining);
  return true;
}

void DraftStateStore::UpdateClock(double seconds_remaining) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  state_.time_remaining = std::max(0.0, seconds_remaining);
}

void DraftStateStore::CompleteDraft() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  TakeSnapshotLocked();
  state_.status = DraftStatus::COMPLETED;
  state_.on_the_clock.clear();
  state_.time_remaining = 0.0;
  LOG_DRAFT_INFO("Draft completed after {} picks", state_.pick_history.size());
}

bool DraftStateStore::RollbackToSnapshot(long long index) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto pos = snapshots_.ResolveIndex(index);
  if (!pos) {
    LOG_DRAFT_WARN("Rollback index {} out of range ({} snapshots)", index,
                   snapshots_.size());
    return false;
  }

  auto snapshot = snapshots_.at(*pos);
  state_ = snapshot->state;
  snapshots_.truncate(*pos + 1);

  LOG_DRAFT_WARN("Rolled back to snapshot {} (seq {}, pick {}, {} snapshots kept)", index,
                 snapshot->sequence, state_.current_pick, snapshots_.size());
  return true;
}

bool DraftStateStore::PatchRosterPosition(const std::string &player_id,
                                          const std::string &position) {
  auto slot = NormalizeRosterSlot(position);
  if (!slot) {
    LOG_DRAFT_WARN("Cannot patch {} to unknown position '{}'", player_id, position);
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto pick_it = std::find_if(state_.pick_history.begin(), state_.pick_history.end(),
                              [&](const Pick &p) { return p.player_id == player_id; });
  if (pick_it == state_.pick_history.end()) {
    LOG_DRAFT_DEBUG("Cannot patch {}: player not drafted", player_id);
    return false;
  }

  RosterView *roster = RosterForTeamLocked(pick_it->team_id, false);
  if (!roster) {
    LOG_DRAFT_WARN("Cannot patch {}: team {} has no roster", player_id, pick_it->team_id);
    return false;
  }

  // Locate current bucket before snapshotting so a no-op leaves no trace
  std::string current_slot;
  for (const auto &[name, players] : *roster) {
    if (std::find(players.begin(), players.end(), player_id) != players.end()) {
      current_slot = name;
      break;
    }
  }
  if (current_slot.empty()) {
    LOG_DRAFT_WARN("Cannot patch {}: not present in team {} roster", player_id,
                   pick_it->team_id);
    return false;
  }
  if (current_slot == *slot) {
    return true;
  }

  size_t pick_offset = static_cast<size_t>(pick_it - state_.pick_history.begin());
  TakeSnapshotLocked();

  // Snapshot copied state_, pointers into it are still valid
  roster = RosterForTeamLocked(state_.pick_history[pick_offset].team_id, false);
  auto &from = roster->at(current_slot);
  from.erase(std::remove(from.begin(), from.end(), player_id), from.end());
  roster->at(*slot).push_back(player_id);
  state_.pick_history[pick_offset].position = *slot;

  LOG_DRAFT_INFO("Patched player {} from {} to {}", player_id, current_slot, *slot);
  return true;
}

// ============================================================================
// Snapshots
// ============================================================================

void DraftStateStore::TakeSnapshotLocked() {
  auto snapshot = std::make_shared<StateSnapshot>();
  snapshot->sequence = next_snapshot_sequence_++;
  snapshot->timestamp = util::GetTime();
  snapshot->state = state_;
  snapshots_.push(std::move(snapshot));
}

std::shared_ptr<const StateSnapshot> DraftStateStore::GetSnapshot(long long index) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto pos = snapshots_.ResolveIndex(index);
  if (!pos) {
    return nullptr;
  }
  return snapshots_.at(*pos);
}

size_t DraftStateStore::SnapshotCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return snapshots_.size();
}

// ============================================================================
// Helpers
// ============================================================================

void DraftStateStore::UpdatePicksUntilNextLocked() {
  state_.picks_until_next = snake_.PicksUntilNext(state_.current_pick);
}

RosterView *DraftStateStore::RosterForTeamLocked(const std::string &team_id, bool create) {
  if (team_id == session_.team_id) {
    return &state_.my_roster;
  }
  auto it = state_.other_rosters.find(team_id);
  if (it != state_.other_rosters.end()) {
    return &it->second;
  }
  if (!create) {
    return nullptr;
  }
  return &state_.other_rosters.emplace(team_id, EmptyRoster()).first->second;
}

// ============================================================================
// Queries
// ============================================================================

DraftStateData DraftStateStore::GetState() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_;
}

int DraftStateStore::GetCurrentPick() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.current_pick;
}

int DraftStateStore::GetPicksUntilNext() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.picks_until_next;
}

double DraftStateStore::GetTimeRemaining() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.time_remaining;
}

std::string DraftStateStore::GetOnTheClock() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.on_the_clock;
}

DraftStatus DraftStateStore::GetStatus() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.status;
}

bool DraftStateStore::IsDrafted(const std::string &player_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.drafted_players.count(player_id) > 0;
}

size_t DraftStateStore::DraftedCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.drafted_players.size();
}

std::vector<std::string>
DraftStateStore::GetAvailablePlayers(const std::function<bool(const std::string &)> &filter,
                                     size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> result;
  for (const auto &id : state_.available_players) {
    if (filter && !filter(id)) {
      continue;
    }
    result.push_back(id);
    if (limit > 0 && result.size() >= limit) {
      break;
    }
  }
  return result;
}

RosterView DraftStateStore::GetMyRoster() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.my_roster;
}

std::map<std::string, RosterView> DraftStateStore::GetOtherRosters() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.other_rosters;
}

std::optional<RosterView> DraftStateStore::GetRoster(const std::string &team_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (team_id == session_.team_id) {
    return state_.my_roster;
  }
  auto it = state_.other_rosters.find(team_id);
  if (it == state_.other_rosters.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Pick> DraftStateStore::GetPickHistory() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.pick_history;
}

std::vector<Pick> DraftStateStore::GetRecentPicks(size_t count) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto &history = state_.pick_history;
  size_t start = history.size() > count ? history.size() - count : 0;
  return std::vector<Pick>(history.begin() + static_cast<std::ptrdiff_t>(start),
                           history.end());
}

std::optional<Pick> DraftStateStore::FindPick(const std::string &player_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &pick : state_.pick_history) {
    if (pick.player_id == player_id) {
      return pick;
    }
  }
  return std::nullopt;
}

std::vector<std::string> DraftStateStore::GetDraftOrder() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return draft_order_;
}

std::vector<int> DraftStateStore::GetMyPickNumbers() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return snake_.PickNumbers();
}

DraftStats DraftStateStore::GetStats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  DraftStats stats;
  stats.league_id = session_.league_id;
  stats.team_id = session_.team_id;
  stats.status = state_.status;
  stats.current_pick = state_.current_pick;
  stats.total_picks = state_.pick_history.size();
  stats.my_picks = static_cast<size_t>(
      std::count_if(state_.pick_history.begin(), state_.pick_history.end(),
                    [&](const Pick &p) { return p.team_id == session_.team_id; }));
  stats.picks_until_next = state_.picks_until_next;
  stats.available_players = state_.available_players.size();
  stats.time_remaining = state_.time_remaining;
  stats.on_the_clock = state_.on_the_clock;
  stats.snapshot_count = snapshots_.size();
  for (const auto &[slot, players] : state_.my_roster) {
    stats.my_roster_counts[slot] = players.size();
  }
  return stats;
}

nlohmann::json DraftStateStore::ToJson() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  nlohmann::json j = StateToJson(state_);
  j["league_id"] = session_.league_id;
  j["team_id"] = session_.team_id;
  j["team_count"] = session_.team_count;
  j["rounds"] = session_.rounds;
  j["draft_order"] = draft_order_;
  j["my_pick_numbers"] = snake_.PickNumbers();
  j["snapshots_count"] = snapshots_.size();
  return j;
}

} // namespace draft
} // namespace draftops
