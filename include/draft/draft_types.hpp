// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace draftops {
namespace draft {

enum class DraftStatus {
  WAITING,
  IN_PROGRESS,
  PAUSED,
  COMPLETED,
};

std::string DraftStatusToString(DraftStatus status);

// Roster buckets. Every roster carries all of them, including BENCH.
namespace slots {
constexpr const char *QB = "QB";
constexpr const char *RB = "RB";
constexpr const char *WR = "WR";
constexpr const char *TE = "TE";
constexpr const char *K = "K";
constexpr const char *DST = "DST";
constexpr const char *FLEX = "FLEX";
constexpr const char *BENCH = "BENCH";
} // namespace slots

// All roster buckets in display order
const std::vector<std::string> &RosterSlots();

/**
 * Map a position string onto a roster bucket.
 *
 * Case-insensitive; "D/ST" and "DEF" map to DST. Returns std::nullopt for
 * anything that is not a known bucket.
 */
std::optional<std::string> NormalizeRosterSlot(const std::string &position);

// position -> ordered player ids
using RosterView = std::map<std::string, std::vector<std::string>>;

// Roster with every bucket present and empty
RosterView EmptyRoster();

// Total number of players across all buckets
size_t RosterSize(const RosterView &roster);

/**
 * One completed selection. Immutable once appended to pick history
 * (except for the roster position, which a later resolution may patch).
 */
struct Pick {
  int pick_number{0};
  std::string player_id;
  std::string team_id;
  std::string position;
  int64_t timestamp{0}; // unix seconds

  bool operator==(const Pick &other) const = default;
};

// Static draft parameters; fixed for the lifetime of a store
struct DraftSession {
  std::string league_id;
  std::string team_id; // the tracked ("my") team
  int team_count{12};
  int rounds{16};
};

/**
 * Every mutable field of the draft, as a value.
 *
 * Copying this struct is the deep copy taken for snapshots; equality is
 * structural, which is what rollback is checked against.
 */
struct DraftStateData {
  std::set<std::string> drafted_players;
  std::vector<std::string> available_players;
  RosterView my_roster{EmptyRoster()};
  std::map<std::string, RosterView> other_rosters;
  int current_pick{0};
  int picks_until_next{0};
  double time_remaining{0.0};
  std::string on_the_clock;
  DraftStatus status{DraftStatus::WAITING};
  std::vector<Pick> pick_history;

  bool operator==(const DraftStateData &other) const = default;
};

nlohmann::json PickToJson(const Pick &pick);
nlohmann::json RosterToJson(const RosterView &roster);
nlohmann::json StateToJson(const DraftStateData &state);

} // namespace draft
} // namespace draftops
