// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/draft_types.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

namespace draftops {
namespace draft {

std::string DraftStatusToString(DraftStatus status) {
  switch (status) {
  case DraftStatus::WAITING:
    return "WAITING";
  case DraftStatus::IN_PROGRESS:
    return "IN_PROGRESS";
  case DraftStatus::PAUSED:
    return "PAUSED";
  case DraftStatus::COMPLETED:
    return "COMPLETED";
  }
  return "UNKNOWN";
}

const std::vector<std::string> &RosterSlots() {
  static const std::vector<std::string> kSlots = {
      slots::QB, slots::RB, slots::WR, slots::TE,
      slots::K,  slots::DST, slots::FLEX, slots::BENCH};
  return kSlots;
}

std::optional<std::string> NormalizeRosterSlot(const std::string &position) {
  const std::string upper = util::ToUpper(position);
  if (upper == "D/ST" || upper == "DEF") {
    return std::string(slots::DST);
  }
  for (const auto &slot : RosterSlots()) {
    if (upper == slot) {
      return slot;
    }
  }
  return std::nullopt;
}

RosterView EmptyRoster() {
  RosterView roster;
  for (const auto &slot : RosterSlots()) {
    roster[slot];
  }
  return roster;
}

size_t RosterSize(const RosterView &roster) {
  size_t total = 0;
  for (const auto &[slot, players] : roster) {
    total += players.size();
  }
  return total;
}

nlohmann::json PickToJson(const Pick &pick) {
  return nlohmann::json{{"pick_number", pick.pick_number},
                        {"player_id", pick.player_id},
                        {"team_id", pick.team_id},
                        {"position", pick.position},
                        {"timestamp", pick.timestamp},
                        {"time", util::FormatTime(pick.timestamp)}};
}

nlohmann::json RosterToJson(const RosterView &roster) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[slot, players] : roster) {
    j[slot] = players;
  }
  return j;
}

nlohmann::json StateToJson(const DraftStateData &state) {
  nlohmann::json others = nlohmann::json::object();
  for (const auto &[team, roster] : state.other_rosters) {
    others[team] = RosterToJson(roster);
  }

  nlohmann::json history = nlohmann::json::array();
  for (const auto &pick : state.pick_history) {
    history.push_back(PickToJson(pick));
  }

  return nlohmann::json{
      {"drafted_players", state.drafted_players},
      {"available_players", state.available_players},
      {"my_roster", RosterToJson(state.my_roster)},
      {"other_rosters", others},
      {"current_pick", state.current_pick},
      {"picks_until_next", state.picks_until_next},
      {"time_remaining", state.time_remaining},
      {"on_the_clock", state.on_the_clock},
      {"draft_status", DraftStatusToString(state.status)},
      {"pick_history", history}};
}

} // namespace draft
} // namespace draftops
