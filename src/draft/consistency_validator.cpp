// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/consistency_validator.hpp"
#include "draft/draft_state.hpp"
#include "draft/notifications.hpp"
#include "draft/snake_order.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>
#include <set>

namespace draftops {
namespace draft {

nlohmann::json ValidationResult::ToJson() const {
  return nlohmann::json{{"is_valid", IsValid()},
                        {"errors", errors_},
                        {"warnings", warnings_},
                        {"suggestions", suggestions_}};
}

nlohmann::json ValidatorStats::ToJson() const {
  return nlohmann::json{{"validation_checks", validation_checks},
                        {"validation_failures", validation_failures},
                        {"state_recoveries", state_recoveries},
                        {"heal_failures", heal_failures}};
}

ConsistencyValidator::ConsistencyValidator(DraftStateStore &store,
                                           DraftNotifications *notifications)
    : store_(store), notifications_(notifications) {}

ValidationContext ConsistencyValidator::MakeContext() const {
  ValidationContext context;
  context.session = store_.session();
  context.draft_order = store_.GetDraftOrder();
  return context;
}

ValidationResult ConsistencyValidator::ValidateState(const DraftStateData &state,
                                                     const ValidationContext &context) {
  ValidationResult result;
  const auto &history = state.pick_history;
  const size_t completed = history.size();

  // Drafted set and history are two views of the same picks
  if (state.drafted_players.size() != completed) {
    result.AddError(fmt::format("Drafted players count ({}) != pick history ({})",
                                state.drafted_players.size(), completed));
  }

  // current_pick may be one ahead while a team is on the clock
  if (completed > 0 || state.current_pick > 0) {
    const long long current = state.current_pick;
    const long long done = static_cast<long long>(completed);
    if (current < done) {
      result.AddError(fmt::format("Current pick ({}) is behind completed picks ({})",
                                  current, done));
    } else if (current > done + 1) {
      result.AddError(fmt::format(
          "Current pick ({}) is too far ahead of completed picks ({})", current, done));
    }
  }

  std::vector<std::string> overlap;
  for (const auto &id : state.available_players) {
    if (state.drafted_players.count(id) > 0) {
      overlap.push_back(id);
    }
  }
  if (!overlap.empty()) {
    result.AddError(fmt::format("Players in both drafted and available: [{}]",
                                fmt::join(overlap, ", ")));
  }

  // Every rostered player, with the team that holds it
  std::map<std::string, const RosterView *> rosters;
  rosters.emplace(context.session.team_id, &state.my_roster);
  for (const auto &[team, roster] : state.other_rosters) {
    rosters.emplace(team, &roster);
  }

  std::map<std::string, std::string> rostered_by;
  for (const auto &[team, roster] : rosters) {
    for (const auto &[slot, players] : *roster) {
      for (const auto &id : players) {
        auto [it, inserted] = rostered_by.emplace(id, team);
        if (!inserted) {
          if (it->second == team) {
            result.AddError(
                fmt::format("Player {} appears twice in team {} roster", id, team));
          } else {
            result.AddError(fmt::format("Player {} appears in rosters of teams {} and {}",
                                        id, it->second, team));
          }
        }
        if (state.drafted_players.count(id) == 0) {
          result.AddError(
              fmt::format("Player {} is in team {} roster but not drafted", id, team));
        }
      }
    }
  }

  // Per-team roster size against history. Picks whose player has not
  // reached a roster yet are warnings, not a count mismatch.
  std::map<std::string, size_t> history_count;
  std::map<std::string, size_t> unrostered_count;
  for (const auto &pick : history) {
    history_count[pick.team_id]++;
    auto it = rostered_by.find(pick.player_id);
    if (it == rostered_by.end()) {
      unrostered_count[pick.team_id]++;
      result.AddWarning(fmt::format("Player {} (pick {}) drafted but not yet in any roster",
                                    pick.player_id, pick.pick_number));
    }
  }

  std::set<std::string> teams;
  for (const auto &[team, count] : history_count) {
    teams.insert(team);
  }
  for (const auto &[team, roster] : rosters) {
    teams.insert(team);
  }
  for (const auto &team : teams) {
    auto r = rosters.find(team);
    const size_t rostered = r == rosters.end() ? 0 : RosterSize(*r->second);
    const size_t expected = history_count.count(team) ? history_count.at(team) : 0;
    const size_t lagging = unrostered_count.count(team) ? unrostered_count.at(team) : 0;
    if (rostered + lagging != expected) {
      result.AddError(fmt::format("Team {} roster count ({}) != expected picks ({})", team,
                                  rostered, expected));
    }
  }

  // Snake-order agreement, only meaningful with a full order
  if (context.draft_order.size() == static_cast<size_t>(context.session.team_count)) {
    for (const auto &pick : history) {
      auto expected = ExpectedTeamForPick(context, pick.pick_number);
      if (expected && *expected != pick.team_id) {
        result.AddWarning(fmt::format("Pick {} made by team {}, snake order expects team {}",
                                      pick.pick_number, pick.team_id, *expected));
      }
    }
  }

  const size_t total_picks =
      static_cast<size_t>(std::max(0, context.session.team_count)) *
      static_cast<size_t>(std::max(0, context.session.rounds));
  if (state.status == DraftStatus::COMPLETED && completed != total_picks) {
    result.AddWarning(fmt::format("Draft marked completed with {} picks, expected {}",
                                  completed, total_picks));
  }

  if (state.available_players.size() > LARGE_POOL_SUGGESTION) {
    result.AddSuggestion(fmt::format(
        "Available pool has {} players, consider trimming undraftable players",
        state.available_players.size()));
  }
  if (completed > LONG_HISTORY_SUGGESTION) {
    result.AddSuggestion(
        fmt::format("Pick history has {} entries, consider archiving older picks", completed));
  }

  return result;
}

ValidationResult ConsistencyValidator::Validate() {
  ValidationResult result = ValidateState(store_.GetState(), MakeContext());
  validation_checks_.fetch_add(1, std::memory_order_relaxed);

  if (!result.IsValid()) {
    validation_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_DRAFT_WARN("State validation failed: {}", fmt::join(result.Errors(), "; "));
  } else {
    LOG_DRAFT_DEBUG("State validation passed ({} warnings)", result.Warnings().size());
  }
  return result;
}

bool ConsistencyValidator::AttemptRecovery() {
  const ValidationContext context = MakeContext();
  const size_t count = store_.SnapshotCount();

  for (size_t i = count; i-- > 0;) {
    auto snapshot = store_.GetSnapshot(static_cast<long long>(i));
    if (!snapshot) {
      continue;
    }
    if (!ValidateState(snapshot->state, context).IsValid()) {
      LOG_DRAFT_DEBUG("Snapshot {} (seq {}) does not validate, trying older", i,
                      snapshot->sequence);
      continue;
    }
    if (!store_.RollbackToSnapshot(static_cast<long long>(i))) {
      break;
    }

    state_recoveries_.fetch_add(1, std::memory_order_relaxed);
    LOG_DRAFT_WARN("Recovered state from snapshot {} (seq {}, pick {})", i,
                   snapshot->sequence, snapshot->state.current_pick);
    if (notifications_) {
      notifications_->NotifyStateRecovered(static_cast<long long>(i));
    }
    return true;
  }

  heal_failures_.fetch_add(1, std::memory_order_relaxed);
  LOG_DRAFT_ERROR("No valid snapshot among {} retained, cannot recover", count);
  return false;
}

ValidationResult ConsistencyValidator::ValidateAndHeal() {
  ValidationResult result = Validate();
  if (result.IsValid()) {
    return result;
  }

  const size_t before = store_.SnapshotCount();
  if (!AttemptRecovery()) {
    throw ConsistencyViolation(
        fmt::format("Draft state inconsistent and unrecoverable: {}",
                    fmt::join(result.Errors(), "; ")),
        result.Errors());
  }

  result.AddWarning(fmt::format("State restored from snapshot {} of {}",
                                store_.SnapshotCount() - 1, before));
  return result;
}

bool ConsistencyValidator::CheckDraftCompletion() const {
  const DraftSession &session = store_.session();
  if (session.team_count < 1 || session.rounds < 1) {
    return false;
  }
  const size_t total = static_cast<size_t>(session.team_count) *
                       static_cast<size_t>(session.rounds);
  return store_.DraftedCount() >= total;
}

std::optional<std::string> ConsistencyValidator::ExpectedTeamForPick(int pick_number) const {
  return ExpectedTeamForPick(MakeContext(), pick_number);
}

std::optional<std::string>
ConsistencyValidator::ExpectedTeamForPick(const ValidationContext &context, int pick_number) {
  if (context.draft_order.size() != static_cast<size_t>(context.session.team_count)) {
    return std::nullopt;
  }
  auto slot = SnakeDraftCalculator::SlotForPick(context.session.team_count, pick_number);
  if (!slot) {
    return std::nullopt;
  }
  return context.draft_order[static_cast<size_t>(*slot)];
}

ValidatorStats ConsistencyValidator::GetStats() const {
  ValidatorStats stats;
  stats.validation_checks = validation_checks_.load(std::memory_order_relaxed);
  stats.validation_failures = validation_failures_.load(std::memory_order_relaxed);
  stats.state_recoveries = state_recoveries_.load(std::memory_order_relaxed);
  stats.heal_failures = heal_failures_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace draft
} // namespace draftops
