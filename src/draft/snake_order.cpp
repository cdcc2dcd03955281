// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/snake_order.hpp"
#include <algorithm>

namespace draftops {
namespace draft {

SnakeDraftCalculator::SnakeDraftCalculator(int team_count, int rounds, int my_index)
    : picks_(CalculatePickNumbers(team_count, rounds, my_index)) {}

std::vector<int> SnakeDraftCalculator::CalculatePickNumbers(int team_count, int rounds,
                                                            int my_index) {
  std::vector<int> picks;
  if (team_count < 1 || rounds < 0 || my_index < 0 || my_index >= team_count) {
    return picks;
  }

  picks.reserve(static_cast<size_t>(rounds));
  for (int r = 0; r < rounds; ++r) {
    if (r % 2 == 0) {
      picks.push_back(r * team_count + my_index + 1);
    } else {
      picks.push_back(r * team_count + (team_count - my_index));
    }
  }
  return picks;
}

std::optional<int> SnakeDraftCalculator::SlotForPick(int team_count, int pick_number) {
  auto round = RoundForPick(team_count, pick_number);
  if (!round) {
    return std::nullopt;
  }
  int offset = (pick_number - 1) % team_count;
  return (*round % 2 == 0) ? offset : team_count - 1 - offset;
}

std::optional<int> SnakeDraftCalculator::RoundForPick(int team_count, int pick_number) {
  if (team_count < 1 || pick_number < 1) {
    return std::nullopt;
  }
  return (pick_number - 1) / team_count;
}

std::optional<int> SnakeDraftCalculator::NextPick(int current_pick) const {
  // picks_ is strictly increasing
  auto it = std::upper_bound(picks_.begin(), picks_.end(), current_pick);
  if (it == picks_.end()) {
    return std::nullopt;
  }
  return *it;
}

int SnakeDraftCalculator::PicksUntilNext(int current_pick) const {
  auto next = NextPick(current_pick);
  return next ? *next - current_pick : 0;
}

} // namespace draft
} // namespace draftops
