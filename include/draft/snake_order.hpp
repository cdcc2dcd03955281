// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <vector>

namespace draftops {
namespace draft {

/**
 * Snake draft position math
 *
 * Order runs 1..N in even rounds (0-based) and N..1 in odd rounds. For a
 * team at 0-based draft slot i in round r:
 *   even r: r*N + i + 1
 *   odd r:  r*N + (N - i)
 */
class SnakeDraftCalculator {
public:
  SnakeDraftCalculator() = default;

  // Precomputes the pick list. Invalid arguments leave it empty.
  SnakeDraftCalculator(int team_count, int rounds, int my_index);

  /**
   * Ordered overall pick numbers for slot my_index
   * Returns an empty list if team_count < 1, rounds < 0 or my_index is not
   * in [0, team_count)
   */
  static std::vector<int> CalculatePickNumbers(int team_count, int rounds, int my_index);

  // 0-based draft slot that owns an overall pick (std::nullopt if pick < 1)
  static std::optional<int> SlotForPick(int team_count, int pick_number);

  // 0-based round of an overall pick (std::nullopt if pick < 1)
  static std::optional<int> RoundForPick(int team_count, int pick_number);

  const std::vector<int> &PickNumbers() const { return picks_; }
  bool IsConfigured() const { return !picks_.empty(); }

  /**
   * Distance from current_pick to the next owned pick strictly after it;
   * 0 if none remain
   */
  int PicksUntilNext(int current_pick) const;

  // Next owned pick strictly after current_pick
  std::optional<int> NextPick(int current_pick) const;

private:
  std::vector<int> picks_;
};

} // namespace draft
} // namespace draftops
