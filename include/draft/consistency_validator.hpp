// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "draft/draft_types.hpp"
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace draftops {
namespace draft {

class DraftStateStore;
class DraftNotifications;

/**
 * Outcome of a consistency check
 *
 * Errors make the result invalid. Warnings and suggestions are advisory.
 */
class ValidationResult {
public:
  bool IsValid() const { return errors_.empty(); }

  void AddError(std::string message) { errors_.push_back(std::move(message)); }
  void AddWarning(std::string message) { warnings_.push_back(std::move(message)); }
  void AddSuggestion(std::string message) { suggestions_.push_back(std::move(message)); }

  const std::vector<std::string> &Errors() const { return errors_; }
  const std::vector<std::string> &Warnings() const { return warnings_; }
  const std::vector<std::string> &Suggestions() const { return suggestions_; }

  nlohmann::json ToJson() const;

private:
  std::vector<std::string> errors_;
  std::vector<std::string> warnings_;
  std::vector<std::string> suggestions_;
};

/**
 * Raised when state is invalid and no retained snapshot validates.
 * The store cannot heal itself any further.
 */
class ConsistencyViolation : public std::runtime_error {
public:
  ConsistencyViolation(const std::string &what, std::vector<std::string> errors)
      : std::runtime_error(what), errors_(std::move(errors)) {}

  const std::vector<std::string> &errors() const { return errors_; }

private:
  std::vector<std::string> errors_;
};

// Static draft facts the checks need beyond the state value itself
struct ValidationContext {
  DraftSession session;
  std::vector<std::string> draft_order;
};

struct ValidatorStats {
  uint64_t validation_checks{0};
  uint64_t validation_failures{0};
  uint64_t state_recoveries{0};
  uint64_t heal_failures{0};

  nlohmann::json ToJson() const;
};

// Advisory thresholds
static constexpr size_t LARGE_POOL_SUGGESTION = 1000;
static constexpr size_t LONG_HISTORY_SUGGESTION = 200;

/**
 * ConsistencyValidator - invariant checks and rollback-based self-heal
 *
 * Hard errors:
 * - drafted count != pick history length
 * - current pick outside [completed, completed + 1] (a team on the clock
 *   is one ahead of the completed count and is NOT an error)
 * - a player both drafted and available
 * - a team's roster size disagrees with its pick history
 * - a player in two rosters, or twice in one
 * - a rostered player that is not drafted
 *
 * Warnings:
 * - a drafted player that is in no roster yet
 * - a pick made by a team other than the snake order expects
 * - a completed draft with an unexpected pick count
 */
class ConsistencyValidator {
public:
  // notifications may be null
  ConsistencyValidator(DraftStateStore &store, DraftNotifications *notifications = nullptr);

  // Check the live state
  ValidationResult Validate();

  // Check any state value (used for live state and for snapshots)
  static ValidationResult ValidateState(const DraftStateData &state,
                                        const ValidationContext &context);

  /**
   * Validate, and on hard errors roll back to the newest snapshot that
   * validates cleanly.
   *
   * Returns the result for the state as found; a successful heal adds a
   * warning naming the restored snapshot.
   * @throws ConsistencyViolation if no snapshot validates
   */
  ValidationResult ValidateAndHeal();

  /**
   * Walk snapshots newest to oldest and roll back to the first valid one.
   * Returns false (and leaves the store untouched) if none validates.
   */
  bool AttemptRecovery();

  // True once picks made >= team_count * rounds
  bool CheckDraftCompletion() const;

  // Team the snake order puts on pick_number; nullopt without a full order
  std::optional<std::string> ExpectedTeamForPick(int pick_number) const;

  static std::optional<std::string> ExpectedTeamForPick(const ValidationContext &context,
                                                        int pick_number);

  ValidatorStats GetStats() const;

private:
  ValidationContext MakeContext() const;

  DraftStateStore &store_;
  DraftNotifications *notifications_;

  std::atomic<uint64_t> validation_checks_{0};
  std::atomic<uint64_t> validation_failures_{0};
  std::atomic<uint64_t> state_recoveries_{0};
  std::atomic<uint64_t> heal_failures_{0};
};

} // namespace draft
} // namespace draftops
