// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "draft/event_processor.hpp"
#include "draft/consistency_validator.hpp"
#include "draft/draft_state.hpp"
#include "draft/notifications.hpp"
#include "util/logging.hpp"
#include <chrono>

namespace draftops {
namespace draft {

using namespace protocol;

double ProcessorStats::SuccessRate() const {
  if (total_messages == 0) {
    return 1.0;
  }
  const uint64_t failed = parse_errors + state_errors;
  if (failed >= total_messages) {
    return 0.0;
  }
  return static_cast<double>(total_messages - failed) / static_cast<double>(total_messages);
}

double ProcessorStats::AverageProcessingMicros() const {
  if (total_messages == 0) {
    return 0.0;
  }
  return static_cast<double>(total_processing_us) / static_cast<double>(total_messages);
}

nlohmann::json ProcessorStats::ToJson() const {
  return nlohmann::json{{"total_messages", total_messages},
                        {"message_types",
                         {{"SELECTED", selected},
                          {"SELECTING", selecting},
                          {"CLOCK", clock},
                          {"AUTODRAFT", autodraft},
                          {"SESSION", session},
                          {"UNKNOWN", unknown}}},
                        {"parse_errors", parse_errors},
                        {"state_errors", state_errors},
                        {"pick_rejections", pick_rejections},
                        {"success_rate", SuccessRate()},
                        {"avg_processing_us", AverageProcessingMicros()}};
}

EventProcessor::EventProcessor(DraftStateStore &store, ConsistencyValidator &validator,
                               DraftNotifications &notifications)
    : EventProcessor(store, validator, notifications, Config{}) {}

EventProcessor::EventProcessor(DraftStateStore &store, ConsistencyValidator &validator,
                               DraftNotifications &notifications, Config config)
    : store_(store), validator_(validator), notifications_(notifications), config_(config) {
  dispatcher_.RegisterHandler(commands::SELECTED, [this](const Event &e) {
    return HandleSelected(static_cast<const SelectedEvent &>(e));
  });
  dispatcher_.RegisterHandler(commands::SELECTING, [this](const Event &e) {
    return HandleSelecting(static_cast<const SelectingEvent &>(e));
  });
  dispatcher_.RegisterHandler(commands::CLOCK, [this](const Event &e) {
    return HandleClock(static_cast<const ClockEvent &>(e));
  });
  dispatcher_.RegisterHandler(commands::AUTODRAFT, [this](const Event &e) {
    return HandleAutodraft(static_cast<const AutodraftEvent &>(e));
  });
  for (const char *kind : {commands::TOKEN, commands::JOINED, commands::LEFT, commands::PING,
                           commands::PONG}) {
    dispatcher_.RegisterHandler(kind, [this](const Event &e) {
      return HandleSession(static_cast<const SessionEvent &>(e));
    });
  }
  dispatcher_.RegisterHandler(commands::UNKNOWN, [this](const Event &e) {
    return HandleUnknown(static_cast<const UnknownEvent &>(e));
  });
}

void EventProcessor::SetPositionResolver(PositionResolver resolver) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  resolver_ = std::move(resolver);
}

// ============================================================================
// Frame entry points
// ============================================================================

bool EventProcessor::ProcessFrame(const std::string &line) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  const auto start = std::chrono::steady_clock::now();

  std::unique_ptr<Event> event;
  try {
    event = ParseFrame(line);
  } catch (const ParseError &e) {
    {
      std::lock_guard<std::mutex> stats_lock(stats_mutex_);
      stats_.total_messages++;
      stats_.parse_errors++;
    }
    LOG_PROTO_WARN("Parse error, frame skipped: {} (raw: '{}')", e.what(), line);
    RecordElapsed(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                            std::chrono::steady_clock::now() - start)
                                            .count()));
    return false;
  }

  const bool ok = ProcessEventLocked(*event);
  RecordElapsed(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                          std::chrono::steady_clock::now() - start)
                                          .count()));
  if (ok) {
    AfterPickApplied();
  }
  return ok;
}

bool EventProcessor::ProcessEvent(const Event &event) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  const auto start = std::chrono::steady_clock::now();

  const bool ok = ProcessEventLocked(event);
  RecordElapsed(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                          std::chrono::steady_clock::now() - start)
                                          .count()));
  if (ok) {
    AfterPickApplied();
  }
  return ok;
}

bool EventProcessor::ProcessEventLocked(const Event &event) {
  const std::string command = event.command();
  CountEvent(command);

  pick_applied_ = false;
  if (!dispatcher_.Dispatch(event)) {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.state_errors++;
    return false;
  }
  return true;
}

void EventProcessor::CountEvent(const std::string &command) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.total_messages++;
  if (command == commands::SELECTED) {
    stats_.selected++;
  } else if (command == commands::SELECTING) {
    stats_.selecting++;
  } else if (command == commands::CLOCK) {
    stats_.clock++;
  } else if (command == commands::AUTODRAFT) {
    stats_.autodraft++;
  } else if (IsSessionCommand(command)) {
    stats_.session++;
  } else {
    stats_.unknown++;
  }
}

void EventProcessor::RecordElapsed(uint64_t micros) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.total_processing_us += micros;
}

// Runs with process_mutex_ held, after the pick's notifications went out
void EventProcessor::AfterPickApplied() {
  if (!pick_applied_) {
    return;
  }
  pick_applied_ = false;

  if (config_.validate_every_picks > 0 &&
      ++picks_since_validation_ >= config_.validate_every_picks) {
    picks_since_validation_ = 0;
    // Throws ConsistencyViolation when no snapshot can be restored
    validator_.ValidateAndHeal();
  }

  if (store_.GetStatus() != DraftStatus::COMPLETED && validator_.CheckDraftCompletion()) {
    store_.CompleteDraft();
    const size_t total = store_.DraftedCount();
    LOG_DRAFT_INFO("All {} picks made, draft complete", total);
    notifications_.NotifyDraftCompleted(total);
  }
}

// ============================================================================
// Handlers
// ============================================================================

std::string EventProcessor::ResolvePosition(const std::string &player_id, bool &resolved) {
  resolved = false;
  if (!resolver_) {
    return slots::BENCH;
  }
  try {
    if (auto position = resolver_(player_id)) {
      resolved = true;
      return *position;
    }
  } catch (const std::exception &e) {
    LOG_RESOLVER_WARN("Position resolver failed for {}: {}", player_id, e.what());
  }
  return slots::BENCH;
}

bool EventProcessor::HandleSelected(const SelectedEvent &event) {
  const std::string team = std::to_string(event.team_id);

  bool resolved = false;
  const std::string position = ResolvePosition(event.player_id, resolved);

  if (!store_.ApplyPick(event.player_id, team, event.pick_number, position)) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.pick_rejections++;
    return false;
  }

  auto pick = store_.FindPick(event.player_id);
  if (pick) {
    notifications_.NotifyPickProcessed(*pick, resolved);
  }
  pick_applied_ = true;

  LOG_DRAFT_DEBUG("SELECTED: team {} took {} at pick {}{}", team, event.player_id,
                  event.pick_number, resolved ? "" : " (position pending)");
  return true;
}

bool EventProcessor::HandleSelecting(const SelectingEvent &event) {
  const std::string team = std::to_string(event.team_id);
  const int pick_number = store_.GetCurrentPick() + 1;
  const double seconds = static_cast<double>(event.time_limit_ms) / 1000.0;

  if (!store_.StartNewPick(pick_number, team, seconds)) {
    return false;
  }
  notifications_.NotifyTeamSelecting(team, pick_number, seconds);

  if (team == store_.session().team_id) {
    LOG_DRAFT_INFO("Our team is on the clock for pick {} ({:.0f}s)", pick_number, seconds);
  } else {
    LOG_DRAFT_DEBUG("SELECTING: team {} on the clock for pick {}", team, pick_number);
  }
  return true;
}

bool EventProcessor::HandleClock(const ClockEvent &event) {
  const std::string team = std::to_string(event.team_id);
  const double seconds = static_cast<double>(event.time_remaining_ms) / 1000.0;

  store_.UpdateClock(seconds);
  notifications_.NotifyClockUpdate(team, seconds);
  LOG_DRAFT_TRACE("CLOCK: team {} {:.1f}s remaining", team, seconds);

  const int current = store_.GetCurrentPick();
  if (team == store_.session().team_id && seconds <= config_.clock_warning_seconds &&
      clock_warned_pick_ != current) {
    clock_warned_pick_ = current;
    LOG_DRAFT_WARN("Clock running low: {:.1f}s left on pick {}", seconds, current);
  }
  return true;
}

bool EventProcessor::HandleAutodraft(const AutodraftEvent &event) {
  const std::string team = std::to_string(event.team_id);
  notifications_.NotifyAutodraftChanged(team, event.enabled);
  LOG_DRAFT_INFO("Team {} autodraft {}", team, event.enabled ? "enabled" : "disabled");
  return true;
}

bool EventProcessor::HandleSession(const SessionEvent &event) {
  LOG_PROTO_DEBUG("{} ({} args)", event.command(), event.payload.size());
  return true;
}

bool EventProcessor::HandleUnknown(const UnknownEvent &event) {
  LOG_PROTO_TRACE("Ignoring unknown frame '{}'", event.raw());
  return true;
}

bool EventProcessor::RollbackToSnapshot(long long index) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  if (!store_.RollbackToSnapshot(index)) {
    return false;
  }
  picks_since_validation_ = 0;
  clock_warned_pick_ = 0;
  LOG_DRAFT_WARN("Rolled back to snapshot {}, now at pick {}", index, store_.GetCurrentPick());
  notifications_.NotifyStateRecovered(index);
  return true;
}

// ============================================================================
// Statistics
// ============================================================================

ProcessorStats EventProcessor::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void EventProcessor::ResetStats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = ProcessorStats{};
}

} // namespace draft
} // namespace draftops
