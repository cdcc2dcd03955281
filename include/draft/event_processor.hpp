// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "protocol/event.hpp"
#include "protocol/event_dispatcher.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace draftops {
namespace draft {

class ConsistencyValidator;
class DraftNotifications;
class DraftStateStore;

struct ProcessorStats {
  uint64_t total_messages{0};
  uint64_t selected{0};
  uint64_t selecting{0};
  uint64_t clock{0};
  uint64_t autodraft{0};
  uint64_t session{0};
  uint64_t unknown{0};
  uint64_t parse_errors{0};
  uint64_t state_errors{0};
  uint64_t pick_rejections{0};
  uint64_t total_processing_us{0};

  // Share of frames that neither failed to parse nor failed to apply
  double SuccessRate() const;
  double AverageProcessingMicros() const;

  nlohmann::json ToJson() const;
};

/**
 * EventProcessor - the single writer of draft state
 *
 * Parses raw frames, routes the resulting events through an
 * EventDispatcher to the matching DraftStateStore mutator and publishes
 * DraftNotifications once the store call has returned. One frame is
 * processed at a time; concurrent callers are serialised.
 *
 * Parse errors and rejected mutations are counted and logged, never
 * thrown. After every validate_every_picks applied picks the validator
 * runs with self-heal; a ConsistencyViolation from it is the only
 * exception that leaves ProcessFrame().
 *
 * Roster positions come from a synchronous, cache-only resolver. With no
 * resolver, or when it misses or throws, the pick is recorded as BENCH and
 * published with resolved == false so a background resolver can patch it.
 */
class EventProcessor {
public:
  using PositionResolver = std::function<std::optional<std::string>(const std::string &)>;

  struct Config {
    int validate_every_picks{1};       // 0 disables periodic validation
    double clock_warning_seconds{5.0}; // warn when our team is this low
  };

  EventProcessor(DraftStateStore &store, ConsistencyValidator &validator,
                 DraftNotifications &notifications);
  EventProcessor(DraftStateStore &store, ConsistencyValidator &validator,
                 DraftNotifications &notifications, Config config);

  EventProcessor(const EventProcessor &) = delete;
  EventProcessor &operator=(const EventProcessor &) = delete;

  void SetPositionResolver(PositionResolver resolver);

  /**
   * Parse and apply one raw frame.
   * @return true if the frame parsed and its handler succeeded
   * @throws ConsistencyViolation if validation fails and cannot self-heal
   */
  bool ProcessFrame(const std::string &line);

  // Apply an already-decoded event (same rules as ProcessFrame)
  bool ProcessEvent(const protocol::Event &event);

  // Restore a snapshot between frames (see DraftStateStore::RollbackToSnapshot)
  bool RollbackToSnapshot(long long index);

  // Extension point: register handlers for further commands
  protocol::EventDispatcher &dispatcher() { return dispatcher_; }

  ProcessorStats GetStats() const;
  void ResetStats();

private:
  bool ProcessEventLocked(const protocol::Event &event);
  void CountEvent(const std::string &command);
  void RecordElapsed(uint64_t micros);
  void AfterPickApplied();

  bool HandleSelected(const protocol::SelectedEvent &event);
  bool HandleSelecting(const protocol::SelectingEvent &event);
  bool HandleClock(const protocol::ClockEvent &event);
  bool HandleAutodraft(const protocol::AutodraftEvent &event);
  bool HandleSession(const protocol::SessionEvent &event);
  bool HandleUnknown(const protocol::UnknownEvent &event);

  // Position for player_id; sets resolved to false on a miss
  std::string ResolvePosition(const std::string &player_id, bool &resolved);

  DraftStateStore &store_;
  ConsistencyValidator &validator_;
  DraftNotifications &notifications_;
  const Config config_;

  protocol::EventDispatcher dispatcher_;

  // Serialises frame processing (single writer)
  std::mutex process_mutex_;
  PositionResolver resolver_;
  int picks_since_validation_{0};
  bool pick_applied_{false};
  int clock_warned_pick_{0};

  mutable std::mutex stats_mutex_;
  ProcessorStats stats_;
};

} // namespace draft
} // namespace draftops
