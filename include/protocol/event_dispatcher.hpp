// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef DRAFTOPS_PROTOCOL_EVENT_DISPATCHER_HPP
#define DRAFTOPS_PROTOCOL_EVENT_DISPATCHER_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace draftops {
namespace protocol {

class Event;

/**
 * EventDispatcher - routes decoded events to handlers by command
 *
 * Design:
 * - Components register one handler per command (see protocol::commands)
 * - Thread-safe registration and dispatch
 * - New event kinds need a registration, not a code change here
 *
 * Ownership Model:
 * - Handlers receive the event by const reference, valid only for the
 *   duration of the call. Handlers must not keep it.
 *
 * Usage:
 *   EventDispatcher dispatcher;
 *   dispatcher.RegisterHandler(commands::SELECTED,
 *     [this](const Event& e) {
 *       return HandleSelected(static_cast<const SelectedEvent&>(e));
 *     });
 *   dispatcher.Dispatch(*event);
 */
class EventDispatcher {
public:
  // Handler signature: returns true if the event was applied successfully
  using EventHandler = std::function<bool(const Event&)>;

  EventDispatcher() = default;
  ~EventDispatcher() = default;

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  /**
   * Register handler for a command (replaces any existing handler)
   *
   * Empty commands and empty handlers are rejected.
   */
  void RegisterHandler(const std::string& command, EventHandler handler);

  void UnregisterHandler(const std::string& command);

  /**
   * Dispatch event to the handler registered for event.command()
   *
   * @return false if no handler found, the handler returns false, or the
   *         handler throws; true otherwise
   */
  bool Dispatch(const Event& event);

  bool HasHandler(const std::string& command) const;

  // Sorted list of registered commands (for diagnostics)
  std::vector<std::string> GetRegisteredCommands() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, EventHandler> handlers_;
};

} // namespace protocol
} // namespace draftops

#endif // DRAFTOPS_PROTOCOL_EVENT_DISPATCHER_HPP
