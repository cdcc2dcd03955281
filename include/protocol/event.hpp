// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "protocol/protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace draftops {
namespace protocol {

/**
 * Malformed frame for a recognised command (wrong arity, non-numeric field,
 * out-of-range value). Non-fatal: the frame is skipped and counted.
 */
class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &command, const std::string &detail)
      : std::runtime_error(command + ": " + detail), command_(command) {}

  const std::string &command() const { return command_; }

private:
  std::string command_;
};

/**
 * Base class for all decoded draft-room events
 */
class Event {
public:
  virtual ~Event() = default;

  // Upper-case verb this event was decoded from (see protocol::commands)
  virtual std::string command() const = 0;

  // Populate fields from the tokens after the verb. Returns false and sets
  // error() when the arguments are malformed.
  virtual bool deserialize(const std::vector<std::string> &args) = 0;

  const std::string &raw() const { return raw_; }
  void set_raw(std::string raw) { raw_ = std::move(raw); }

  const std::string &error() const { return error_; }

protected:
  bool fail(std::string why) {
    error_ = std::move(why);
    return false;
  }

private:
  std::string raw_;
  std::string error_;
};

/**
 * SELECTED - a team made a pick
 *
 * pick_number is the overall (1-based) pick number.
 */
class SelectedEvent : public Event {
public:
  int team_id{0};
  std::string player_id;
  int pick_number{0};
  std::optional<std::string> member_id;

  std::string command() const override { return commands::SELECTED; }
  bool deserialize(const std::vector<std::string> &args) override;
};

/**
 * SELECTING - a team is now on the clock
 */
class SelectingEvent : public Event {
public:
  int team_id{0};
  int64_t time_limit_ms{0};

  std::string command() const override { return commands::SELECTING; }
  bool deserialize(const std::vector<std::string> &args) override;
};

/**
 * CLOCK - countdown tick for the team on the clock
 */
class ClockEvent : public Event {
public:
  int team_id{0};
  int64_t time_remaining_ms{0};
  std::optional<int> round;

  std::string command() const override { return commands::CLOCK; }
  bool deserialize(const std::vector<std::string> &args) override;
};

/**
 * AUTODRAFT - autodraft toggled for a team (informational)
 */
class AutodraftEvent : public Event {
public:
  int team_id{0};
  bool enabled{false};

  std::string command() const override { return commands::AUTODRAFT; }
  bool deserialize(const std::vector<std::string> &args) override;
};

/**
 * TOKEN / JOINED / LEFT / PING / PONG - session and keep-alive traffic.
 * Any payload is accepted; never mutates draft state.
 */
class SessionEvent : public Event {
public:
  explicit SessionEvent(std::string kind) : kind_(std::move(kind)) {}

  std::vector<std::string> payload;

  std::string command() const override { return kind_; }
  bool deserialize(const std::vector<std::string> &args) override;

private:
  std::string kind_;
};

/**
 * Frame whose verb is not part of the protocol (not an error)
 */
class UnknownEvent : public Event {
public:
  // Verb exactly as received (empty for blank frames)
  std::string verb;

  std::string command() const override { return commands::UNKNOWN; }
  bool deserialize(const std::vector<std::string> &args) override;
};

// Factory for recognised verbs (upper-case). Returns nullptr otherwise.
std::unique_ptr<Event> create_event(const std::string &command);

// True for TOKEN, JOINED, LEFT, PING and PONG
bool IsSessionCommand(const std::string &command);

/**
 * Decode one raw frame into an event.
 *
 * Never returns nullptr: unrecognised or blank frames produce an
 * UnknownEvent. Throws ParseError when a recognised command is malformed.
 */
std::unique_ptr<Event> ParseFrame(const std::string &line);

} // namespace protocol
} // namespace draftops
