// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "protocol/event.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <limits>

namespace draftops {
namespace protocol {

namespace {

std::optional<int> ParseTeamId(const std::string &token) {
  return util::SafeParseInt(token, 0, MAX_TEAM_ID);
}

std::optional<int64_t> ParseMillis(const std::string &token) {
  return util::SafeParseInt64(token, 0, MAX_TIME_MS);
}

} // namespace

// SelectedEvent
bool SelectedEvent::deserialize(const std::vector<std::string> &args) {
  if (args.size() < 3 || args.size() > 4) {
    return fail("expected 3 or 4 arguments, got " + std::to_string(args.size()));
  }

  auto team = ParseTeamId(args[0]);
  if (!team) {
    return fail("invalid team id '" + args[0] + "'");
  }
  auto pick = util::SafeParseInt(args[2], 1, MAX_PICK_NUMBER);
  if (!pick) {
    return fail("invalid pick number '" + args[2] + "'");
  }

  team_id = *team;
  player_id = args[1];
  pick_number = *pick;
  if (args.size() == 4) {
    member_id = args[3];
  }
  return true;
}

// SelectingEvent
bool SelectingEvent::deserialize(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return fail("expected 2 arguments, got " + std::to_string(args.size()));
  }

  auto team = ParseTeamId(args[0]);
  if (!team) {
    return fail("invalid team id '" + args[0] + "'");
  }
  auto limit = ParseMillis(args[1]);
  if (!limit) {
    return fail("invalid time limit '" + args[1] + "'");
  }

  team_id = *team;
  time_limit_ms = *limit;
  return true;
}

// ClockEvent
bool ClockEvent::deserialize(const std::vector<std::string> &args) {
  if (args.size() < 2 || args.size() > 3) {
    return fail("expected 2 or 3 arguments, got " + std::to_string(args.size()));
  }

  auto team = ParseTeamId(args[0]);
  if (!team) {
    return fail("invalid team id '" + args[0] + "'");
  }
  auto remaining = ParseMillis(args[1]);
  if (!remaining) {
    return fail("invalid time remaining '" + args[1] + "'");
  }

  team_id = *team;
  time_remaining_ms = *remaining;
  if (args.size() == 3) {
    auto r = util::SafeParseInt(args[2], 0, std::numeric_limits<int>::max());
    if (!r) {
      return fail("invalid round '" + args[2] + "'");
    }
    round = *r;
  }
  return true;
}

// AutodraftEvent
bool AutodraftEvent::deserialize(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return fail("expected 2 arguments, got " + std::to_string(args.size()));
  }

  auto team = ParseTeamId(args[0]);
  if (!team) {
    return fail("invalid team id '" + args[0] + "'");
  }
  auto flag = util::SafeParseBool(args[1]);
  if (!flag) {
    return fail("invalid autodraft flag '" + args[1] + "'");
  }

  team_id = *team;
  enabled = *flag;
  return true;
}

// SessionEvent
bool SessionEvent::deserialize(const std::vector<std::string> &args) {
  payload = args;
  return true;
}

// UnknownEvent
bool UnknownEvent::deserialize(const std::vector<std::string> &) {
  return true;
}

bool IsSessionCommand(const std::string &command) {
  return command == commands::TOKEN || command == commands::JOINED ||
         command == commands::LEFT || command == commands::PING ||
         command == commands::PONG;
}

std::unique_ptr<Event> create_event(const std::string &command) {
  if (command == commands::SELECTED)
    return std::make_unique<SelectedEvent>();
  if (command == commands::SELECTING)
    return std::make_unique<SelectingEvent>();
  if (command == commands::CLOCK)
    return std::make_unique<ClockEvent>();
  if (command == commands::AUTODRAFT)
    return std::make_unique<AutodraftEvent>();
  if (IsSessionCommand(command))
    return std::make_unique<SessionEvent>(command);

  return nullptr;
}

std::unique_ptr<Event> ParseFrame(const std::string &line) {
  if (line.size() > MAX_FRAME_LENGTH) {
    throw ParseError(commands::UNKNOWN,
                     "frame too large (" + std::to_string(line.size()) + " bytes)");
  }

  std::vector<std::string> tokens = util::SplitWhitespace(line);
  if (tokens.empty()) {
    auto unknown = std::make_unique<UnknownEvent>();
    unknown->set_raw(line);
    return unknown;
  }

  const std::string verb = util::ToUpper(tokens.front());
  std::unique_ptr<Event> event = create_event(verb);
  if (!event) {
    auto unknown = std::make_unique<UnknownEvent>();
    unknown->verb = tokens.front();
    unknown->set_raw(line);
    LOG_PROTO_TRACE("Unrecognised frame verb '{}'", tokens.front());
    return unknown;
  }

  std::vector<std::string> args(tokens.begin() + 1, tokens.end());
  if (!event->deserialize(args)) {
    throw ParseError(verb, event->error());
  }

  event->set_raw(line);
  return event;
}

} // namespace protocol
} // namespace draftops
