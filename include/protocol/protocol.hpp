// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace draftops {
namespace protocol {

// Draft-room frame verbs. Frames are single ASCII lines, whitespace
// delimited; the verb is matched case-insensitively.
namespace commands {
// Draft progress
constexpr const char *SELECTED = "SELECTED";   // SELECTED <team> <player> <pick> [<member>]
constexpr const char *SELECTING = "SELECTING"; // SELECTING <team> <time_limit_ms>
constexpr const char *CLOCK = "CLOCK";         // CLOCK <team> <remaining_ms> [<round>]
constexpr const char *AUTODRAFT = "AUTODRAFT"; // AUTODRAFT <team> <bool>

// Session management / keep-alive (payload is free-form)
constexpr const char *TOKEN = "TOKEN";
constexpr const char *JOINED = "JOINED";
constexpr const char *LEFT = "LEFT";
constexpr const char *PING = "PING";
constexpr const char *PONG = "PONG";

// Pseudo-command for frames with an unrecognised (or missing) verb
constexpr const char *UNKNOWN = "UNKNOWN";
} // namespace commands

// Frames longer than this are rejected as malformed before tokenising
constexpr size_t MAX_FRAME_LENGTH = 16 * 1024;

// Maximum accepted team id and pick number
constexpr int MAX_TEAM_ID = 1000;
constexpr int MAX_PICK_NUMBER = 100000;

// Clock values above one day are treated as malformed
constexpr int64_t MAX_TIME_MS = 24LL * 60 * 60 * 1000;

} // namespace protocol
} // namespace draftops
