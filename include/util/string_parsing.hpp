// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of untrusted text (wire frames, RPC params, command-line
   args) into numeric and boolean values
 - Consistent error handling: every parser returns std::nullopt on failure
   and never throws

 All numeric parsers require the entire input to be consumed (no trailing
 garbage) and enforce [min, max] bounds.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace draftops {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("30000", 0, INT64_MAX) -> 30000
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt (overflow)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse boolean token: true/false/1/0 (case-insensitive)
 */
std::optional<bool> SafeParseBool(const std::string& str);

/**
 * ASCII upper-case copy of str
 */
std::string ToUpper(const std::string& str);

/**
 * Split on any run of ASCII whitespace; empty tokens are never produced
 */
std::vector<std::string> SplitWhitespace(const std::string& str);

} // namespace util
} // namespace draftops
