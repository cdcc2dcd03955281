// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace draftops {
namespace util {

namespace {

// Shared front half of the integer parsers: rejects empty and
// whitespace-leading input, requires full consumption.
std::optional<long long> ParseWholeInteger(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos, 10);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWholeInteger(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  auto value = ParseWholeInteger(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<bool> SafeParseBool(const std::string& str) {
  const std::string upper = ToUpper(str);
  if (upper == "TRUE" || upper == "1") {
    return true;
  }
  if (upper == "FALSE" || upper == "0") {
    return false;
  }
  return std::nullopt;
}

std::string ToUpper(const std::string& str) {
  std::string out = str;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> SplitWhitespace(const std::string& str) {
  std::vector<std::string> tokens;
  std::istringstream iss(str);
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

} // namespace util
} // namespace draftops
