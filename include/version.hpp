// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace draftops {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "draftops version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
} // namespace colors

namespace detail {
// One boxed line: "║  <label><value>   ║", 65 display columns wide
inline std::string BannerLine(const std::string &label, const std::string &value) {
  std::string text = label + value;
  if (text.length() > 61) {
    text.resize(61);
  }
  return "║  " + text + std::string(61 - text.length(), ' ') + "║\n";
}
} // namespace detail

// Startup banner naming the league and the tracked team
inline std::string GetStartupBanner(const std::string &league_id, const std::string &team_id) {
  std::string banner;
  banner += "\n";
  banner += colors::GREEN;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "║                  draftops - draft state engine                ║\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += detail::BannerLine("Version: ", GetVersionString());
  banner += detail::BannerLine("League:  ", league_id.empty() ? "-" : league_id);
  banner += detail::BannerLine("Team:    ", team_id.empty() ? "-" : team_id);
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += detail::BannerLine("", GetCopyrightString());
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace draftops
