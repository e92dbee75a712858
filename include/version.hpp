// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace algoprobe {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// User-Agent header sent during the HTTP upgrade
// Format: algoprobe/0.3.0
inline std::string GetUserAgent() {
  return "algoprobe/" + GetVersionString();
}

inline std::string GetFullVersionString() {
  return "algoprobe version " + GetVersionString();
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";
constexpr const char *GREEN = "\033[1;32m";
} // namespace colors

// Startup line for the CLI; role is "initiator" or "responder"
inline std::string GetStartupBanner(const std::string &role) {
  const char *color = role == "responder" ? colors::GREEN : colors::BLUE;
  std::string banner;
  banner += color;
  banner += "algoprobe " + GetVersionString() + " - Algorand gossip protocol probe";
  banner += " (" + role + ")";
  banner += colors::RESET;
  banner += "\n";
  return banner;
}

} // namespace algoprobe
