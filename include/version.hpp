// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace lansync {

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
constexpr const char *COPYRIGHT_HOLDERS = "The LanSync Developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "LanSync version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner with the service port
inline std::string GetStartupBanner(uint16_t port) {
  const std::string version_str = GetVersionString();
  const std::string port_str = std::to_string(port);

  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner += "+-------------------------------------------------+\n";
  banner += "|  LanSync - LAN discovery and sync channel       |\n";
  banner += "+-------------------------------------------------+\n";
  // Inner width 49: "|  Version: " is 11 chars
  banner += "|  Version: " + version_str;
  banner += std::string(version_str.length() < 38 ? 38 - version_str.length() : 0, ' ') + "|\n";
  banner += "|  Port:    " + port_str;
  banner += std::string(port_str.length() < 38 ? 38 - port_str.length() : 0, ' ') + "|\n";
  banner += "|  " + GetCopyrightString();
  const size_t copyright_len = GetCopyrightString().length();
  banner += std::string(copyright_len < 47 ? 47 - copyright_len : 0, ' ') + "|\n";
  banner += "+-------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace lansync
