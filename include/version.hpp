// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace equirelay {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Equirelay Developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "Equirelay version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // Mainnet
constexpr const char *GREEN = "\033[1;32m"; // Regtest
} // namespace colors

// Print startup banner with chain type
inline std::string GetStartupBanner(const std::string &chain_type) {
  const char *color = colors::RESET;
  if (chain_type == "main") {
    color = colors::BLUE;
  } else if (chain_type == "regtest") {
    color = colors::GREEN;
  }

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+---------------------------------------------------------------+\n";
  banner += "|  EQUIRELAY  Incremental Equihash(200,9) header verification   |\n";
  banner += "+---------------------------------------------------------------+\n";

  // Box is 65 chars wide: "|  Version: " is 12, closing "|" is 1
  std::string version_str = GetVersionString();
  banner += "|  Version: " + version_str;
  banner += std::string(52 - version_str.length(), ' ') + "|\n";

  banner += "|  Network: " + chain_type;
  banner += std::string(52 - chain_type.length(), ' ') + "|\n";

  banner += "|  " + GetCopyrightString();
  banner += std::string(61 - GetCopyrightString().length(), ' ') + "|\n";
  banner += "+---------------------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace equirelay
