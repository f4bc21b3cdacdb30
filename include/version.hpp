// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace blockledger {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 1;
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
  return "BlockLedger version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // Main
constexpr const char *GREEN = "\033[1;32m"; // Regtest
} // namespace colors

// Startup banner with chain type ("MAIN" or "REGTEST")
inline std::string GetStartupBanner(const std::string &chain_type) {
  const char *color = chain_type == "REGTEST" ? colors::GREEN : colors::BLUE;

  const std::string rule(63, '=');
  auto line = [](const std::string &text) {
    std::string padded = "  " + text;
    if (padded.size() < 63) {
      padded += std::string(63 - padded.size(), ' ');
    }
    return "|" + padded + "|\n";
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+" + rule + "+\n";
  banner += line("");
  banner += line("BlockLedger - single-node proof-of-work ledger");
  banner += line("");
  banner += "+" + rule + "+\n";
  banner += line("Version: " + GetVersionString());
  banner += line("Chain:   " + chain_type);
  banner += "+" + rule + "+\n";
  banner += line(GetCopyrightString());
  banner += "+" + rule + "+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace blockledger
