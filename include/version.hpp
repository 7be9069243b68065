// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace courier {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 4;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Courier Developers";

// User agent sent with every outbound HTTP request
// Format: courier/0.4.0
inline std::string GetUserAgent() {
  return "courier/" + GetVersionString();
}

// Full version info for display
inline std::string GetFullVersionString() {
  return "Courier version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace courier
