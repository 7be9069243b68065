// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace courier {
namespace network {

/**
 * Peer - network address of a node serving the public API
 *
 * Plain value type: two peers are the same peer iff host and port match.
 * The same peer may be returned by several discovery calls.
 */
struct Peer {
  std::string host;
  uint16_t port{0};

  std::string ToString() const {
    // Bracket IPv6 literals so the result stays parseable as host:port
    if (host.find(':') != std::string::npos) {
      return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
  }

  bool operator==(const Peer &) const = default;
  auto operator<=>(const Peer &) const = default;
};

} // namespace network
} // namespace courier
