// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

/*
 PeerDiscovery — abstract source of candidate peers

 The selector only needs "peers that advertise plugin X". Keeping that
 behind an interface lets tests supply fixed candidate sets and keeps the
 peer-list wire format inside PeerDiscoveryClient.
*/

#include "network/peer.hpp"
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier {
namespace network {

// One entry of a peer list as reported by GET /api/peers
struct PeerInfo {
  std::string ip;
  uint16_t port{0};                        // P2P port
  std::map<std::string, int> ports;        // plugin name -> port (-1 = disabled)
  std::optional<int> latency;              // ms, as measured by the reporting node
  std::string version;
  std::optional<int64_t> height;
};

// Init-time discovery failure (unreachable seed host, malformed peer list)
class DiscoveryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using PeersCallback = std::function<void(std::vector<Peer> peers)>;

class PeerDiscovery {
public:
  virtual ~PeerDiscovery() = default;

  /**
   * Peers advertising `plugin`, addressed at the plugin's port
   *
   * An empty result means "no candidate available", not an error.
   * The callback is never invoked inline.
   */
  virtual void FindPeersWithPlugin(const std::string &plugin,
                                   PeersCallback callback) = 0;
};

/**
 * Parse a GET /api/peers response body
 *
 * Expects {"data":[{...}, ...]}. Entries without a usable "ip" or with
 * malformed fields are skipped.
 *
 * @throws DiscoveryError if the body is not JSON or has no "data" array
 */
std::vector<PeerInfo> ParsePeerList(const std::string &body);

/**
 * Port a peer serves `plugin` on
 *
 * Matches a "ports" key equal to `plugin` or ending in "/<plugin>"
 * (e.g. "@scope/core-api"). Ports outside 1..65535 mean disabled.
 */
std::optional<uint16_t> PluginPort(const PeerInfo &info, const std::string &plugin);

} // namespace network
} // namespace courier
