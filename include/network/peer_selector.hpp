// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/peer_discovery.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace courier {
namespace network {

enum class SelectionError {
  None,
  NoCandidates,    // Discovery returned no peer advertising the plugin
  NoReachablePeer  // Every probed candidate failed, or attempts ran out
};

const char *SelectionErrorName(SelectionError error);

// Either a peer that passed its probe, or the reason none was found
struct SelectionResult {
  std::optional<Peer> peer;
  SelectionError error{SelectionError::None};
  int probes{0}; // Reachability probes spent on this selection

  bool ok() const { return peer.has_value(); }
};

using SelectionCallback = std::function<void(SelectionResult result)>;

/**
 * PeerSelector - chooses the peer for the next request
 *
 * Explicit-peer mode: the configured peer is returned verbatim, discovery and
 * probing are skipped entirely.
 *
 * Discovery mode: one discovery lookup per selection, then up to
 * max_attempts rounds of
 *   sample uniformly among candidates not yet rejected -> probe -> accept.
 * A rejected probe logs a warning and waits an exponential backoff
 * (base * 2^(n-1), capped, +/-50% jitter) before the next round.
 *
 * The accepted peer was reachable when probed; nothing guarantees it still
 * is when the request goes out.
 */
class PeerSelector {
public:
  struct Config {
    std::optional<Peer> explicit_peer;  // Set => bypass discovery and probing
    std::string plugin;                 // Capability candidates must advertise
    int max_attempts;                   // Probes per selection
    std::chrono::milliseconds base_backoff;
    std::chrono::milliseconds max_backoff;

    Config()
        : plugin(protocol::CORE_API_PLUGIN), max_attempts(5),
          base_backoff(std::chrono::milliseconds(100)),
          max_backoff(std::chrono::milliseconds(2000)) {}
  };

  /**
   * @param discovery Candidate source (may be null in explicit-peer mode)
   * @param probe     Reachability check (may be null in explicit-peer mode)
   * @throws std::invalid_argument if discovery mode lacks a collaborator or
   *         max_attempts < 1
   */
  PeerSelector(boost::asio::io_context &io_context,
               std::shared_ptr<PeerDiscovery> discovery,
               std::shared_ptr<ReachabilityProbe> probe,
               Config config = Config{});

  PeerSelector(const PeerSelector&) = delete;
  PeerSelector& operator=(const PeerSelector&) = delete;

  // Select a peer; the callback is never invoked inline
  void SelectPeer(SelectionCallback callback);

  // Backoff before the round following the n-th rejection (n >= 1), without jitter
  std::chrono::milliseconds BackoffFor(int rejections) const;

  const Config &config() const { return config_; }

private:
  struct Round;

  void ProbeNext(std::shared_ptr<Round> round);
  void OnProbeResult(std::shared_ptr<Round> round, Peer peer, bool reachable);
  std::chrono::milliseconds JitteredBackoff(int rejections);

  boost::asio::io_context &io_context_;
  std::shared_ptr<PeerDiscovery> discovery_;
  std::shared_ptr<ReachabilityProbe> probe_;
  Config config_;
  std::mt19937 rng_;
};

} // namespace network
} // namespace courier
