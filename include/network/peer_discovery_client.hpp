// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_discovery.hpp"
#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace courier {
namespace network {

/**
 * PeerDiscoveryClient - discovery over the nodes' public peer lists
 *
 * Holds a list of seed endpoints. Every lookup picks one seed uniformly at
 * random, fetches its GET /api/peers, sorts the result by reported latency
 * and applies the configured filters.
 *
 * Seeds come either from a network preset's fixed seeds, or from the peer
 * list of an explicit host (fetched once by Create()).
 */
class PeerDiscoveryClient : public PeerDiscovery,
                            public std::enable_shared_from_this<PeerDiscoveryClient> {
public:
  using CreateCallback =
      std::function<void(std::shared_ptr<PeerDiscoveryClient> client, std::exception_ptr error)>;

  /**
   * Create a client for a network name or a seed host URL
   *
   * @param network_or_host Preset name ("devnet") or peer-list URL
   *                        ("http://1.2.3.4:4003/api/peers")
   * @param callback Receives the client, or a DiscoveryError if the preset is
   *                 unknown or the seed host's peer list cannot be fetched
   */
  static void Create(boost::asio::io_context &io_context,
                     std::shared_ptr<HttpClient> http,
                     const std::string &network_or_host, CreateCallback callback);

  // Direct construction from known seeds ("host:port" strings)
  PeerDiscoveryClient(boost::asio::io_context &io_context,
                      std::shared_ptr<HttpClient> http,
                      std::vector<Peer> seeds);

  // Only keep peers whose reported latency is <= max_latency_ms
  PeerDiscoveryClient &WithLatency(int max_latency_ms);

  // Return at most `limit` peers (0 = unlimited)
  PeerDiscoveryClient &WithLimit(size_t limit);

  /**
   * Fetch the filtered peer list from a random seed
   *
   * Transport or parse failures are logged and produce an empty list.
   */
  void FindPeers(std::function<void(std::vector<PeerInfo>)> callback);

  void FindPeersWithPlugin(const std::string &plugin,
                           PeersCallback callback) override;

  const std::vector<Peer> &Seeds() const { return seeds_; }
  std::optional<int> MaxLatency() const { return max_latency_ms_; }

private:
  // Apply latency filter, latency ordering and limit
  std::vector<PeerInfo> Filter(std::vector<PeerInfo> peers) const;

  boost::asio::io_context &io_context_;
  std::shared_ptr<HttpClient> http_;
  std::vector<Peer> seeds_;
  std::optional<int> max_latency_ms_;
  size_t limit_{0};
  std::mt19937 rng_;
};

} // namespace network
} // namespace courier
