// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "chain/network_config.hpp"
#include "network/milestone_watcher.hpp"
#include "network/peer_discovery_client.hpp"
#include "network/peer_selector.hpp"
#include "network/request_dispatcher.hpp"
#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace courier {
namespace network {

// Startup options (immutable once Init() has been called)
struct NetworkOptions {
  std::string network{"devnet"};           // Preset name
  std::optional<std::string> peer;         // Explicit seed peer host
  std::optional<uint16_t> peer_port;       // Defaults to the preset's API port
  int max_latency_ms{protocol::DEFAULT_MAX_LATENCY_MS};

  // Selection and polling knobs (defaults suit production)
  PeerSelector::Config selector;
  MilestoneWatcher::Config watcher;
};

/**
 * NetworkClient - entry point for talking to the network's public API
 *
 * Init() selects the network preset, sets up discovery (against the explicit
 * peer's peer list when one is configured, otherwise against the preset's
 * seeds), and starts the milestone watcher. Afterwards SendGET/SendPOST
 * dispatch requests with peer failover.
 *
 * Threading: all methods and callbacks run on the io_context thread. The
 * client must outlive every pending operation.
 */
class NetworkClient {
public:
  using InitCallback = std::function<void(std::exception_ptr error)>;

  /**
   * @param http  HTTP transport (nullptr = BeastHttpClient on io_context)
   * @param probe Reachability check (nullptr = TcpReachabilityProbe)
   */
  explicit NetworkClient(boost::asio::io_context &io_context,
                         std::shared_ptr<HttpClient> http = nullptr,
                         std::shared_ptr<ReachabilityProbe> probe = nullptr);
  ~NetworkClient();

  NetworkClient(const NetworkClient&) = delete;
  NetworkClient& operator=(const NetworkClient&) = delete;

  /**
   * Initialize once
   *
   * The callback receives nullptr on success, or the DiscoveryError that
   * made discovery unusable (the client then stays uninitialized).
   *
   * @throws std::logic_error on a second call
   * @throws std::invalid_argument for an unknown network name
   */
  void Init(const NetworkOptions &options, InitCallback callback);

  /**
   * GET /api/<path>?<query>
   * @throws std::logic_error before a successful Init()
   */
  void SendGET(const std::string &path, DispatchCallback callback,
               const nlohmann::json &query = nlohmann::json::object());

  /**
   * POST /api/<path> with a JSON body (strings are sent verbatim)
   * @throws std::logic_error before a successful Init()
   */
  void SendPOST(const std::string &path, const nlohmann::json &body,
                DispatchCallback callback);

  // Current chain height as reported by a peer (nullopt on failure)
  void GetHeight(HeightCallback callback);

  // Stop the milestone watcher. Safe to call repeatedly.
  void Shutdown();

  bool IsInitialized() const { return initialized_; }
  const NetworkOptions &options() const { return options_; }
  chain::NetworkConfigManager &config_manager() { return config_manager_; }
  const MilestoneWatcher *watcher() const { return watcher_.get(); }
  PeerDiscoveryClient *discovery() const { return discovery_.get(); }

private:
  void RequireInitialized(const char *operation) const;
  void OnDiscoveryReady(std::shared_ptr<PeerDiscoveryClient> discovery);

  boost::asio::io_context &io_context_;
  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<ReachabilityProbe> probe_;

  NetworkOptions options_;
  chain::NetworkConfigManager config_manager_;

  std::shared_ptr<PeerDiscoveryClient> discovery_;
  std::unique_ptr<PeerSelector> selector_;
  std::unique_ptr<RequestDispatcher> dispatcher_;
  std::unique_ptr<MilestoneWatcher> watcher_;

  bool init_started_{false};
  bool initialized_{false};
};

} // namespace network
} // namespace courier
