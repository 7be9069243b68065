// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/network_client.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace courier {
namespace network {

NetworkClient::NetworkClient(boost::asio::io_context &io_context,
                             std::shared_ptr<HttpClient> http,
                             std::shared_ptr<ReachabilityProbe> probe)
    : io_context_(io_context), http_(std::move(http)), probe_(std::move(probe)) {
  if (!http_) {
    http_ = std::make_shared<BeastHttpClient>(io_context_);
  }
  if (!probe_) {
    probe_ = std::make_shared<TcpReachabilityProbe>(io_context_);
  }
}

NetworkClient::~NetworkClient() {
  if (watcher_) {
    watcher_->Stop();
  }
}

void NetworkClient::Init(const NetworkOptions &options, InitCallback callback) {
  if (init_started_) {
    throw std::logic_error("NetworkClient::Init called more than once");
  }

  config_manager_.SetFromPreset(options.network);
  init_started_ = true;

  options_ = options;
  if (!options_.peer_port) {
    options_.peer_port = config_manager_.Params()->GetDefaultApiPort();
  }
  if (options_.peer && options_.peer->empty()) {
    options_.peer.reset();
  }

  // Explicit peer: discovery reads that peer's own peer list
  const std::string network_or_host =
      options_.peer ? "http://" + Peer{*options_.peer, *options_.peer_port}.ToString() +
                          protocol::API_ROOT + protocol::paths::PEERS
                    : options_.network;

  LOG_NET_INFO("Initializing network client for \"{}\" via {}", options_.network,
               network_or_host);

  PeerDiscoveryClient::Create(
      io_context_, http_, network_or_host,
      [this, callback = std::move(callback)](std::shared_ptr<PeerDiscoveryClient> discovery,
                                             std::exception_ptr error) {
        if (error) {
          callback(error);
          return;
        }
        OnDiscoveryReady(std::move(discovery));
        callback(nullptr);
      });
}

void NetworkClient::OnDiscoveryReady(std::shared_ptr<PeerDiscoveryClient> discovery) {
  discovery_ = std::move(discovery);
  discovery_->WithLatency(options_.max_latency_ms);

  PeerSelector::Config selector_config = options_.selector;
  if (options_.peer) {
    selector_config.explicit_peer = Peer{*options_.peer, *options_.peer_port};
  }
  selector_ = std::make_unique<PeerSelector>(io_context_, discovery_, probe_,
                                             selector_config);

  RequestDispatcher::Config dispatcher_config;
  dispatcher_config.network = options_.network;
  dispatcher_ = std::make_unique<RequestDispatcher>(*selector_, http_, dispatcher_config);

  watcher_ = std::make_unique<MilestoneWatcher>(io_context_, *dispatcher_,
                                                config_manager_, options_.watcher);
  initialized_ = true;
  watcher_->Start();

  LOG_NET_INFO("Network client ready (network={}, peer={})", options_.network,
               options_.peer ? *options_.peer : "discovery");
}

void NetworkClient::RequireInitialized(const char *operation) const {
  if (!initialized_) {
    throw std::logic_error(std::string(operation) + " called before NetworkClient::Init completed");
  }
}

void NetworkClient::SendGET(const std::string &path, DispatchCallback callback,
                            const nlohmann::json &query) {
  RequireInitialized("SendGET");
  dispatcher_->Dispatch(RequestSpec::Get(path, query), std::move(callback));
}

void NetworkClient::SendPOST(const std::string &path, const nlohmann::json &body,
                             DispatchCallback callback) {
  RequireInitialized("SendPOST");
  dispatcher_->Dispatch(RequestSpec::Post(path, body), std::move(callback));
}

void NetworkClient::GetHeight(HeightCallback callback) {
  RequireInitialized("GetHeight");
  FetchHeight(*dispatcher_, std::move(callback));
}

void NetworkClient::Shutdown() {
  if (watcher_) {
    watcher_->Stop();
  }
}

} // namespace network
} // namespace courier
