// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/peer_discovery_client.hpp"
#include "chain/network_params.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

namespace courier {
namespace network {

using json = nlohmann::json;

namespace {

HttpRequest MakePeerListRequest(const std::string &host, uint16_t port,
                                const std::string &target) {
  HttpRequest req;
  req.method = HttpMethod::Get;
  req.host = host;
  req.port = port;
  req.target = target;
  req.headers = {{"Accept", protocol::headers::ACCEPT},
                 {"Content-Type", protocol::headers::CONTENT_TYPE}};
  return req;
}

std::string PeerListTarget() {
  return std::string(protocol::API_ROOT) + protocol::paths::PEERS;
}

void FailCreate(boost::asio::io_context &io_context,
                PeerDiscoveryClient::CreateCallback callback,
                const std::string &message) {
  LOG_NET_ERROR("Peer discovery setup failed: {}", message);
  boost::asio::post(io_context, [callback = std::move(callback), message]() {
    callback(nullptr, std::make_exception_ptr(DiscoveryError(message)));
  });
}

// Integer value of a JSON number without silent narrowing
std::optional<int64_t> IntegerField(const json &value) {
  if (value.is_number_unsigned()) {
    const uint64_t v = value.get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<int64_t>(v);
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  return std::nullopt;
}

} // namespace

std::vector<PeerInfo> ParsePeerList(const std::string &body) {
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error &e) {
    throw DiscoveryError(std::string("malformed peer list: ") + e.what());
  }

  if (!root.is_object() || !root.contains("data") || !root["data"].is_array()) {
    throw DiscoveryError("peer list has no data array");
  }

  std::vector<PeerInfo> peers;
  for (const auto &entry : root["data"]) {
    if (!entry.is_object() || !entry.contains("ip") || !entry["ip"].is_string()) {
      continue;
    }

    PeerInfo info;
    info.ip = entry["ip"].get<std::string>();
    if (info.ip.empty()) {
      continue;
    }

    if (entry.contains("port") && entry["port"].is_number_integer()) {
      auto port = IntegerField(entry["port"]);
      if (!port || *port < 0 || *port > 65535) {
        LOG_NET_DEBUG("Skipping peer {}: bad port {}", info.ip, entry["port"].dump());
        continue;
      }
      info.port = static_cast<uint16_t>(*port);
    }

    bool malformed = false;
    if (entry.contains("ports") && entry["ports"].is_object()) {
      for (const auto &[name, value] : entry["ports"].items()) {
        if (!value.is_number_integer()) continue;
        // -1 marks a disabled plugin
        auto port = IntegerField(value);
        if (!port || *port < -1 || *port > 65535) {
          malformed = true;
          break;
        }
        info.ports[name] = static_cast<int>(*port);
      }
    }
    if (malformed) {
      LOG_NET_DEBUG("Skipping peer {}: plugin port out of range", info.ip);
      continue;
    }

    // Latency outside [0, INT_MAX] is treated as unmeasured
    if (entry.contains("latency") && entry["latency"].is_number()) {
      const double latency = entry["latency"].get<double>();
      if (std::isfinite(latency) && latency >= 0.0 &&
          latency <= static_cast<double>(std::numeric_limits<int>::max())) {
        info.latency = static_cast<int>(latency);
      }
    }
    if (entry.contains("version") && entry["version"].is_string()) {
      info.version = entry["version"].get<std::string>();
    }
    if (entry.contains("height")) {
      info.height = IntegerField(entry["height"]);
    }

    peers.push_back(std::move(info));
  }
  return peers;
}

std::optional<uint16_t> PluginPort(const PeerInfo &info, const std::string &plugin) {
  const std::string suffix = "/" + plugin;
  for (const auto &[name, port] : info.ports) {
    bool matches = name == plugin ||
                   (name.size() > suffix.size() &&
                    name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0);
    if (matches && port >= 1 && port <= 65535) {
      return static_cast<uint16_t>(port);
    }
  }
  return std::nullopt;
}

// ============================================================================
// PeerDiscoveryClient
// ============================================================================

void PeerDiscoveryClient::Create(boost::asio::io_context &io_context,
                                 std::shared_ptr<HttpClient> http,
                                 const std::string &network_or_host,
                                 CreateCallback callback) {
  if (!http) {
    throw std::invalid_argument("PeerDiscoveryClient requires an HttpClient");
  }

  if (!util::IsHttpUrl(network_or_host)) {
    // Named network: bootstrap from the preset's fixed seeds
    std::unique_ptr<chain::NetworkParams> params;
    try {
      params = chain::NetworkParams::FromName(network_or_host);
    } catch (const std::invalid_argument &e) {
      FailCreate(io_context, std::move(callback), e.what());
      return;
    }

    std::vector<Peer> seeds;
    for (const auto &seed : params->FixedSeeds()) {
      auto host_port = util::SplitHostPort(seed);
      if (!host_port) {
        LOG_NET_WARN("Ignoring malformed fixed seed '{}'", seed);
        continue;
      }
      seeds.push_back(Peer{host_port->first, host_port->second});
    }
    if (seeds.empty()) {
      FailCreate(io_context, std::move(callback),
                 "network '" + network_or_host + "' has no usable seeds");
      return;
    }

    LOG_NET_DEBUG("Discovery for '{}' using {} fixed seeds", network_or_host, seeds.size());
    auto client = std::make_shared<PeerDiscoveryClient>(io_context, std::move(http),
                                                        std::move(seeds));
    boost::asio::post(io_context, [callback = std::move(callback), client]() {
      callback(client, nullptr);
    });
    return;
  }

  // Explicit host: its peer list seeds discovery
  auto url = util::ParseHttpUrl(network_or_host);
  if (!url) {
    FailCreate(io_context, std::move(callback), "invalid seed URL: " + network_or_host);
    return;
  }

  LOG_NET_DEBUG("Fetching seed peer list from {}", network_or_host);
  auto request = MakePeerListRequest(url->host, url->port, url->target);
  http->async_request(
      request, protocol::REQUEST_TIMEOUT,
      [&io_context, http, url = *url, source = network_or_host,
       callback = std::move(callback)](HttpResult result) mutable {
        if (!result.ok()) {
          FailCreate(io_context, std::move(callback),
                     "cannot reach " + source + ": " + result.error->message);
          return;
        }
        if (!result.response->IsSuccess()) {
          FailCreate(io_context, std::move(callback),
                     source + " answered HTTP " + std::to_string(result.response->status));
          return;
        }

        std::vector<PeerInfo> listed;
        try {
          listed = ParsePeerList(result.response->body);
        } catch (const DiscoveryError &e) {
          FailCreate(io_context, std::move(callback), source + ": " + e.what());
          return;
        }

        // The queried host always stays a seed; listed peers serving the API join it
        std::vector<Peer> seeds{Peer{url.host, url.port}};
        for (const auto &info : listed) {
          auto port = PluginPort(info, protocol::CORE_API_PLUGIN);
          if (!port) continue;
          Peer seed{info.ip, *port};
          if (std::find(seeds.begin(), seeds.end(), seed) == seeds.end()) {
            seeds.push_back(std::move(seed));
          }
        }

        LOG_NET_DEBUG("Seeded discovery with {} peers from {}", seeds.size(), source);
        callback(std::make_shared<PeerDiscoveryClient>(io_context, std::move(http),
                                                       std::move(seeds)),
                 nullptr);
      });
}

PeerDiscoveryClient::PeerDiscoveryClient(boost::asio::io_context &io_context,
                                         std::shared_ptr<HttpClient> http,
                                         std::vector<Peer> seeds)
    : io_context_(io_context), http_(std::move(http)), seeds_(std::move(seeds)),
      rng_(std::random_device{}()) {}

PeerDiscoveryClient &PeerDiscoveryClient::WithLatency(int max_latency_ms) {
  max_latency_ms_ = max_latency_ms;
  return *this;
}

PeerDiscoveryClient &PeerDiscoveryClient::WithLimit(size_t limit) {
  limit_ = limit;
  return *this;
}

std::vector<PeerInfo> PeerDiscoveryClient::Filter(std::vector<PeerInfo> peers) const {
  if (max_latency_ms_) {
    const int max_latency = *max_latency_ms_;
    peers.erase(std::remove_if(peers.begin(), peers.end(),
                               [max_latency](const PeerInfo &p) {
                                 return !p.latency || *p.latency > max_latency;
                               }),
                peers.end());
  }

  // Lowest latency first; peers without a measurement go last
  std::stable_sort(peers.begin(), peers.end(), [](const PeerInfo &a, const PeerInfo &b) {
    if (a.latency && b.latency) return *a.latency < *b.latency;
    return a.latency.has_value() && !b.latency.has_value();
  });

  if (limit_ > 0 && peers.size() > limit_) {
    peers.resize(limit_);
  }
  return peers;
}

void PeerDiscoveryClient::FindPeers(std::function<void(std::vector<PeerInfo>)> callback) {
  if (seeds_.empty()) {
    boost::asio::post(io_context_, [callback = std::move(callback)]() { callback({}); });
    return;
  }

  std::uniform_int_distribution<size_t> dist(0, seeds_.size() - 1);
  const Peer seed = seeds_[dist(rng_)];

  auto request = MakePeerListRequest(seed.host, seed.port, PeerListTarget());
  http_->async_request(
      request, protocol::REQUEST_TIMEOUT,
      [self = shared_from_this(), seed, callback = std::move(callback)](HttpResult result) {
        if (!result.ok()) {
          LOG_NET_WARN("Peer list from seed {} unavailable: {}", seed.ToString(),
                       result.error->message);
          callback({});
          return;
        }
        if (!result.response->IsSuccess()) {
          LOG_NET_WARN("Peer list from seed {} failed with HTTP {}", seed.ToString(),
                       result.response->status);
          callback({});
          return;
        }

        std::vector<PeerInfo> peers;
        try {
          peers = ParsePeerList(result.response->body);
        } catch (const DiscoveryError &e) {
          LOG_NET_WARN("Peer list from seed {} rejected: {}", seed.ToString(), e.what());
          callback({});
          return;
        }

        auto filtered = self->Filter(std::move(peers));
        LOG_NET_DEBUG("Seed {} reported {} peers within limits", seed.ToString(),
                      filtered.size());
        callback(std::move(filtered));
      });
}

void PeerDiscoveryClient::FindPeersWithPlugin(const std::string &plugin,
                                              PeersCallback callback) {
  FindPeers([plugin, callback = std::move(callback)](std::vector<PeerInfo> peers) {
    std::vector<Peer> result;
    for (const auto &info : peers) {
      if (auto port = PluginPort(info, plugin)) {
        result.push_back(Peer{info.ip, *port});
      }
    }
    callback(std::move(result));
  });
}

} // namespace network
} // namespace courier
