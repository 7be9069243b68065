// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/peer_selector.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <stdexcept>
#include <vector>

namespace courier {
namespace network {

const char *SelectionErrorName(SelectionError error) {
  switch (error) {
  case SelectionError::None:
    return "none";
  case SelectionError::NoCandidates:
    return "no candidate peers";
  case SelectionError::NoReachablePeer:
    return "no reachable peer";
  }
  return "unknown";
}

// State of one SelectPeer() call
struct PeerSelector::Round {
  std::vector<Peer> remaining;  // Candidates not rejected yet
  int probes{0};
  SelectionCallback callback;
  boost::asio::steady_timer backoff_timer;

  Round(boost::asio::io_context &io, SelectionCallback cb)
      : callback(std::move(cb)), backoff_timer(io) {}

  void Finish(SelectionResult result) {
    result.probes = probes;
    auto cb = std::move(callback);
    cb(std::move(result));
  }
};

PeerSelector::PeerSelector(boost::asio::io_context &io_context,
                           std::shared_ptr<PeerDiscovery> discovery,
                           std::shared_ptr<ReachabilityProbe> probe,
                           Config config)
    : io_context_(io_context), discovery_(std::move(discovery)),
      probe_(std::move(probe)), config_(std::move(config)),
      rng_(std::random_device{}()) {
  if (!config_.explicit_peer && (!discovery_ || !probe_)) {
    throw std::invalid_argument("PeerSelector needs discovery and probe without an explicit peer");
  }
  if (config_.max_attempts < 1) {
    throw std::invalid_argument("PeerSelector max_attempts must be >= 1");
  }
}

void PeerSelector::SelectPeer(SelectionCallback callback) {
  if (config_.explicit_peer) {
    boost::asio::post(io_context_, [peer = *config_.explicit_peer,
                                    callback = std::move(callback)]() {
      callback(SelectionResult{peer, SelectionError::None, 0});
    });
    return;
  }

  auto round = std::make_shared<Round>(io_context_, std::move(callback));
  discovery_->FindPeersWithPlugin(config_.plugin, [this, round](std::vector<Peer> peers) {
    if (peers.empty()) {
      LOG_NET_WARN("Discovery returned no peers serving '{}'", config_.plugin);
      round->Finish(SelectionResult{std::nullopt, SelectionError::NoCandidates, 0});
      return;
    }

    // Duplicates would skew sampling and defeat the exclusion set
    std::sort(peers.begin(), peers.end());
    peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
    round->remaining = std::move(peers);
    ProbeNext(round);
  });
}

void PeerSelector::ProbeNext(std::shared_ptr<Round> round) {
  if (round->remaining.empty() || round->probes >= config_.max_attempts) {
    LOG_NET_WARN("No reachable peer after {} probes", round->probes);
    round->Finish(SelectionResult{std::nullopt, SelectionError::NoReachablePeer, 0});
    return;
  }

  std::uniform_int_distribution<size_t> dist(0, round->remaining.size() - 1);
  const size_t index = dist(rng_);
  Peer candidate = round->remaining[index];
  round->remaining.erase(round->remaining.begin() + static_cast<std::ptrdiff_t>(index));
  ++round->probes;

  probe_->async_probe(candidate.host, candidate.port,
                      [this, round, candidate](bool reachable) {
                        OnProbeResult(round, candidate, reachable);
                      });
}

void PeerSelector::OnProbeResult(std::shared_ptr<Round> round, Peer peer, bool reachable) {
  if (reachable) {
    LOG_NET_DEBUG("Selected peer {} after {} probe(s)", peer.ToString(), round->probes);
    round->Finish(SelectionResult{std::move(peer), SelectionError::None, 0});
    return;
  }

  LOG_NET_WARN("{} is unresponsive. Choosing new peer.", peer.ToString());

  if (round->remaining.empty() || round->probes >= config_.max_attempts) {
    ProbeNext(round);
    return;
  }

  auto delay = JitteredBackoff(round->probes);
  round->backoff_timer.expires_after(delay);
  round->backoff_timer.async_wait([this, round](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    ProbeNext(round);
  });
}

std::chrono::milliseconds PeerSelector::BackoffFor(int rejections) const {
  if (rejections < 1 || config_.base_backoff.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  // Clamp the exponent; the cap is reached long before overflow matters
  const int shift = std::min(rejections - 1, 20);
  const std::chrono::milliseconds raw = config_.base_backoff * (int64_t{1} << shift);
  return std::min(raw, config_.max_backoff);
}

std::chrono::milliseconds PeerSelector::JitteredBackoff(int rejections) {
  const auto nominal = BackoffFor(rejections);
  if (nominal.count() == 0) {
    return nominal;
  }
  std::uniform_real_distribution<double> jitter(0.5, 1.5);
  const auto jittered = std::chrono::milliseconds(
      static_cast<int64_t>(static_cast<double>(nominal.count()) * jitter(rng_)));
  return std::min(jittered, config_.max_backoff);
}

} // namespace network
} // namespace courier
