// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/milestone_watcher.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace courier {
namespace network {

std::optional<int64_t> ParseHeight(const nlohmann::json &response) {
  if (!response.is_object() || !response.contains("data")) return std::nullopt;
  const auto &data = response["data"];
  if (!data.is_object() || !data.contains("block")) return std::nullopt;
  const auto &block = data["block"];
  if (!block.is_object() || !block.contains("height")) return std::nullopt;
  const auto &height = block["height"];
  if (!height.is_number_integer()) return std::nullopt;
  return height.get<int64_t>();
}

void FetchHeight(RequestDispatcher &dispatcher, HeightCallback callback) {
  dispatcher.Dispatch(RequestSpec::Get(protocol::paths::BLOCKCHAIN),
                      [callback = std::move(callback)](DispatchResult result) {
                        if (!result.ok()) {
                          callback(std::nullopt);
                          return;
                        }
                        auto height = ParseHeight(*result.data);
                        if (!height) {
                          LOG_NET_WARN("blockchain response from {} carries no height",
                                       result.peer ? result.peer->ToString() : "peer");
                        }
                        callback(height);
                      });
}

MilestoneWatcher::MilestoneWatcher(boost::asio::io_context &io_context,
                                   RequestDispatcher &dispatcher,
                                   chain::NetworkConfigManager &config_manager,
                                   Config config)
    : io_context_(io_context), dispatcher_(dispatcher),
      config_manager_(config_manager), config_(config), timer_(io_context) {}

MilestoneWatcher::~MilestoneWatcher() {
  // Do not log here; the logger may already be shut down
  ++generation_;
  timer_.cancel();
}

void MilestoneWatcher::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  feature_active_ = false;
  const uint64_t generation = ++generation_;
  LOG_NET_DEBUG("Milestone watcher started");
  boost::asio::post(io_context_, [this, generation]() { Tick(generation); });
}

void MilestoneWatcher::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  ++generation_;
  timer_.cancel();
  LOG_NET_DEBUG("Milestone watcher stopped");
}

void MilestoneWatcher::Tick(uint64_t generation) {
  if (!running_ || generation != generation_) {
    return;
  }
  FetchHeight(dispatcher_, [this, generation](std::optional<int64_t> height) {
    OnHeight(generation, height);
  });
}

void MilestoneWatcher::OnHeight(uint64_t generation, std::optional<int64_t> height) {
  if (!running_ || generation != generation_) {
    return;
  }
  ++ticks_;

  if (!height) {
    // Keep polling at the pace of what we already know
    const auto milestone = config_manager_.GetMilestone();
    LOG_NET_WARN("Height query failed; retrying in {}s", milestone.blocktime);
    Schedule(generation, milestone.blocktime);
    return;
  }

  config_manager_.SetHeight(*height);
  const auto milestone = config_manager_.GetMilestone(*height);

  if (milestone.aip11) {
    LOG_NET_INFO("AIP11 active at height {}; milestone watcher finished", *height);
    feature_active_ = true;
    running_ = false;
    if (config_.on_feature_active) {
      config_.on_feature_active(*height);
    }
    return;
  }

  LOG_NET_DEBUG("Height {}: AIP11 not active, next check in {}s", *height,
                milestone.blocktime);
  Schedule(generation, milestone.blocktime);
}

void MilestoneWatcher::Schedule(uint64_t generation, int blocktime_seconds) {
  last_interval_ = std::chrono::seconds(blocktime_seconds);
  timer_.expires_after(config_.interval_unit * blocktime_seconds);
  timer_.async_wait([this, generation](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    Tick(generation);
  });
}

} // namespace network
} // namespace courier
