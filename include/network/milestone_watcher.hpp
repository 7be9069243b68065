// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "chain/network_config.hpp"
#include "network/request_dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>

namespace courier {
namespace network {

using HeightCallback = std::function<void(std::optional<int64_t> height)>;

// Height from a GET blockchain response ({"data":{"block":{"height":N}}})
std::optional<int64_t> ParseHeight(const nlohmann::json &response);

// GET blockchain through the dispatcher and extract the height
void FetchHeight(RequestDispatcher &dispatcher, HeightCallback callback);

/**
 * MilestoneWatcher - polls chain height until the target feature activates
 *
 * Each tick queries the height through the dispatcher, stores it in the
 * NetworkConfigManager and resolves the milestone for it. If the milestone
 * has aip11 active the watcher stops for good; otherwise the next tick is
 * scheduled one block interval (milestone.blocktime seconds) later. A failed
 * height query keeps the watcher alive and retries after the blocktime of
 * the currently known milestone.
 *
 * Stop() cancels the pending timer and makes any in-flight query complete
 * into nothing. The owner must keep the watcher alive until its io_context
 * has drained.
 */
class MilestoneWatcher {
public:
  struct Config {
    // Wall-clock length of one "blocktime second"; tests shrink it
    std::chrono::milliseconds interval_unit;

    // Invoked once with the height at which the target feature was seen active
    std::function<void(int64_t height)> on_feature_active;

    Config() : interval_unit(std::chrono::seconds(1)) {}
  };

  MilestoneWatcher(boost::asio::io_context &io_context,
                   RequestDispatcher &dispatcher,
                   chain::NetworkConfigManager &config_manager,
                   Config config = Config{});
  ~MilestoneWatcher();

  MilestoneWatcher(const MilestoneWatcher&) = delete;
  MilestoneWatcher& operator=(const MilestoneWatcher&) = delete;

  // Begin polling (first tick is posted immediately). No-op if running.
  void Start();

  // Cancel polling. Safe to call repeatedly.
  void Stop();

  bool IsRunning() const { return running_; }

  // Target feature observed active (watcher stopped itself)
  bool IsFeatureActive() const { return feature_active_; }

  // Completed ticks
  int Ticks() const { return ticks_; }

  // Blocktime (seconds) used for the most recent reschedule
  std::optional<std::chrono::seconds> LastInterval() const { return last_interval_; }

private:
  void Tick(uint64_t generation);
  void OnHeight(uint64_t generation, std::optional<int64_t> height);
  void Schedule(uint64_t generation, int blocktime_seconds);

  boost::asio::io_context &io_context_;
  RequestDispatcher &dispatcher_;
  chain::NetworkConfigManager &config_manager_;
  Config config_;
  boost::asio::steady_timer timer_;

  bool running_{false};
  bool feature_active_{false};
  uint64_t generation_{0}; // Bumped by Stop() so stale completions are dropped
  int ticks_{0};
  std::optional<std::chrono::seconds> last_interval_;
};

} // namespace network
} // namespace courier
