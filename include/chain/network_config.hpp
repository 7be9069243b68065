// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "chain/network_params.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace courier {
namespace chain {

// Consistent view of the network configuration at one point in time
struct ConfigSnapshot {
  uint64_t version{0};  // Bumped on every accepted mutation
  std::string network;
  int64_t height{0};
  Milestone milestone;
};

/**
 * NetworkConfigManager - single owner of the mutable network configuration
 *
 * Holds the selected network preset and the last observed chain height.
 * Mutations are serialized by a mutex and stamped with a version, so readers
 * on any thread receive a self-consistent ConfigSnapshot instead of racing on
 * loose globals.
 *
 * Height is monotonic: SetHeight() with a lower value than the current one is
 * ignored.
 */
class NetworkConfigManager {
public:
  NetworkConfigManager() = default;

  NetworkConfigManager(const NetworkConfigManager&) = delete;
  NetworkConfigManager& operator=(const NetworkConfigManager&) = delete;

  /**
   * Select a built-in preset (mainnet, devnet, testnet, unitnet)
   * @throws std::invalid_argument for unknown names
   */
  void SetFromPreset(const std::string &network);

  // Install explicit params (custom networks, tests)
  void SetParams(std::unique_ptr<NetworkParams> params);

  /**
   * Record a newly observed chain height
   * @return true if accepted, false if lower than the current height
   */
  bool SetHeight(int64_t height);

  int64_t GetHeight() const;

  // Milestone at an arbitrary height / at the current height
  Milestone GetMilestone(int64_t height) const;
  Milestone GetMilestone() const;

  ConfigSnapshot Snapshot() const;
  uint64_t Version() const;

  bool IsConfigured() const;

  /**
   * Selected params
   *
   * The returned params stay valid after a later SetParams()/SetFromPreset().
   * @throws std::logic_error if no preset has been selected
   */
  std::shared_ptr<const NetworkParams> Params() const;

private:
  const NetworkParams &ParamsLocked() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const NetworkParams> params_;
  int64_t height_{1};
  uint64_t version_{0};
};

} // namespace chain
} // namespace courier
