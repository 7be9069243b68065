// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace courier {
namespace chain {

/**
 * Milestone - protocol parameters in effect from a given height onwards
 *
 * Stored fully merged: every field carries the value inherited from earlier
 * milestones unless the milestone overrides it.
 */
struct Milestone {
  int64_t height{1};         // First height this milestone applies to
  int blocktime{8};          // Target seconds between blocks
  int active_delegates{51};  // Forging slots per round
  bool aip11{false};         // Target protocol feature (v2 transactions)

  bool operator==(const Milestone &) const = default;
};

// Partial milestone as declared by a preset; unset fields are inherited
struct MilestoneOverride {
  int64_t height;
  std::optional<int> blocktime;
  std::optional<int> active_delegates;
  std::optional<bool> aip11;
};

/**
 * NetworkParams - static description of one blockchain network
 *
 * Holds the API port, the fixed seed peers used to bootstrap discovery and
 * the ordered milestone schedule.
 */
class NetworkParams {
public:
  NetworkParams() = default;
  virtual ~NetworkParams() = default;

  const std::string &Name() const { return name_; }
  uint16_t GetDefaultApiPort() const { return default_api_port_; }
  const std::vector<std::string> &FixedSeeds() const { return fixed_seeds_; }
  const std::vector<Milestone> &Milestones() const { return milestones_; }

  /**
   * Milestone in effect at height
   *
   * Returns the milestone with the greatest activation height <= height.
   * Heights below the first activation resolve to the first milestone.
   */
  const Milestone &GetMilestone(int64_t height) const;

  // Factory methods
  static std::unique_ptr<NetworkParams> CreateMainNet();
  static std::unique_ptr<NetworkParams> CreateDevNet();
  static std::unique_ptr<NetworkParams> CreateTestNet();
  static std::unique_ptr<NetworkParams> CreateUnitNet();

  /**
   * Create params by preset name (mainnet, devnet, testnet, unitnet)
   * @throws std::invalid_argument for unknown names
   */
  static std::unique_ptr<NetworkParams> FromName(const std::string &name);

  // Build params from explicit values (used by tests and custom networks)
  static std::unique_ptr<NetworkParams>
  Custom(const std::string &name, uint16_t api_port,
         std::vector<std::string> fixed_seeds,
         const std::vector<MilestoneOverride> &milestones);

protected:
  // Merge an override on top of the previous milestone and append it
  void AddMilestone(const MilestoneOverride &m);

  std::string name_;
  uint16_t default_api_port_{4003};
  std::vector<std::string> fixed_seeds_;  // host:port of peers serving /api/peers
  std::vector<Milestone> milestones_;     // sorted by height
};

class CMainNetParams : public NetworkParams {
public:
  CMainNetParams();
};

class CDevNetParams : public NetworkParams {
public:
  CDevNetParams();
};

class CTestNetParams : public NetworkParams {
public:
  CTestNetParams();
};

class CUnitNetParams : public NetworkParams {
public:
  CUnitNetParams();
};

} // namespace chain
} // namespace courier
