// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "chain/network_params.hpp"
#include <algorithm>
#include <stdexcept>

namespace courier {
namespace chain {

const Milestone &NetworkParams::GetMilestone(int64_t height) const {
  if (milestones_.empty()) {
    throw std::logic_error("network '" + name_ + "' has no milestones");
  }

  // First milestone whose activation height is above `height`; the one
  // before it is in effect.
  auto it = std::upper_bound(
      milestones_.begin(), milestones_.end(), height,
      [](int64_t h, const Milestone &m) { return h < m.height; });
  if (it == milestones_.begin()) {
    return milestones_.front();
  }
  return *std::prev(it);
}

void NetworkParams::AddMilestone(const MilestoneOverride &m) {
  if (!milestones_.empty() && m.height <= milestones_.back().height) {
    throw std::invalid_argument("milestones must be declared in increasing height order");
  }

  Milestone merged = milestones_.empty() ? Milestone{} : milestones_.back();
  merged.height = m.height;
  if (m.blocktime) merged.blocktime = *m.blocktime;
  if (m.active_delegates) merged.active_delegates = *m.active_delegates;
  if (m.aip11) merged.aip11 = *m.aip11;

  if (merged.blocktime <= 0) {
    throw std::invalid_argument("milestone blocktime must be positive");
  }
  milestones_.push_back(merged);
}

std::unique_ptr<NetworkParams> NetworkParams::CreateMainNet() {
  return std::make_unique<CMainNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateDevNet() {
  return std::make_unique<CDevNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateUnitNet() {
  return std::make_unique<CUnitNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::FromName(const std::string &name) {
  if (name == "mainnet") return CreateMainNet();
  if (name == "devnet") return CreateDevNet();
  if (name == "testnet") return CreateTestNet();
  if (name == "unitnet") return CreateUnitNet();
  throw std::invalid_argument("unknown network: " + name);
}

std::unique_ptr<NetworkParams>
NetworkParams::Custom(const std::string &name, uint16_t api_port,
                      std::vector<std::string> fixed_seeds,
                      const std::vector<MilestoneOverride> &milestones) {
  auto params = std::make_unique<NetworkParams>();
  params->name_ = name;
  params->default_api_port_ = api_port;
  params->fixed_seeds_ = std::move(fixed_seeds);
  for (const auto &m : milestones) {
    params->AddMilestone(m);
  }
  return params;
}

// ============================================================================
// MainNet
// ============================================================================

CMainNetParams::CMainNetParams() {
  name_ = "mainnet";
  default_api_port_ = 4003;

  fixed_seeds_ = {
      "5.196.105.32:4003",
      "5.196.105.33:4003",
      "5.196.105.34:4003",
      "5.196.105.35:4003",
      "51.91.166.112:4003",
  };

  AddMilestone({1, 8, 51, false});
  AddMilestone({75600, std::nullopt, std::nullopt, std::nullopt});
  AddMilestone({6600000, std::nullopt, std::nullopt, std::nullopt});
  AddMilestone({11273000, std::nullopt, std::nullopt, true});
}

// ============================================================================
// DevNet
// ============================================================================

CDevNetParams::CDevNetParams() {
  name_ = "devnet";
  default_api_port_ = 4003;

  fixed_seeds_ = {
      "167.114.29.51:4003",
      "167.114.29.52:4003",
      "167.114.29.53:4003",
      "167.114.29.54:4003",
      "167.114.29.55:4003",
  };

  AddMilestone({1, 8, 51, false});
  AddMilestone({2922000, std::nullopt, std::nullopt, true});
}

// ============================================================================
// TestNet (local multi-node network)
// ============================================================================

CTestNetParams::CTestNetParams() {
  name_ = "testnet";
  default_api_port_ = 4003;

  fixed_seeds_ = {"127.0.0.1:4003"};

  AddMilestone({1, 8, 51, false});
  AddMilestone({2, std::nullopt, std::nullopt, true});
}

// ============================================================================
// UnitNet (single node, every feature active from genesis)
// ============================================================================

CUnitNetParams::CUnitNetParams() {
  name_ = "unitnet";
  default_api_port_ = 4003;

  fixed_seeds_ = {"127.0.0.1:4003"};

  AddMilestone({1, 8, 51, true});
}

} // namespace chain
} // namespace courier
