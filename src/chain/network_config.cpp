// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "chain/network_config.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace courier {
namespace chain {

void NetworkConfigManager::SetFromPreset(const std::string &network) {
  SetParams(NetworkParams::FromName(network));
}

void NetworkConfigManager::SetParams(std::unique_ptr<NetworkParams> params) {
  if (!params) {
    throw std::invalid_argument("null network params");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  LOG_CONFIG_INFO("Using network preset '{}' ({} milestones, {} seeds)",
                  params->Name(), params->Milestones().size(),
                  params->FixedSeeds().size());
  params_ = std::move(params);
  height_ = 1;
  ++version_;
}

bool NetworkConfigManager::SetHeight(int64_t height) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (height < height_) {
    LOG_CONFIG_DEBUG("Ignoring height {} (current {})", height, height_);
    return false;
  }
  if (height != height_) {
    height_ = height;
    ++version_;
  }
  return true;
}

int64_t NetworkConfigManager::GetHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return height_;
}

Milestone NetworkConfigManager::GetMilestone(int64_t height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ParamsLocked().GetMilestone(height);
}

Milestone NetworkConfigManager::GetMilestone() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ParamsLocked().GetMilestone(height_);
}

ConfigSnapshot NetworkConfigManager::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &params = ParamsLocked();
  return ConfigSnapshot{version_, params.Name(), height_, params.GetMilestone(height_)};
}

uint64_t NetworkConfigManager::Version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

bool NetworkConfigManager::IsConfigured() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return params_ != nullptr;
}

std::shared_ptr<const NetworkParams> NetworkConfigManager::Params() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!params_) {
    throw std::logic_error("network configuration not selected");
  }
  return params_;
}

const NetworkParams &NetworkConfigManager::ParamsLocked() const {
  if (!params_) {
    throw std::logic_error("network configuration not selected");
  }
  return *params_;
}

} // namespace chain
} // namespace courier
