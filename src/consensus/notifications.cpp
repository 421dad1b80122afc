// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "consensus/notifications.hpp"
#include <algorithm>

namespace blockdag {
namespace consensus {

// ============================================================================
// ConsensusNotifications::Subscription
// ============================================================================

ConsensusNotifications::Subscription::Subscription(ConsensusNotifications *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

ConsensusNotifications::Subscription::~Subscription() { Unsubscribe(); }

ConsensusNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ConsensusNotifications::Subscription &
ConsensusNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ConsensusNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ConsensusNotifications
// ============================================================================

ConsensusNotifications::Subscription
ConsensusNotifications::SubscribeBlockAdded(BlockAddedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.block_added = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

ConsensusNotifications::Subscription
ConsensusNotifications::SubscribeVirtualChainChanged(VirtualChainChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.chain_changed = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

ConsensusNotifications::Subscription
ConsensusNotifications::SubscribePruningPointAdvanced(PruningPointCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.pruning_point = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

void ConsensusNotifications::NotifyBlockAdded(const uint256 &hash, chain::BlockStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.block_added) {
      entry.block_added(hash, status);
    }
  }
}

void ConsensusNotifications::NotifyVirtualChainChanged(const std::vector<uint256> &added,
                                                       const std::vector<uint256> &removed) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.chain_changed) {
      entry.chain_changed(added, removed);
    }
  }
}

void ConsensusNotifications::NotifyPruningPointAdvanced(const pipeline::PruningPointInfo &info) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.pruning_point) {
      entry.pruning_point(info);
    }
  }
}

void ConsensusNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                         [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace consensus
} // namespace blockdag
