// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_status.hpp"
#include "pipeline/virtual_state.hpp"
#include "util/uint.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace blockdag {
namespace consensus {

/**
 * Notification system for consensus events
 *
 * Design:
 * - Simple observer pattern with std::function
 * - Thread-safe using std::mutex
 * - No background queue (callbacks run synchronously on the notifying
 *   pipeline thread, so they must be short and must not call back into
 *   submission)
 * - RAII-based subscription management
 * - One instance per Consensus (no global singleton)
 *
 * Events:
 * - BlockAdded: body accepted (status UTXOPendingVerification)
 * - VirtualChainChanged: selected chain blocks added/removed by a virtual
 *   update
 * - PruningPointAdvanced: pruning point moved forward
 */
class ConsensusNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Unsubscribe explicitly
    void Unsubscribe();

  private:
    friend class ConsensusNotifications;
    Subscription(ConsensusNotifications *owner, size_t id);

    ConsensusNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  // Callback types
  using BlockAddedCallback = std::function<void(const uint256 &hash, chain::BlockStatus status)>;
  using VirtualChainChangedCallback = std::function<void(
      const std::vector<uint256> &added, const std::vector<uint256> &removed)>;
  using PruningPointCallback = std::function<void(const pipeline::PruningPointInfo &info)>;

  ConsensusNotifications() = default;
  ConsensusNotifications(const ConsensusNotifications &) = delete;
  ConsensusNotifications &operator=(const ConsensusNotifications &) = delete;

  [[nodiscard]] Subscription SubscribeBlockAdded(BlockAddedCallback callback);
  [[nodiscard]] Subscription SubscribeVirtualChainChanged(VirtualChainChangedCallback callback);
  [[nodiscard]] Subscription SubscribePruningPointAdvanced(PruningPointCallback callback);

  /**
   * Called by the body stage after the status became
   * UTXOPendingVerification and dependents were released
   */
  void NotifyBlockAdded(const uint256 &hash, chain::BlockStatus status);

  /**
   * Called by the virtual processor after the new state is published.
   * `removed` is newest first, `added` oldest first.
   */
  void NotifyVirtualChainChanged(const std::vector<uint256> &added,
                                 const std::vector<uint256> &removed);

  /**
   * Called by the pruning processor once deletion is complete
   */
  void NotifyPruningPointAdvanced(const pipeline::PruningPointInfo &info);

private:
  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    BlockAddedCallback block_added;
    VirtualChainChangedCallback chain_changed;
    PruningPointCallback pruning_point;
  };

  std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace consensus
} // namespace blockdag
