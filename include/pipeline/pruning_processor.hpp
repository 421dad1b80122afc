// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/dag_traversal.hpp"
#include "pipeline/virtual_state.hpp"
#include "util/threadpool.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace blockdag {

namespace chain {
class BlockManager;
class ChainParams;
} // namespace chain

namespace pipeline {

class VirtualProcessor;

/**
 * PruningProcessor - advances the pruning point and deletes history
 *
 * Runs on its own one-thread pool after each virtual update. The deletion
 * set (everything outside the new pruning point's future) is computed with
 * the prune lock held shared, then applied with it held exclusively, which
 * waits for in-flight stage tasks and read sessions.
 *
 * The pruning point moves only along the selected chain and only forward.
 */
class PruningProcessor {
public:
  using AdvancedCallback = std::function<void(const PruningPointInfo &)>;

  PruningProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                   const chain::DagTraversal &traversal, VirtualProcessor &virtual_processor,
                   std::shared_mutex &pruning_lock, const std::atomic<bool> &stopping,
                   bool enabled);
  ~PruningProcessor();

  PruningProcessor(const PruningProcessor &) = delete;
  PruningProcessor &operator=(const PruningProcessor &) = delete;

  void SetAdvancedCallback(AdvancedCallback callback);

  // Queue a pruning pass for the new sink
  void OnVirtualChanged(const uint256 &sink);

  // One synchronous pass (no prune lock may be held by the caller).
  // Returns true if the pruning point advanced.
  bool AdvancePruningPoint(const uint256 &sink);

  // Chain block the pruning point would move to for this sink, if any
  // (prune lock held shared by the caller)
  std::optional<PruningPointInfo> FindCandidate(const uint256 &sink) const;

  PruningPointInfo GetPruningPoint() const;
  bool IsEnabled() const { return enabled_; }

  void WaitIdle();
  void Shutdown();

private:
  const chain::ChainParams &params_;
  chain::BlockManager &blocks_;
  const chain::DagTraversal &traversal_;
  VirtualProcessor &virtual_;
  std::shared_mutex &pruning_lock_;
  const std::atomic<bool> &stopping_;
  const bool enabled_;

  mutable std::mutex point_mutex_;
  PruningPointInfo pruning_point_;

  std::mutex callback_mutex_;
  AdvancedCallback advanced_;

  util::ThreadPool pool_;
};

} // namespace pipeline
} // namespace blockdag
