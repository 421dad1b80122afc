// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/dag_traversal.hpp"
#include "chain/utxo.hpp"
#include "pipeline/block_task.hpp"
#include "pipeline/virtual_state.hpp"
#include "util/threadpool.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace blockdag {

namespace chain {
class BlockManager;
class ChainParams;
class GhostdagManager;
} // namespace chain

namespace pipeline {

class ProcessingCounters;

/**
 * VirtualProcessor - the single writer of the virtual state and UTXO set
 *
 * Every update runs on a dedicated one-thread pool, so two updates never
 * interleave; header and body work continues in parallel on the processing
 * pool. Each update holds the consensus prune lock shared.
 *
 * The UTXO store always holds the state after the selected chain up to
 * the sink. Each chain block keeps a BlockUtxoDiff relative to its
 * selected parent's state; moving the sink reverts diffs newest first down
 * to the fork point and applies the new chain oldest first. A block whose
 * own transactions do not apply becomes DisqualifiedFromChain and the sink
 * is chosen again.
 */
class VirtualProcessor {
public:
  using ChainChangedCallback = std::function<void(const std::shared_ptr<const VirtualState> &)>;

  VirtualProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                   const chain::GhostdagManager &ghostdag, ProcessingCounters &counters,
                   std::shared_mutex &pruning_lock, const std::atomic<bool> &stopping);
  ~VirtualProcessor();

  VirtualProcessor(const VirtualProcessor &) = delete;
  VirtualProcessor &operator=(const VirtualProcessor &) = delete;

  // Apply the genesis outputs and publish the initial state. The genesis
  // block must already be committed.
  void Initialize();

  // Called after each update that published a state
  void SetChainChangedCallback(ChainChangedCallback callback);

  // Queue a body-accepted block; its virtual future resolves once handled
  void Enqueue(std::shared_ptr<BlockTask> task);

  // Synchronous update (runs on the caller's thread; the caller holds the
  // prune lock shared and guarantees a single writer)
  BlockProcessResult ProcessNewBlock(const uint256 &hash);

  std::shared_ptr<const VirtualState> GetVirtualState() const;
  uint256 GetSink() const;
  std::vector<uint256> GetSelectedChain() const;
  std::vector<uint256> GetTips() const;

  // Pruning moved to `pruning_point` and deleted `deleted` (prune lock held
  // exclusively)
  void OnBlocksPruned(const uint256 &pruning_point, const chain::HashSet &deleted);

  void WaitIdle();
  void Shutdown();

private:
  // Sink candidate contributed by `tip`: the tip itself, or the selected
  // parent of the lowest disqualified block on its selected chain. nullopt
  // when the chain runs into pruned records.
  std::optional<uint256> ChainCandidateLocked(const uint256 &tip) const;

  uint256 ChooseSinkLocked() const;

  // Move the selected chain to end at `new_sink`. Returns false if a block
  // got disqualified on the way (the chain then ends at its selected parent).
  bool MoveSinkLocked(const uint256 &new_sink, std::vector<uint256> &added,
                      std::vector<uint256> &removed);

  void RevertChainBlockLocked(const uint256 &hash);
  bool ConnectChainBlockLocked(const uint256 &hash);

  // Blue mergeset (minus selected parent) then own transactions, relative to
  // the current UTXO store. nullptr if an own transaction fails.
  std::shared_ptr<const chain::BlockUtxoDiff>
  CalculateChainBlockDiff(const uint256 &hash, validation::ValidationState &state) const;

  std::vector<uint256> PickVirtualParentsLocked(const uint256 &sink) const;

  std::shared_ptr<const VirtualState> BuildVirtualStateLocked(std::vector<uint256> added,
                                                              std::vector<uint256> removed) const;

  void Publish(std::shared_ptr<const VirtualState> state);

  const chain::ChainParams &params_;
  chain::BlockManager &blocks_;
  const chain::GhostdagManager &ghostdag_;
  ProcessingCounters &counters_;
  std::shared_mutex &pruning_lock_;
  const std::atomic<bool> &stopping_;

  // Writer state
  mutable std::mutex writer_mutex_;
  chain::HashSet tips_;
  std::vector<uint256> selected_chain_; // Chain root (genesis or pruning point) to sink
  chain::HashSet chain_set_;

  mutable std::mutex state_mutex_;
  std::shared_ptr<const VirtualState> state_;

  std::mutex callback_mutex_;
  ChainChangedCallback chain_changed_;

  util::ThreadPool pool_;
};

} // namespace pipeline
} // namespace blockdag
