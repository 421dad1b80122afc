// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_status.hpp"
#include "chain/ghostdag.hpp"
#include "chain/stores.hpp"
#include "consensus/notifications.hpp"
#include "pipeline/block_task.hpp"
#include "pipeline/deps_manager.hpp"
#include "pipeline/processing_counters.hpp"
#include "pipeline/virtual_state.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace blockdag {

namespace chain {
class BlockManager;
class ChainParams;
class DagTraversal;
class GhostdagManager;
} // namespace chain

namespace pipeline {
class BodyProcessor;
class ConsensusMonitor;
class HeaderProcessor;
class PruningProcessor;
class VirtualProcessor;
} // namespace pipeline

namespace util {
class ThreadPool;
} // namespace util

namespace consensus {

struct ConsensusConfig {
  size_t processing_threads{0};      // Header/body workers (0 = hardware concurrency)
  int64_t monitor_interval_ms{0};    // Throughput report period (0 = no monitor)
  bool enable_pruning{true};
  size_t max_pending_blocks{100'000}; // Blocks allowed to wait for parents (0 = unlimited)
};

/**
 * Consensus - block acceptance pipeline over one set of stores
 *
 * Submission:
 *   ValidateAndInsertBlock() -> header in isolation -> dependency manager ->
 *   header processor -> body processor -> virtual processor -> pruning
 *
 * Header and body stages run on the processing pool; virtual and pruning
 * updates each run on their own one-thread pool. Every stage task and
 * every Session holds pruning_lock_ shared; pruning deletion takes it
 * exclusively.
 *
 * LIFETIME: ChainParams must outlive this Consensus.
 */
class Consensus {
public:
  /**
   * Session - consistent read view for out-of-pipeline readers
   *
   * Holds the prune lock shared for its lifetime, so nothing it can see is
   * deleted underneath it. Keep sessions short: pruning waits for them.
   */
  class Session {
  public:
    explicit Session(const Consensus &consensus);

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    bool HasBlock(const uint256 &hash) const;
    std::optional<chain::BlockStatus> GetBlockStatus(const uint256 &hash) const;

    // Throws chain::StoreError if unknown
    std::shared_ptr<const CBlockHeader> GetHeader(const uint256 &hash) const;
    std::shared_ptr<const chain::GhostdagData> GetGhostdagData(const uint256 &hash) const;

    // anticone(block) within past(context), ascending by (blue_work, hash).
    // Throws chain::StoreError on unknown hashes and
    // chain::TraversalLimitError past max_traversal visited blocks.
    std::vector<uint256> GetAnticone(const uint256 &block, const uint256 &context,
                                     size_t max_traversal) const;

    pipeline::PruningPointInfo GetPruningPoint() const;

  private:
    const Consensus &consensus_;
    std::shared_lock<std::shared_mutex> lock_;
  };

  Consensus(const chain::ChainParams &params, ConsensusConfig config);
  Consensus(const chain::ChainParams &params, ConsensusConfig config, chain::BlockStores stores);
  ~Consensus();

  Consensus(const Consensus &) = delete;
  Consensus &operator=(const Consensus &) = delete;

  /**
   * Submit a block. Safe to call concurrently.
   *
   * block_task resolves after the body stage (or at the first failure);
   * virtual_state_task after the virtual processor handled the block.
   * Resubmitting a pending or in-flight block returns the live futures;
   * resubmitting a known block returns resolved futures with its status.
   */
  pipeline::BlockValidationFutures ValidateAndInsertBlock(const CBlock &block);

  // Template on the current virtual parents. nTime is raised above the
  // sink's past median time when needed; PoW is not solved.
  CBlock BuildBlockTemplate(const std::vector<CTransaction> &txs, uint64_t timestamp) const;

  pipeline::ProcessingCountersSnapshot GetCountersSnapshot() const;
  pipeline::PruningPointInfo GetPruningPoint() const;
  std::shared_ptr<const pipeline::VirtualState> GetVirtualState() const;
  uint256 GetSink() const;
  std::vector<uint256> GetTips() const;
  std::vector<uint256> GetSelectedChain() const;

  std::optional<chain::BlockStatus> GetBlockStatus(const uint256 &hash) const;
  std::shared_ptr<const chain::GhostdagData> GetGhostdagData(const uint256 &hash) const;
  std::optional<chain::UtxoEntry> GetUtxo(const COutPoint &outpoint) const;
  size_t GetUtxoCount() const;
  size_t GetBlockCount() const;

  bool IsPending(const uint256 &hash) const;
  std::vector<uint256> GetMissingParents(const uint256 &hash) const;
  size_t PendingCount() const;

  // Export every stored block (see BlockManager::Save)
  bool SaveBlocks(const std::string &filepath) const;

  ConsensusNotifications &Notifications() { return notifications_; }
  const chain::ChainParams &GetParams() const { return params_; }
  const ConsensusConfig &GetConfig() const { return config_; }

  // Block until every queued stage task has finished
  void WaitIdle();

  // Stop intake, let queued tasks drain (they resolve with "shutdown"),
  // join all workers. Idempotent.
  void Shutdown();

private:
  void Dispatch(const std::shared_ptr<pipeline::BlockTask> &task);
  void ProcessBlockTask(const std::shared_ptr<pipeline::BlockTask> &task);
  void RejectTask(const std::shared_ptr<pipeline::BlockTask> &task,
                  const validation::ValidationState &state);
  void AbandonTask(const std::shared_ptr<pipeline::BlockTask> &task, const std::string &reason);
  void OnVirtualStatePublished(const std::shared_ptr<const pipeline::VirtualState> &state);

  const chain::ChainParams &params_;
  const ConsensusConfig config_;

  pipeline::ProcessingCounters counters_;
  ConsensusNotifications notifications_;

  std::unique_ptr<chain::BlockManager> blocks_;
  std::unique_ptr<chain::DagTraversal> traversal_;
  std::unique_ptr<chain::GhostdagManager> ghostdag_;

  mutable std::shared_mutex pruning_lock_;
  std::atomic<bool> stopping_{false};

  std::unique_ptr<pipeline::HeaderProcessor> header_processor_;
  std::unique_ptr<pipeline::BodyProcessor> body_processor_;
  pipeline::DependencyManager deps_;
  std::unique_ptr<pipeline::VirtualProcessor> virtual_processor_;
  std::unique_ptr<pipeline::PruningProcessor> pruning_processor_;
  std::unique_ptr<pipeline::ConsensusMonitor> monitor_;
  std::unique_ptr<util::ThreadPool> processing_pool_;
};

} // namespace consensus
} // namespace blockdag
