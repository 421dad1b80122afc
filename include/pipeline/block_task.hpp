// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_status.hpp"
#include "chain/validation.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <future>
#include <memory>

namespace blockdag {
namespace pipeline {

// Outcome of one pipeline stage for a block
struct BlockProcessResult {
  chain::BlockStatus status{chain::BlockStatus::HeaderOnly};
  validation::ValidationState state;
};

/**
 * Futures returned by block submission
 *
 * block_task resolves once the body stage is done (or the block failed
 * earlier); virtual_state_task resolves once the virtual processor has
 * handled the block.
 */
struct BlockValidationFutures {
  std::shared_future<BlockProcessResult> block_task;
  std::shared_future<BlockProcessResult> virtual_state_task;
};

/**
 * BlockTask - one submitted block travelling through the pipeline
 *
 * Each promise is fulfilled exactly once; later attempts are ignored so
 * every failure path can resolve unconditionally.
 */
class BlockTask {
public:
  BlockTask(const uint256 &hash, std::shared_ptr<const CBlock> block);

  const uint256 &hash() const { return hash_; }
  const CBlock &block() const { return *block_; }

  BlockValidationFutures Futures() const { return {block_future_, virtual_future_}; }

  void ResolveBlock(const BlockProcessResult &result);
  void ResolveVirtual(const BlockProcessResult &result);
  // Both futures with the same result (failures before the virtual stage)
  void ResolveAll(const BlockProcessResult &result);

  // Task whose futures are already resolved with `result`
  static std::shared_ptr<BlockTask> Completed(const uint256 &hash,
                                              std::shared_ptr<const CBlock> block,
                                              const BlockProcessResult &result);

private:
  const uint256 hash_;
  const std::shared_ptr<const CBlock> block_;

  std::promise<BlockProcessResult> block_promise_;
  std::promise<BlockProcessResult> virtual_promise_;
  std::shared_future<BlockProcessResult> block_future_;
  std::shared_future<BlockProcessResult> virtual_future_;
  std::atomic<bool> block_resolved_{false};
  std::atomic<bool> virtual_resolved_{false};
};

} // namespace pipeline
} // namespace blockdag
