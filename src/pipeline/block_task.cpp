// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/block_task.hpp"

namespace blockdag {
namespace pipeline {

BlockTask::BlockTask(const uint256 &hash, std::shared_ptr<const CBlock> block)
    : hash_(hash), block_(std::move(block)),
      block_future_(block_promise_.get_future().share()),
      virtual_future_(virtual_promise_.get_future().share()) {}

void BlockTask::ResolveBlock(const BlockProcessResult &result) {
  if (!block_resolved_.exchange(true)) {
    block_promise_.set_value(result);
  }
}

void BlockTask::ResolveVirtual(const BlockProcessResult &result) {
  if (!virtual_resolved_.exchange(true)) {
    virtual_promise_.set_value(result);
  }
}

void BlockTask::ResolveAll(const BlockProcessResult &result) {
  ResolveBlock(result);
  ResolveVirtual(result);
}

std::shared_ptr<BlockTask> BlockTask::Completed(const uint256 &hash,
                                                std::shared_ptr<const CBlock> block,
                                                const BlockProcessResult &result) {
  auto task = std::make_shared<BlockTask>(hash, std::move(block));
  task->ResolveAll(result);
  return task;
}

} // namespace pipeline
} // namespace blockdag
