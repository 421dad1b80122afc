// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/body_processor.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "pipeline/processing_counters.hpp"
#include "util/logging.hpp"

namespace blockdag {
namespace pipeline {

BodyProcessor::BodyProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                             ProcessingCounters &counters)
    : params_(params), blocks_(blocks), counters_(counters) {}

bool BodyProcessor::ProcessBody(const uint256 &hash, const CBlock &block,
                                validation::ValidationState &state) {
  if (!validation::CheckBlockBody(block, params_, state)) {
    return false;
  }

  blocks_.CommitBody(hash, std::make_shared<const std::vector<CTransaction>>(block.vtx));
  blocks_.SetStatus(hash, chain::BlockStatus::UTXOPendingVerification);

  counters_.body_counts.fetch_add(1, std::memory_order_relaxed);
  counters_.txs_counts.fetch_add(block.vtx.size(), std::memory_order_relaxed);

  LOG_PIPE_TRACE("Body {} accepted: {} txs, mass {}", hash.ToShortString(), block.vtx.size(),
                 block.GetMass());
  return true;
}

} // namespace pipeline
} // namespace blockdag
