// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/header_processor.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/dag_traversal.hpp"
#include "chain/ghostdag.hpp"
#include "pipeline/processing_counters.hpp"
#include "util/logging.hpp"

namespace blockdag {
namespace pipeline {

HeaderProcessor::HeaderProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                                 const chain::DagTraversal &traversal,
                                 const chain::GhostdagManager &ghostdag,
                                 ProcessingCounters &counters)
    : params_(params), blocks_(blocks), traversal_(traversal), ghostdag_(ghostdag),
      counters_(counters) {}

bool HeaderProcessor::CheckHeaderInIsolation(const CBlockHeader &header,
                                             validation::ValidationState &state) const {
  return validation::CheckBlockHeader(header, params_, validation::GetAdjustedTime(), state);
}

bool HeaderProcessor::ProcessHeader(const uint256 &hash, const CBlockHeader &header,
                                    validation::ValidationState &state) {
  const auto &parents = header.DirectParents();

  // Parents must be known and not Invalid
  for (const auto &parent : parents) {
    auto status = blocks_.GetStatus(parent);
    if (!status || !blocks_.TryGetGhostdagData(parent)) {
      return state.Error("missing-parents", "parent " + parent.ToString() + " is not stored");
    }
    if (*status == chain::BlockStatus::Invalid) {
      return state.Invalid("invalid-parent", "parent " + parent.ToString() + " is invalid");
    }
  }

  // No parent may be an ancestor of another parent
  for (size_t i = 0; i < parents.size(); ++i) {
    for (size_t j = 0; j < parents.size(); ++j) {
      if (i != j && traversal_.IsDagAncestorOf(parents[i], parents[j])) {
        return state.Invalid("invalid-parents-relation",
                             "parent " + parents[i].ToString() + " is in the past of " +
                                 parents[j].ToString());
      }
    }
  }

  auto ghostdag = std::make_shared<chain::GhostdagData>(ghostdag_.Run(parents));

  const auto &consensus = params_.GetConsensus();
  if (ghostdag->MergesetSize() > consensus.mergesetSizeLimit) {
    return state.Invalid("violating-mergeset-limit",
                         "mergeset size " + std::to_string(ghostdag->MergesetSize()) +
                             " exceeds " + std::to_string(consensus.mergesetSizeLimit));
  }

  const int64_t past_median_time =
      blocks_.GetPastMedianTime(ghostdag->selected_parent, consensus.pastMedianTimeWindow);
  if (!validation::ContextualCheckBlockHeader(header, past_median_time, state)) {
    return false;
  }

  blocks_.CommitHeader(hash, std::make_shared<const CBlockHeader>(header), ghostdag);

  counters_.header_counts.fetch_add(1, std::memory_order_relaxed);
  counters_.dep_counts.fetch_add(parents.size(), std::memory_order_relaxed);

  LOG_PIPE_DEBUG("Header {} accepted: sp={} blue_score={} blues={} reds={}",
                 hash.ToShortString(), ghostdag->selected_parent.ToShortString(),
                 ghostdag->blue_score, ghostdag->mergeset_blues.size(),
                 ghostdag->mergeset_reds.size());
  return true;
}

} // namespace pipeline
} // namespace blockdag
