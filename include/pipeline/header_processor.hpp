// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/validation.hpp"
#include "util/uint.hpp"

namespace blockdag {

namespace chain {
class BlockManager;
class ChainParams;
class DagTraversal;
class GhostdagManager;
} // namespace chain

namespace pipeline {

class ProcessingCounters;

/**
 * HeaderProcessor - header validation and GHOSTDAG commit
 *
 * Stateless apart from its collaborators; ProcessHeader() runs
 * concurrently on the processing pool for unrelated blocks. A block only
 * reaches ProcessHeader() once the dependency manager has released it, so
 * every direct parent already has a committed header and body.
 */
class HeaderProcessor {
public:
  HeaderProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                  const chain::DagTraversal &traversal, const chain::GhostdagManager &ghostdag,
                  ProcessingCounters &counters);

  // Context-free header rules, checked at submission
  bool CheckHeaderInIsolation(const CBlockHeader &header, validation::ValidationState &state) const;

  // Parent checks, GHOSTDAG, mergeset limit, past median time, then commit.
  // INVALID results are permanent for the block; ERROR results
  // (missing parents) are not.
  bool ProcessHeader(const uint256 &hash, const CBlockHeader &header,
                     validation::ValidationState &state);

private:
  const chain::ChainParams &params_;
  chain::BlockManager &blocks_;
  const chain::DagTraversal &traversal_;
  const chain::GhostdagManager &ghostdag_;
  ProcessingCounters &counters_;
};

} // namespace pipeline
} // namespace blockdag
