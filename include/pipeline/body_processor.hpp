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
} // namespace chain

namespace pipeline {

class ProcessingCounters;

// BodyProcessor - body rules against the committed header, then body
// commit and status UTXOPendingVerification
class BodyProcessor {
public:
  BodyProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                ProcessingCounters &counters);

  bool ProcessBody(const uint256 &hash, const CBlock &block, validation::ValidationState &state);

private:
  const chain::ChainParams &params_;
  chain::BlockManager &blocks_;
  ProcessingCounters &counters_;
};

} // namespace pipeline
} // namespace blockdag
