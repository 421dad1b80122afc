// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/ghostdag.hpp"
#include "chain/utxo.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <vector>

namespace blockdag {
namespace pipeline {

/**
 * VirtualState - immutable view of the current consensus tip
 *
 * Published by the virtual processor as shared_ptr<const VirtualState>;
 * a reader holding one keeps a consistent view regardless of later
 * updates.
 */
struct VirtualState {
  std::vector<uint256> parents;         // Virtual parents (sink first)
  chain::GhostdagData ghostdag_data;    // GHOSTDAG data of the virtual block
  uint256 sink;                         // Virtual selected parent
  std::vector<uint256> added_chain;     // Chain blocks connected by the last update (oldest first)
  std::vector<uint256> removed_chain;   // Chain blocks reverted by the last update (newest first)
  std::vector<uint256> mergeset;        // Consensus-ordered virtual mergeset
  chain::UtxoDiff utxo_diff;            // Virtual mergeset applied on top of the sink UTXO set
  uint64_t accepted_tx_count{0};        // Transactions accepted by utxo_diff
  uint64_t sink_blue_score{0};
};

// Pruning point; only ever moves forward
struct PruningPointInfo {
  uint256 hash;
  uint64_t blue_score{0};

  friend bool operator==(const PruningPointInfo &, const PruningPointInfo &) = default;
};

} // namespace pipeline
} // namespace blockdag
