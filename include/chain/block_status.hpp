// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace blockdag {
namespace chain {

/**
 * Block lifecycle
 *
 *   HeaderOnly -> Invalid
 *   HeaderOnly -> UTXOPendingVerification -> UTXOValid
 *                                         -> DisqualifiedFromChain
 *
 * UTXOValid falls back to UTXOPendingVerification when a reorg removes the
 * block from the selected chain. Invalid and DisqualifiedFromChain are
 * permanent.
 */
enum class BlockStatus : uint8_t {
  HeaderOnly = 0,
  Invalid = 1,
  UTXOPendingVerification = 2,
  UTXOValid = 3,
  DisqualifiedFromChain = 4,
};

// Body accepted (the block can parent other blocks in the body stage)
inline bool HasValidBody(BlockStatus status) {
  return status == BlockStatus::UTXOPendingVerification ||
         status == BlockStatus::UTXOValid ||
         status == BlockStatus::DisqualifiedFromChain;
}

// Candidate for the selected chain
inline bool IsChainEligible(BlockStatus status) {
  return status == BlockStatus::UTXOPendingVerification ||
         status == BlockStatus::UTXOValid;
}

const char *BlockStatusToString(BlockStatus status);

} // namespace chain
} // namespace blockdag
