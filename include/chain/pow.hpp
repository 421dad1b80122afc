// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "chain/block.hpp"
#include <cstdint>

namespace blockdag {

namespace chain {
class ChainParams;
} // namespace chain

namespace consensus {

// Decode compact target representation (Bitcoin nBits format).
// Sets *pfNegative / *pfOverflow when the encoding is not a valid target.
arith_uint256 DecodeCompact(uint32_t nCompact, bool *pfNegative = nullptr,
                            bool *pfOverflow = nullptr);

// Encode a target into compact form (lossy for low-order bits)
uint32_t EncodeCompact(const arith_uint256 &target);

// Target for nBits, or 0 when nBits is negative, zero or overflowing
arith_uint256 GetTargetFromBits(uint32_t nBits);

// CONSENSUS-CRITICAL: Work represented by a block with this target
// Returns ~target / (target + 1) + 1, i.e. 2^256 / (target + 1).
// Invalid targets return 0 work.
arith_uint256 GetBlockProof(uint32_t nBits);

// Returns difficulty as floating point: pow_limit / current_target
double GetDifficulty(uint32_t nBits, const chain::ChainParams &params);

// CONSENSUS-CRITICAL: nBits decodes to a target in (0, pow_limit] and the
// header hash does not exceed it. Chains configured with skip_proof_of_work
// only get the range check.
bool CheckProofOfWork(const CBlockHeader &header, const chain::ChainParams &params);

} // namespace consensus
} // namespace blockdag
