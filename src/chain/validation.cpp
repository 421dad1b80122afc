// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include <algorithm>
#include <set>
#include <unordered_set>
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "util/uint.hpp"

namespace blockdag {
namespace validation {

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string s = reject_reason_;
  if (!debug_message_.empty()) {
    s += " (" + debug_message_ + ")";
  }
  return s;
}

bool CheckBlockHeader(const CBlockHeader &header,
                      const chain::ChainParams &params, int64_t adjusted_time,
                      ValidationState &state) {
  const auto &consensus = params.GetConsensus();

  // Version validation (for now, just accept version >= 1)
  if (header.nVersion < 1) {
    return state.Invalid("bad-version", "block version too old: " +
                                            std::to_string(header.nVersion));
  }

  const auto &parents = header.DirectParents();
  if (parents.empty()) {
    return state.Invalid("no-parents", "block has no direct parents");
  }

  if (parents.size() > consensus.maxBlockParents) {
    return state.Invalid("too-many-parents",
                         std::to_string(parents.size()) + " > " +
                             std::to_string(consensus.maxBlockParents));
  }

  if (header.parentsByLevel.size() > consensus.maxBlockLevel) {
    return state.Invalid("too-many-levels",
                         std::to_string(header.parentsByLevel.size()) + " > " +
                             std::to_string(consensus.maxBlockLevel));
  }

  for (size_t level = 0; level < header.parentsByLevel.size(); ++level) {
    const auto &level_parents = header.parentsByLevel[level];
    if (level_parents.empty()) {
      return state.Invalid("empty-parent-level",
                           "level " + std::to_string(level) + " has no parents");
    }
    std::unordered_set<uint256, util::Uint256Hasher> seen;
    for (const auto &parent : level_parents) {
      if (parent.IsNull()) {
        return state.Invalid("null-parent", "level " + std::to_string(level));
      }
      if (!seen.insert(parent).second) {
        return state.Invalid("duplicate-parent", parent.ToString());
      }
    }
  }

  // Check proof of work (includes nBits range against powLimit)
  if (!consensus::CheckProofOfWork(header, params)) {
    return state.Invalid("high-hash", "proof of work failed");
  }

  // Check timestamp is not too far in future
  const int64_t max_time = adjusted_time + consensus.MaxFutureBlockTime();
  if (header.GetBlockTime() > max_time) {
    return state.Invalid(
        "time-too-new",
        "block timestamp too far in future: " + std::to_string(header.nTime) +
            " > " + std::to_string(max_time));
  }

  return true;
}

bool ContextualCheckBlockHeader(const CBlockHeader &header,
                                int64_t past_median_time,
                                ValidationState &state) {
  // Block timestamp must be after median time past
  if (header.GetBlockTime() <= past_median_time) {
    return state.Invalid(
        "time-too-old",
        "block's timestamp is too early: " + std::to_string(header.nTime) +
            " <= " + std::to_string(past_median_time));
  }
  return true;
}

bool CheckTransaction(const CTransaction &tx, ValidationState &state) {
  if (tx.vout.empty()) {
    return state.Invalid("bad-txns-vout-empty", tx.GetHash().ToString());
  }

  int64_t value_out = 0;
  for (const auto &out : tx.vout) {
    if (out.nValue < 0) {
      return state.Invalid("bad-txns-vout-negative", tx.GetHash().ToString());
    }
    if (out.nValue > MAX_MONEY) {
      return state.Invalid("bad-txns-vout-toolarge", tx.GetHash().ToString());
    }
    value_out += out.nValue;
    if (value_out > MAX_MONEY) {
      return state.Invalid("bad-txns-txouttotal-toolarge", tx.GetHash().ToString());
    }
  }

  std::set<COutPoint> inputs;
  for (const auto &in : tx.vin) {
    if (!inputs.insert(in.prevout).second) {
      return state.Invalid("bad-txns-inputs-duplicate", in.prevout.ToString());
    }
  }

  return true;
}

bool CheckBlockBody(const CBlock &block, const chain::ChainParams &params,
                    ValidationState &state) {
  const auto &consensus = params.GetConsensus();

  if (BlockMerkleRoot(block.vtx) != block.header.hashMerkleRoot) {
    return state.Invalid("bad-txnmrklroot", "hashMerkleRoot mismatch");
  }

  if (block.vtx.size() > consensus.maxBlockTxs) {
    return state.Invalid("bad-blk-length",
                         std::to_string(block.vtx.size()) + " > " +
                             std::to_string(consensus.maxBlockTxs));
  }

  uint64_t mass = 0;
  for (const auto &tx : block.vtx) {
    mass += tx.GetMass();
    if (mass > consensus.maxBlockMass) {
      return state.Invalid("bad-blk-mass",
                           "mass exceeds " + std::to_string(consensus.maxBlockMass));
    }
  }

  std::unordered_set<uint256, util::Uint256Hasher> tx_hashes;
  std::set<COutPoint> spent;
  for (const auto &tx : block.vtx) {
    if (!CheckTransaction(tx, state)) {
      return false;
    }
    if (!tx_hashes.insert(tx.GetHash()).second) {
      return state.Invalid("bad-txns-duplicate", tx.GetHash().ToString());
    }
    for (const auto &in : tx.vin) {
      if (!spent.insert(in.prevout).second) {
        return state.Invalid("bad-txns-double-spend", in.prevout.ToString());
      }
    }
  }

  return true;
}

int64_t GetAdjustedTime() {
  return ::blockdag::util::GetTimeMillis();
}

} // namespace validation
} // namespace blockdag
