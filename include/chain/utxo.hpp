// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blockdag {

namespace validation {
class ValidationState;
} // namespace validation

namespace chain {

class UtxoStore;

// Unspent output
struct UtxoEntry {
  int64_t amount{0};
  std::vector<uint8_t> scriptPubKey;
  uint64_t blockBlueScore{0}; // Blue score of the chain block that accepted it
  bool isCoinbase{false};

  friend bool operator==(const UtxoEntry &a, const UtxoEntry &b) {
    return a.amount == b.amount && a.scriptPubKey == b.scriptPubKey &&
           a.blockBlueScore == b.blockBlueScore && a.isCoinbase == b.isCoinbase;
  }
};

using UtxoCollection = std::map<COutPoint, UtxoEntry>;

/**
 * UtxoDiff - outputs added and removed relative to a base UTXO set
 *
 * An output created and spent inside the same diff appears in neither
 * collection. Applying a diff removes `removed` (which must exist in the
 * base) and inserts `added`; reverting does the opposite.
 */
class UtxoDiff {
public:
  UtxoCollection added;
  UtxoCollection removed;

  bool IsEmpty() const { return added.empty() && removed.empty(); }

  // Entry for `outpoint` as seen through this diff layered on `base`
  std::optional<UtxoEntry> Lookup(const COutPoint &outpoint, const UtxoStore &base) const;

  // Spend an entry visible through Lookup
  void Spend(const COutPoint &outpoint, const UtxoEntry &entry);

  // Create an output
  void Add(const COutPoint &outpoint, UtxoEntry entry);
};

/**
 * Diff produced by connecting one selected-chain block, relative to the UTXO
 * state of its selected parent, plus what it accepted
 */
struct BlockUtxoDiff {
  UtxoDiff diff;
  uint64_t acceptedTxCount{0};
  uint64_t acceptedMass{0};
};

// Apply one transaction on top of `base` + `diff`. All inputs must be
// visible and unspent, and no output may already exist. On failure the diff
// is left untouched and `state` carries the reason.
bool ApplyTransaction(const CTransaction &tx, const UtxoStore &base, UtxoDiff &diff,
                      uint64_t blue_score, validation::ValidationState &state);

} // namespace chain
} // namespace blockdag
