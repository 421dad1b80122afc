// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/utxo.hpp"
#include "chain/stores.hpp"
#include "chain/validation.hpp"

namespace blockdag {
namespace chain {

std::optional<UtxoEntry> UtxoDiff::Lookup(const COutPoint &outpoint,
                                          const UtxoStore &base) const {
  auto ait = added.find(outpoint);
  if (ait != added.end()) {
    return ait->second;
  }
  if (removed.count(outpoint)) {
    return std::nullopt;
  }
  return base.Get(outpoint);
}

void UtxoDiff::Spend(const COutPoint &outpoint, const UtxoEntry &entry) {
  auto ait = added.find(outpoint);
  if (ait != added.end()) {
    added.erase(ait);
    return;
  }
  removed.emplace(outpoint, entry);
}

void UtxoDiff::Add(const COutPoint &outpoint, UtxoEntry entry) {
  added[outpoint] = std::move(entry);
}

bool ApplyTransaction(const CTransaction &tx, const UtxoStore &base, UtxoDiff &diff,
                      uint64_t blue_score, validation::ValidationState &state) {
  const uint256 txid = tx.GetHash();

  // Check everything before touching the diff
  std::vector<std::pair<COutPoint, UtxoEntry>> spent;
  spent.reserve(tx.vin.size());
  int64_t value_in = 0;
  for (const auto &in : tx.vin) {
    auto entry = diff.Lookup(in.prevout, base);
    if (!entry) {
      return state.Invalid("missing-or-spent-input", in.prevout.ToString());
    }
    value_in += entry->amount;
    spent.emplace_back(in.prevout, std::move(*entry));
  }

  if (!tx.IsCoinbase()) {
    int64_t value_out = 0;
    for (const auto &out : tx.vout) {
      value_out += out.nValue;
    }
    if (value_out > value_in) {
      return state.Invalid("bad-txns-in-belowout", txid.ToString());
    }
  }

  for (uint32_t i = 0; i < tx.vout.size(); ++i) {
    if (diff.Lookup(COutPoint(txid, i), base)) {
      return state.Invalid("tx-already-accepted", txid.ToString());
    }
  }

  for (const auto &[outpoint, entry] : spent) {
    diff.Spend(outpoint, entry);
  }
  for (uint32_t i = 0; i < tx.vout.size(); ++i) {
    UtxoEntry entry;
    entry.amount = tx.vout[i].nValue;
    entry.scriptPubKey = tx.vout[i].scriptPubKey;
    entry.blockBlueScore = blue_score;
    entry.isCoinbase = tx.IsCoinbase();
    diff.Add(COutPoint(txid, i), std::move(entry));
  }
  return true;
}

} // namespace chain
} // namespace blockdag
