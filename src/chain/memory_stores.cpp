// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/memory_stores.hpp"
#include <algorithm>

namespace blockdag {
namespace chain {

const char *BlockStatusToString(BlockStatus status) {
  switch (status) {
  case BlockStatus::HeaderOnly:
    return "HeaderOnly";
  case BlockStatus::Invalid:
    return "Invalid";
  case BlockStatus::UTXOPendingVerification:
    return "UTXOPendingVerification";
  case BlockStatus::UTXOValid:
    return "UTXOValid";
  case BlockStatus::DisqualifiedFromChain:
    return "DisqualifiedFromChain";
  }
  return "Unknown";
}

BlockStores BlockStores::InMemory(size_t levels) {
  BlockStores stores;
  stores.headers = std::make_unique<MemoryHeaderStore>();
  stores.relations = std::make_unique<MemoryRelationsStore>(levels);
  stores.ghostdag = std::make_unique<MemoryGhostdagStore>();
  stores.transactions = std::make_unique<MemoryBlockTransactionsStore>();
  stores.statuses = std::make_unique<MemoryStatusStore>();
  stores.utxo = std::make_unique<MemoryUtxoStore>();
  stores.utxo_diffs = std::make_unique<MemoryUtxoDiffStore>();
  return stores;
}

// ============================================================================
// Headers
// ============================================================================

int64_t MemoryHeaderStore::GetTimestamp(const uint256 &hash) const {
  auto header = map_.Get(hash);
  if (!header) {
    throw StoreError("header not found: " + hash.ToString());
  }
  return header->GetBlockTime();
}

// ============================================================================
// Relations
// ============================================================================

MemoryRelationsStore::MemoryRelationsStore(size_t levels) : levels_(std::max<size_t>(levels, 1)) {}

const MemoryRelationsStore::LevelMap &MemoryRelationsStore::Level(size_t level) const {
  if (level >= levels_.size()) {
    throw StoreError("relations level out of range: " + std::to_string(level));
  }
  return levels_[level];
}

MemoryRelationsStore::LevelMap &MemoryRelationsStore::Level(size_t level) {
  if (level >= levels_.size()) {
    throw StoreError("relations level out of range: " + std::to_string(level));
  }
  return levels_[level];
}

bool MemoryRelationsStore::Has(size_t level, const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return Level(level).count(hash) != 0;
}

std::vector<uint256> MemoryRelationsStore::GetParents(size_t level, const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto &map = Level(level);
  auto it = map.find(hash);
  return it == map.end() ? std::vector<uint256>{} : it->second.parents;
}

std::vector<uint256> MemoryRelationsStore::GetChildren(size_t level, const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto &map = Level(level);
  auto it = map.find(hash);
  return it == map.end() ? std::vector<uint256>{} : it->second.children;
}

void MemoryRelationsStore::Insert(size_t level, const uint256 &hash,
                                  const std::vector<uint256> &parents) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto &map = Level(level);
  auto [it, inserted] = map.try_emplace(hash);
  if (!inserted) {
    return; // Relations are immutable
  }
  // Parents not recorded at this level (claimed higher-level parents) keep
  // the edge one-sided
  for (const auto &parent : parents) {
    auto pit = map.find(parent);
    if (pit != map.end()) {
      it->second.parents.push_back(parent);
      pit->second.children.push_back(hash);
    }
  }
}

void MemoryRelationsStore::Delete(size_t level, const uint256 &hash) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto &map = Level(level);
  auto it = map.find(hash);
  if (it == map.end()) {
    return;
  }
  auto erase_from = [&hash](std::vector<uint256> &v) {
    v.erase(std::remove(v.begin(), v.end(), hash), v.end());
  };
  for (const auto &parent : it->second.parents) {
    auto pit = map.find(parent);
    if (pit != map.end()) {
      erase_from(pit->second.children);
    }
  }
  for (const auto &child : it->second.children) {
    auto cit = map.find(child);
    if (cit != map.end()) {
      erase_from(cit->second.parents);
    }
  }
  map.erase(it);
}

// ============================================================================
// Statuses
// ============================================================================

std::optional<BlockStatus> MemoryStatusStore::Get(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = map_.find(hash);
  if (it == map_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStatusStore::Set(const uint256 &hash, BlockStatus status) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  map_[hash] = status;
}

void MemoryStatusStore::Delete(const uint256 &hash) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  map_.erase(hash);
}

size_t MemoryStatusStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return map_.size();
}

std::vector<uint256> MemoryStatusStore::Hashes() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<uint256> hashes;
  hashes.reserve(map_.size());
  for (const auto &[hash, status] : map_) {
    hashes.push_back(hash);
  }
  return hashes;
}

// ============================================================================
// UTXO set
// ============================================================================

std::optional<UtxoEntry> MemoryUtxoStore::Get(const COutPoint &outpoint) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = map_.find(outpoint);
  if (it == map_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryUtxoStore::Apply(const UtxoDiff &diff) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ApplyLocked(diff.removed, diff.added);
}

void MemoryUtxoStore::Revert(const UtxoDiff &diff) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ApplyLocked(diff.added, diff.removed);
}

void MemoryUtxoStore::ApplyLocked(const UtxoCollection &remove, const UtxoCollection &add) {
  for (const auto &[outpoint, entry] : remove) {
    if (map_.find(outpoint) == map_.end()) {
      throw StoreError("utxo diff removes missing entry " + outpoint.ToString());
    }
  }
  for (const auto &[outpoint, entry] : add) {
    if (map_.find(outpoint) != map_.end() && remove.find(outpoint) == remove.end()) {
      throw StoreError("utxo diff adds existing entry " + outpoint.ToString());
    }
  }
  for (const auto &[outpoint, entry] : remove) {
    map_.erase(outpoint);
  }
  for (const auto &[outpoint, entry] : add) {
    map_[outpoint] = entry;
  }
}

size_t MemoryUtxoStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return map_.size();
}

} // namespace chain
} // namespace blockdag
