// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_status.hpp"
#include "chain/ghostdag.hpp"
#include "chain/utxo.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockdag {
namespace chain {

/**
 * Storage layer
 *
 * Each store is an abstract per-hash record map. Records are immutable
 * once inserted and handed out as shared_ptr<const T>, so a reader keeps a
 * consistent record even if pruning deletes it concurrently. Every store
 * is internally synchronized; cross-store consistency is the
 * BlockManager's job (status is always written last).
 */

// Missing or inconsistent store record (index corruption or a pruned hash)
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class HeaderStore {
public:
  virtual ~HeaderStore() = default;

  virtual bool Has(const uint256 &hash) const = 0;
  // nullptr if unknown
  virtual std::shared_ptr<const CBlockHeader> Get(const uint256 &hash) const = 0;
  // Throws StoreError if unknown
  virtual int64_t GetTimestamp(const uint256 &hash) const = 0;
  virtual void Insert(const uint256 &hash, std::shared_ptr<const CBlockHeader> header) = 0;
  virtual void Delete(const uint256 &hash) = 0;
  virtual size_t Size() const = 0;
};

// Parent/child edges, one adjacency map per level
class RelationsStore {
public:
  virtual ~RelationsStore() = default;

  virtual size_t Levels() const = 0;
  virtual bool Has(size_t level, const uint256 &hash) const = 0;
  // Empty if unknown
  virtual std::vector<uint256> GetParents(size_t level, const uint256 &hash) const = 0;
  virtual std::vector<uint256> GetChildren(size_t level, const uint256 &hash) const = 0;
  // Records `hash` with `parents` and appends it to each known parent's children
  virtual void Insert(size_t level, const uint256 &hash, const std::vector<uint256> &parents) = 0;
  // Removes `hash` and every edge touching it
  virtual void Delete(size_t level, const uint256 &hash) = 0;
};

class GhostdagStore {
public:
  virtual ~GhostdagStore() = default;

  virtual bool Has(const uint256 &hash) const = 0;
  // nullptr if unknown
  virtual std::shared_ptr<const GhostdagData> Get(const uint256 &hash) const = 0;
  virtual void Insert(const uint256 &hash, std::shared_ptr<const GhostdagData> data) = 0;
  virtual void Delete(const uint256 &hash) = 0;
};

class BlockTransactionsStore {
public:
  virtual ~BlockTransactionsStore() = default;

  virtual bool Has(const uint256 &hash) const = 0;
  // nullptr if unknown
  virtual std::shared_ptr<const std::vector<CTransaction>> Get(const uint256 &hash) const = 0;
  virtual void Insert(const uint256 &hash,
                      std::shared_ptr<const std::vector<CTransaction>> txs) = 0;
  virtual void Delete(const uint256 &hash) = 0;
};

class StatusStore {
public:
  virtual ~StatusStore() = default;

  virtual std::optional<BlockStatus> Get(const uint256 &hash) const = 0;
  virtual void Set(const uint256 &hash, BlockStatus status) = 0;
  virtual void Delete(const uint256 &hash) = 0;
  virtual size_t Size() const = 0;
  // Snapshot of every hash with a status
  virtual std::vector<uint256> Hashes() const = 0;
};

class UtxoStore {
public:
  virtual ~UtxoStore() = default;

  virtual std::optional<UtxoEntry> Get(const COutPoint &outpoint) const = 0;
  // Throws StoreError if a removed entry is missing or an added one exists
  virtual void Apply(const UtxoDiff &diff) = 0;
  virtual void Revert(const UtxoDiff &diff) = 0;
  virtual size_t Size() const = 0;
};

class UtxoDiffStore {
public:
  virtual ~UtxoDiffStore() = default;

  // nullptr if unknown
  virtual std::shared_ptr<const BlockUtxoDiff> Get(const uint256 &hash) const = 0;
  virtual void Insert(const uint256 &hash, std::shared_ptr<const BlockUtxoDiff> diff) = 0;
  virtual void Delete(const uint256 &hash) = 0;
};

// The full set of stores backing a consensus instance
struct BlockStores {
  std::unique_ptr<HeaderStore> headers;
  std::unique_ptr<RelationsStore> relations;
  std::unique_ptr<GhostdagStore> ghostdag;
  std::unique_ptr<BlockTransactionsStore> transactions;
  std::unique_ptr<StatusStore> statuses;
  std::unique_ptr<UtxoStore> utxo;
  std::unique_ptr<UtxoDiffStore> utxo_diffs;

  // In-memory implementations with `levels` relation levels
  static BlockStores InMemory(size_t levels);
};

} // namespace chain
} // namespace blockdag
