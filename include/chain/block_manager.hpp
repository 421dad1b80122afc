// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stddef.h>
#include "chain/block.hpp"
#include "chain/block_status.hpp"
#include "chain/ghostdag.hpp"
#include "chain/stores.hpp"
#include "util/uint.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blockdag {
namespace chain {

// BlockManager - DAG index over the block stores
//
// Owns the stores and is the only component that writes more than one of
// them for a block. A block is visible once its status exists: commits write
// every other record first and the status last, deletes remove the status
// first.
//
// THREAD SAFETY: every method is safe to call concurrently; each store
// synchronizes itself. Structural consistency against pruning is provided
// by the consensus prune lock held by callers.
class BlockManager {
public:
  explicit BlockManager(BlockStores stores);
  ~BlockManager();

  BlockManager(const BlockManager &) = delete;
  BlockManager &operator=(const BlockManager &) = delete;

  // Commit genesis: header, empty relations, genesis GHOSTDAG data and body.
  // Status is left to the caller.
  bool Initialize(const CBlock &genesis);

  const uint256 &GetGenesisHash() const { return m_genesis_hash; }

  // Known block (has a status)
  bool HasBlock(const uint256 &hash) const;
  std::optional<BlockStatus> GetStatus(const uint256 &hash) const;
  void SetStatus(const uint256 &hash, BlockStatus status);

  // Throw StoreError if the record is missing
  std::shared_ptr<const CBlockHeader> GetHeader(const uint256 &hash) const;
  std::shared_ptr<const GhostdagData> GetGhostdagData(const uint256 &hash) const;
  std::shared_ptr<const std::vector<CTransaction>> GetTransactions(const uint256 &hash) const;

  // nullptr if missing (pruned or never stored)
  std::shared_ptr<const GhostdagData> TryGetGhostdagData(const uint256 &hash) const;

  std::vector<uint256> GetParents(const uint256 &hash, size_t level = 0) const;
  std::vector<uint256> GetChildren(const uint256 &hash, size_t level = 0) const;

  // Header, relations (every level), GHOSTDAG data, then status HeaderOnly
  void CommitHeader(const uint256 &hash, std::shared_ptr<const CBlockHeader> header,
                    std::shared_ptr<const GhostdagData> ghostdag);

  // Mark a block Invalid (header-stage failures have no other record)
  void MarkInvalid(const uint256 &hash);

  // Body record only; the body stage sets the status afterwards
  void CommitBody(const uint256 &hash, std::shared_ptr<const std::vector<CTransaction>> txs);

  // Remove every record of a block (status first, edges from retained
  // neighbours included)
  void DeleteBlock(const uint256 &hash);

  // Median timestamp of the last `window` selected-chain blocks ending at
  // `hash` (inclusive)
  int64_t GetPastMedianTime(const uint256 &hash, size_t window) const;

  // Snapshot of every known block hash
  std::vector<uint256> GetBlockHashes() const;
  size_t GetBlockCount() const;

  HeaderStore &Headers() { return *m_stores.headers; }
  const HeaderStore &Headers() const { return *m_stores.headers; }
  const RelationsStore &Relations() const { return *m_stores.relations; }
  const GhostdagStore &Ghostdag() const { return *m_stores.ghostdag; }
  const BlockTransactionsStore &Transactions() const { return *m_stores.transactions; }
  UtxoStore &Utxo() { return *m_stores.utxo; }
  const UtxoStore &Utxo() const { return *m_stores.utxo; }
  UtxoDiffStore &UtxoDiffs() { return *m_stores.utxo_diffs; }
  const UtxoDiffStore &UtxoDiffs() const { return *m_stores.utxo_diffs; }

  // Write every stored block with its body to JSON, in (blue_work, hash)
  // order so that parents precede children
  bool Save(const std::string &filepath) const;

  // Read blocks written by Save() (genesis excluded when it matches
  // expected_genesis_hash). Blocks are returned in file order for
  // re-validation through the pipeline.
  static bool LoadBlocks(const std::string &filepath, const uint256 &expected_genesis_hash,
                         std::vector<CBlock> &blocks);

private:
  BlockStores m_stores;
  uint256 m_genesis_hash;
  bool m_initialized{false};
};

} // namespace chain
} // namespace blockdag
