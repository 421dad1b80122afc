// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/stores.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace blockdag {
namespace chain {

/**
 * In-memory store implementations
 *
 * Hash maps guarded by a std::shared_mutex each: many concurrent readers,
 * one writer at a time. Used by default and by all tests.
 */

namespace detail {

// Hash -> shared immutable record
template <typename T>
class SharedRecordMap {
public:
  bool Has(const uint256 &hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return map_.count(hash) != 0;
  }

  std::shared_ptr<const T> Get(const uint256 &hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = map_.find(hash);
    return it == map_.end() ? nullptr : it->second;
  }

  void Insert(const uint256 &hash, std::shared_ptr<const T> record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    map_[hash] = std::move(record);
  }

  void Delete(const uint256 &hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    map_.erase(hash);
  }

  size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return map_.size();
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<uint256, std::shared_ptr<const T>, util::Uint256Hasher> map_;
};

} // namespace detail

class MemoryHeaderStore : public HeaderStore {
public:
  bool Has(const uint256 &hash) const override { return map_.Has(hash); }
  std::shared_ptr<const CBlockHeader> Get(const uint256 &hash) const override {
    return map_.Get(hash);
  }
  int64_t GetTimestamp(const uint256 &hash) const override;
  void Insert(const uint256 &hash, std::shared_ptr<const CBlockHeader> header) override {
    map_.Insert(hash, std::move(header));
  }
  void Delete(const uint256 &hash) override { map_.Delete(hash); }
  size_t Size() const override { return map_.Size(); }

private:
  detail::SharedRecordMap<CBlockHeader> map_;
};

class MemoryRelationsStore : public RelationsStore {
public:
  explicit MemoryRelationsStore(size_t levels);

  size_t Levels() const override { return levels_.size(); }
  bool Has(size_t level, const uint256 &hash) const override;
  std::vector<uint256> GetParents(size_t level, const uint256 &hash) const override;
  std::vector<uint256> GetChildren(size_t level, const uint256 &hash) const override;
  void Insert(size_t level, const uint256 &hash, const std::vector<uint256> &parents) override;
  void Delete(size_t level, const uint256 &hash) override;

private:
  struct Edges {
    std::vector<uint256> parents;
    std::vector<uint256> children;
  };
  using LevelMap = std::unordered_map<uint256, Edges, util::Uint256Hasher>;

  const LevelMap &Level(size_t level) const;
  LevelMap &Level(size_t level);

  mutable std::shared_mutex mutex_;
  std::vector<LevelMap> levels_;
};

class MemoryGhostdagStore : public GhostdagStore {
public:
  bool Has(const uint256 &hash) const override { return map_.Has(hash); }
  std::shared_ptr<const GhostdagData> Get(const uint256 &hash) const override {
    return map_.Get(hash);
  }
  void Insert(const uint256 &hash, std::shared_ptr<const GhostdagData> data) override {
    map_.Insert(hash, std::move(data));
  }
  void Delete(const uint256 &hash) override { map_.Delete(hash); }

private:
  detail::SharedRecordMap<GhostdagData> map_;
};

class MemoryBlockTransactionsStore : public BlockTransactionsStore {
public:
  bool Has(const uint256 &hash) const override { return map_.Has(hash); }
  std::shared_ptr<const std::vector<CTransaction>> Get(const uint256 &hash) const override {
    return map_.Get(hash);
  }
  void Insert(const uint256 &hash,
              std::shared_ptr<const std::vector<CTransaction>> txs) override {
    map_.Insert(hash, std::move(txs));
  }
  void Delete(const uint256 &hash) override { map_.Delete(hash); }

private:
  detail::SharedRecordMap<std::vector<CTransaction>> map_;
};

class MemoryStatusStore : public StatusStore {
public:
  std::optional<BlockStatus> Get(const uint256 &hash) const override;
  void Set(const uint256 &hash, BlockStatus status) override;
  void Delete(const uint256 &hash) override;
  size_t Size() const override;
  std::vector<uint256> Hashes() const override;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<uint256, BlockStatus, util::Uint256Hasher> map_;
};

class MemoryUtxoStore : public UtxoStore {
public:
  std::optional<UtxoEntry> Get(const COutPoint &outpoint) const override;
  void Apply(const UtxoDiff &diff) override;
  void Revert(const UtxoDiff &diff) override;
  size_t Size() const override;

private:
  // Remove `remove`, then insert `add`; validates before mutating
  void ApplyLocked(const UtxoCollection &remove, const UtxoCollection &add);

  mutable std::shared_mutex mutex_;
  UtxoCollection map_;
};

class MemoryUtxoDiffStore : public UtxoDiffStore {
public:
  std::shared_ptr<const BlockUtxoDiff> Get(const uint256 &hash) const override {
    return map_.Get(hash);
  }
  void Insert(const uint256 &hash, std::shared_ptr<const BlockUtxoDiff> diff) override {
    map_.Insert(hash, std::move(diff));
  }
  void Delete(const uint256 &hash) override { map_.Delete(hash); }

private:
  detail::SharedRecordMap<BlockUtxoDiff> map_;
};

} // namespace chain
} // namespace blockdag
