// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace blockdag {
namespace chain {

class BlockManager;
class DagTraversal;

// (blue_work, hash) - the consensus total order key
struct SortableBlock {
  uint256 hash;
  arith_uint256 blue_work;

  friend bool operator<(const SortableBlock &a, const SortableBlock &b) {
    if (a.blue_work != b.blue_work) {
      return a.blue_work < b.blue_work;
    }
    return a.hash < b.hash;
  }
};

using BlueAnticoneSizes = std::unordered_map<uint256, uint32_t, util::Uint256Hasher>;

/**
 * GHOSTDAG data of a block, computed once when its header is accepted
 *
 * mergeset_blues starts with the selected parent; the remaining blues and
 * all reds are in ascending (blue_work, hash) order. blues_anticone_sizes
 * records, for each blue in the mergeset, the size of its blue anticone as
 * seen from this block.
 */
struct GhostdagData {
  uint64_t blue_score{0};
  arith_uint256 blue_work{0};
  uint256 selected_parent;
  std::vector<uint256> mergeset_blues;
  std::vector<uint256> mergeset_reds;
  BlueAnticoneSizes blues_anticone_sizes;

  size_t MergesetSize() const { return mergeset_blues.size() + mergeset_reds.size(); }

  // Blues without the selected parent, in consensus order
  std::vector<uint256> MergesetBluesWithoutSelectedParent() const;

  SortableBlock ToSortable(const uint256 &hash) const { return SortableBlock{hash, blue_work}; }
};

/**
 * GhostdagManager - k-cluster blue/red classification
 *
 * Reads relations, GHOSTDAG data and headers through the BlockManager, and
 * ancestry through DagTraversal. Stateless apart from k, so a single
 * instance is shared by all header workers.
 */
class GhostdagManager {
public:
  GhostdagManager(uint32_t k, const BlockManager &blocks, const DagTraversal &traversal);

  // Data for the genesis block (score 0, work 0, no selected parent)
  static GhostdagData GenesisData();

  // Parent with the highest (blue_work, hash)
  uint256 FindSelectedParent(const std::vector<uint256> &parents) const;

  // Full GHOSTDAG for a block with these direct parents. Parents must all
  // have GHOSTDAG data. Throws StoreError on missing records.
  GhostdagData Run(const std::vector<uint256> &parents) const;

  // Blocks in past(parents) but not in past(selected_parent) or the selected
  // parent itself, sorted ascending by (blue_work, hash)
  std::vector<uint256> OrderedMergesetWithoutSelectedParent(
      const uint256 &selected_parent, const std::vector<uint256> &parents) const;

  // Sort hashes ascending by (blue_work, hash)
  void SortBlocks(std::vector<uint256> &hashes) const;

  // Selected parent followed by the rest of the mergeset (blues and reds
  // interleaved) in ascending (blue_work, hash) order
  std::vector<uint256> ConsensusOrderedMergeset(const GhostdagData &data) const;

  uint32_t k() const { return k_; }

private:
  enum class Coloring { Blue, Red, Pending };

  Coloring CheckBlueCandidateWithChainBlock(const GhostdagData &new_block_data,
                                            const uint256 *chain_block_hash,
                                            const GhostdagData &chain_block_data,
                                            const uint256 &candidate,
                                            BlueAnticoneSizes &candidate_blues_anticone_sizes,
                                            uint32_t &candidate_blue_anticone_size) const;

  bool CheckBlueCandidate(const GhostdagData &new_block_data, const uint256 &candidate,
                          BlueAnticoneSizes &candidate_blues_anticone_sizes,
                          uint32_t &candidate_blue_anticone_size) const;

  // Blue anticone size of `block` from the point of view of `context`
  uint32_t BlueAnticoneSize(const uint256 &block, const GhostdagData &context) const;

  uint32_t k_;
  const BlockManager &blocks_;
  const DagTraversal &traversal_;
};

} // namespace chain
} // namespace blockdag
