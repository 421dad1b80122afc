// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/ghostdag.hpp"
#include "chain/block_manager.hpp"
#include "chain/dag_traversal.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <deque>

namespace blockdag {
namespace chain {

std::vector<uint256> GhostdagData::MergesetBluesWithoutSelectedParent() const {
  if (mergeset_blues.empty()) {
    return {};
  }
  return std::vector<uint256>(mergeset_blues.begin() + 1, mergeset_blues.end());
}

GhostdagManager::GhostdagManager(uint32_t k, const BlockManager &blocks,
                                 const DagTraversal &traversal)
    : k_(k), blocks_(blocks), traversal_(traversal) {}

GhostdagData GhostdagManager::GenesisData() {
  GhostdagData data;
  data.blue_score = 0;
  data.blue_work = 0;
  return data;
}

uint256 GhostdagManager::FindSelectedParent(const std::vector<uint256> &parents) const {
  if (parents.empty()) {
    throw StoreError("FindSelectedParent: no parents");
  }
  SortableBlock best = blocks_.GetGhostdagData(parents.front())->ToSortable(parents.front());
  for (size_t i = 1; i < parents.size(); ++i) {
    SortableBlock candidate = blocks_.GetGhostdagData(parents[i])->ToSortable(parents[i]);
    if (best < candidate) {
      best = candidate;
    }
  }
  return best.hash;
}

void GhostdagManager::SortBlocks(std::vector<uint256> &hashes) const {
  std::vector<SortableBlock> sortable;
  sortable.reserve(hashes.size());
  for (const auto &hash : hashes) {
    sortable.push_back(blocks_.GetGhostdagData(hash)->ToSortable(hash));
  }
  std::sort(sortable.begin(), sortable.end());
  for (size_t i = 0; i < sortable.size(); ++i) {
    hashes[i] = sortable[i].hash;
  }
}

std::vector<uint256> GhostdagManager::OrderedMergesetWithoutSelectedParent(
    const uint256 &selected_parent, const std::vector<uint256> &parents) const {
  std::deque<uint256> queue;
  HashSet mergeset;
  for (const auto &parent : parents) {
    if (parent != selected_parent && mergeset.insert(parent).second) {
      queue.push_back(parent);
    }
  }

  HashSet selected_parent_past;
  while (!queue.empty()) {
    const uint256 current = queue.front();
    queue.pop_front();
    for (const auto &parent : blocks_.GetParents(current)) {
      if (mergeset.count(parent) || selected_parent_past.count(parent)) {
        continue;
      }
      if (!blocks_.TryGetGhostdagData(parent)) {
        continue; // Below the pruning point
      }
      if (traversal_.IsDagAncestorOf(parent, selected_parent)) {
        selected_parent_past.insert(parent);
        continue;
      }
      mergeset.insert(parent);
      queue.push_back(parent);
    }
  }

  std::vector<uint256> ordered(mergeset.begin(), mergeset.end());
  SortBlocks(ordered);
  return ordered;
}

std::vector<uint256> GhostdagManager::ConsensusOrderedMergeset(const GhostdagData &data) const {
  std::vector<uint256> rest = data.MergesetBluesWithoutSelectedParent();
  rest.insert(rest.end(), data.mergeset_reds.begin(), data.mergeset_reds.end());
  SortBlocks(rest);

  std::vector<uint256> ordered;
  ordered.reserve(rest.size() + 1);
  if (!data.selected_parent.IsNull()) {
    ordered.push_back(data.selected_parent);
  }
  ordered.insert(ordered.end(), rest.begin(), rest.end());
  return ordered;
}

uint32_t GhostdagManager::BlueAnticoneSize(const uint256 &block, const GhostdagData &context) const {
  const GhostdagData *current = &context;
  std::shared_ptr<const GhostdagData> holder;
  while (true) {
    auto it = current->blues_anticone_sizes.find(block);
    if (it != current->blues_anticone_sizes.end()) {
      return it->second;
    }
    if (current->selected_parent.IsNull()) {
      throw StoreError("blue anticone size: block " + block.ToString() +
                       " is not in the blue set of the given context");
    }
    holder = blocks_.GetGhostdagData(current->selected_parent);
    current = holder.get();
  }
}

GhostdagManager::Coloring GhostdagManager::CheckBlueCandidateWithChainBlock(
    const GhostdagData &new_block_data, const uint256 *chain_block_hash,
    const GhostdagData &chain_block_data, const uint256 &candidate,
    BlueAnticoneSizes &candidate_blues_anticone_sizes,
    uint32_t &candidate_blue_anticone_size) const {
  // Every blue of a chain block in the candidate's past is in the candidate's
  // past too, so the candidate's blue anticone is complete
  if (chain_block_hash && traversal_.IsDagAncestorOf(*chain_block_hash, candidate)) {
    return Coloring::Blue;
  }

  for (const auto &block : chain_block_data.mergeset_blues) {
    // Blocks in the candidate's past are not in its anticone
    if (traversal_.IsDagAncestorOf(block, candidate)) {
      continue;
    }

    const uint32_t block_anticone_size = BlueAnticoneSize(block, new_block_data);
    candidate_blues_anticone_sizes[block] = block_anticone_size;
    ++candidate_blue_anticone_size;

    if (candidate_blue_anticone_size > k_) {
      // The candidate's blue anticone exceeds k
      return Coloring::Red;
    }
    if (block_anticone_size == k_) {
      // Adding the candidate would push this blue's anticone over k
      return Coloring::Red;
    }
  }
  return Coloring::Pending;
}

bool GhostdagManager::CheckBlueCandidate(const GhostdagData &new_block_data, const uint256 &candidate,
                                         BlueAnticoneSizes &candidate_blues_anticone_sizes,
                                         uint32_t &candidate_blue_anticone_size) const {
  // The maximal blue anticone of any block is k, so at most k + 1 blues
  // (selected parent included) fit in one mergeset
  if (new_block_data.mergeset_blues.size() == static_cast<size_t>(k_) + 1) {
    return false;
  }

  // Walk the selected chain starting at the new block itself
  const uint256 *chain_hash = nullptr;
  const GhostdagData *chain_data = &new_block_data;
  uint256 current_hash;
  std::shared_ptr<const GhostdagData> holder;
  while (true) {
    Coloring coloring = CheckBlueCandidateWithChainBlock(
        new_block_data, chain_hash, *chain_data, candidate, candidate_blues_anticone_sizes,
        candidate_blue_anticone_size);
    if (coloring == Coloring::Blue) {
      return true;
    }
    if (coloring == Coloring::Red) {
      return false;
    }
    if (chain_data->selected_parent.IsNull()) {
      throw StoreError("selected chain of candidate " + candidate.ToString() +
                       " ended before reaching a common ancestor");
    }
    current_hash = chain_data->selected_parent;
    holder = blocks_.GetGhostdagData(current_hash);
    chain_hash = &current_hash;
    chain_data = holder.get();
  }
}

GhostdagData GhostdagManager::Run(const std::vector<uint256> &parents) const {
  const uint256 selected_parent = FindSelectedParent(parents);
  auto selected_parent_data = blocks_.GetGhostdagData(selected_parent);

  GhostdagData data;
  data.selected_parent = selected_parent;
  data.mergeset_blues.push_back(selected_parent);
  data.blues_anticone_sizes[selected_parent] = 0;

  const std::vector<uint256> ordered_mergeset =
      OrderedMergesetWithoutSelectedParent(selected_parent, parents);

  for (const auto &candidate : ordered_mergeset) {
    BlueAnticoneSizes candidate_blues_anticone_sizes;
    uint32_t candidate_blue_anticone_size = 0;
    if (CheckBlueCandidate(data, candidate, candidate_blues_anticone_sizes,
                           candidate_blue_anticone_size)) {
      data.mergeset_blues.push_back(candidate);
      data.blues_anticone_sizes[candidate] = candidate_blue_anticone_size;
      // Every blue in the candidate's anticone gains one more blue
      for (const auto &[blue, size] : candidate_blues_anticone_sizes) {
        data.blues_anticone_sizes[blue] = size + 1;
      }
    } else {
      data.mergeset_reds.push_back(candidate);
    }
  }

  arith_uint256 added_work = 0;
  for (const auto &blue : data.mergeset_blues) {
    added_work += consensus::GetBlockProof(blocks_.GetHeader(blue)->nBits);
  }
  data.blue_score = selected_parent_data->blue_score + data.mergeset_blues.size();
  data.blue_work = selected_parent_data->blue_work + added_work;

  LOG_CHAIN_TRACE("GHOSTDAG: sp={} blues={} reds={} blue_score={}",
                  selected_parent.ToShortString(), data.mergeset_blues.size(),
                  data.mergeset_reds.size(), data.blue_score);
  return data;
}

} // namespace chain
} // namespace blockdag
