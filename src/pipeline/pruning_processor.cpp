// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/pruning_processor.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "pipeline/virtual_processor.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace blockdag {
namespace pipeline {

PruningProcessor::PruningProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                                   const chain::DagTraversal &traversal,
                                   VirtualProcessor &virtual_processor,
                                   std::shared_mutex &pruning_lock,
                                   const std::atomic<bool> &stopping, bool enabled)
    : params_(params), blocks_(blocks), traversal_(traversal), virtual_(virtual_processor),
      pruning_lock_(pruning_lock), stopping_(stopping), enabled_(enabled),
      pruning_point_{blocks.GetGenesisHash(), 0}, pool_(1, "pruning") {}

PruningProcessor::~PruningProcessor() { Shutdown(); }

void PruningProcessor::SetAdvancedCallback(AdvancedCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  advanced_ = std::move(callback);
}

void PruningProcessor::OnVirtualChanged(const uint256 &sink) {
  if (!enabled_ || pool_.is_stopped()) {
    return;
  }
  try {
    pool_.enqueue([this, sink]() {
      if (stopping_.load(std::memory_order_acquire)) {
        return;
      }
      try {
        AdvancePruningPoint(sink);
      } catch (const std::exception &e) {
        LOG_CHAIN_ERROR("Pruning pass for sink {} failed: {}", sink.ToShortString(), e.what());
      }
    });
  } catch (const std::runtime_error &e) {
    // The pool stopped after the check above
    LOG_CHAIN_DEBUG("Skipping pruning pass for sink {}: {}", sink.ToShortString(), e.what());
  }
}

std::optional<PruningPointInfo> PruningProcessor::FindCandidate(const uint256 &sink) const {
  const auto &consensus = params_.GetConsensus();
  const PruningPointInfo current = GetPruningPoint();

  auto sink_data = blocks_.TryGetGhostdagData(sink);
  if (!sink_data || sink_data->blue_score < consensus.pruningDepth) {
    return std::nullopt;
  }
  const uint64_t max_score = sink_data->blue_score - consensus.pruningDepth;
  if (max_score < current.blue_score + consensus.finalityDepth) {
    return std::nullopt;
  }

  // Highest chain block at or below max_score
  uint256 hash = sink;
  auto data = sink_data;
  while (data->blue_score > max_score) {
    if (hash == current.hash || data->selected_parent.IsNull()) {
      return std::nullopt;
    }
    hash = data->selected_parent;
    data = blocks_.TryGetGhostdagData(hash);
    if (!data) {
      return std::nullopt;
    }
  }
  if (data->blue_score < current.blue_score + consensus.finalityDepth) {
    return std::nullopt;
  }
  PruningPointInfo candidate{hash, data->blue_score};

  // The candidate must sit above the current pruning point on the same chain
  while (hash != current.hash) {
    if (data->selected_parent.IsNull()) {
      return std::nullopt;
    }
    hash = data->selected_parent;
    data = blocks_.TryGetGhostdagData(hash);
    if (!data) {
      return std::nullopt;
    }
  }
  return candidate;
}

bool PruningProcessor::AdvancePruningPoint(const uint256 &sink) {
  if (!enabled_) {
    return false;
  }

  std::optional<PruningPointInfo> candidate;
  chain::HashSet future;
  chain::HashSet to_delete;
  {
    std::shared_lock<std::shared_mutex> lock(pruning_lock_);
    candidate = FindCandidate(sink);
    if (!candidate) {
      return false;
    }
    future = traversal_.FutureOf(candidate->hash);
    for (const auto &hash : blocks_.GetBlockHashes()) {
      if (!future.count(hash)) {
        to_delete.insert(hash);
      }
    }
  }

  {
    std::unique_lock<std::shared_mutex> lock(pruning_lock_);

    const auto chain = virtual_.GetSelectedChain();
    if (std::find(chain.begin(), chain.end(), candidate->hash) == chain.end()) {
      LOG_CHAIN_DEBUG("Pruning candidate {} left the selected chain, skipping",
                      candidate->hash.ToShortString());
      return false;
    }

    // Blocks committed between the two lock windows: keep those that
    // descend from the retained set, delete the rest
    std::vector<uint256> fresh;
    for (const auto &hash : blocks_.GetBlockHashes()) {
      if (!future.count(hash) && !to_delete.count(hash)) {
        fresh.push_back(hash);
      }
    }
    bool grew = true;
    while (grew) {
      grew = false;
      for (auto it = fresh.begin(); it != fresh.end();) {
        bool retained = false;
        for (const auto &parent : blocks_.GetParents(*it)) {
          if (future.count(parent)) {
            retained = true;
            break;
          }
        }
        if (retained) {
          future.insert(*it);
          it = fresh.erase(it);
          grew = true;
        } else {
          ++it;
        }
      }
    }
    to_delete.insert(fresh.begin(), fresh.end());

    for (const auto &hash : to_delete) {
      blocks_.DeleteBlock(hash);
    }
    virtual_.OnBlocksPruned(candidate->hash, to_delete);

    std::lock_guard<std::mutex> point_lock(point_mutex_);
    pruning_point_ = *candidate;
  }

  LOG_CHAIN_INFO("Pruning point advanced to {} (blue_score={}), deleted {} blocks, {} retained",
                 candidate->hash.ToShortString(), candidate->blue_score, to_delete.size(),
                 blocks_.GetBlockCount());

  AdvancedCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = advanced_;
  }
  if (callback) {
    callback(*candidate);
  }
  return true;
}

PruningPointInfo PruningProcessor::GetPruningPoint() const {
  std::lock_guard<std::mutex> lock(point_mutex_);
  return pruning_point_;
}

void PruningProcessor::WaitIdle() { pool_.wait_idle(); }

void PruningProcessor::Shutdown() {
  pool_.shutdown();
  pool_.wait_for_completion();
}

} // namespace pipeline
} // namespace blockdag
