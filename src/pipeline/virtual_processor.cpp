// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pipeline/virtual_processor.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/ghostdag.hpp"
#include "chain/validation.hpp"
#include "pipeline/processing_counters.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace blockdag {
namespace pipeline {

namespace {

// Record `hash` as removed from the chain, cancelling an earlier add from the
// same update
void NoteRemoved(const uint256 &hash, std::vector<uint256> &added,
                 std::vector<uint256> &removed) {
  auto it = std::find(added.begin(), added.end(), hash);
  if (it != added.end()) {
    added.erase(it);
  } else {
    removed.push_back(hash);
  }
}

} // namespace

VirtualProcessor::VirtualProcessor(const chain::ChainParams &params, chain::BlockManager &blocks,
                                   const chain::GhostdagManager &ghostdag,
                                   ProcessingCounters &counters, std::shared_mutex &pruning_lock,
                                   const std::atomic<bool> &stopping)
    : params_(params), blocks_(blocks), ghostdag_(ghostdag), counters_(counters),
      pruning_lock_(pruning_lock), stopping_(stopping), pool_(1, "virtual") {}

VirtualProcessor::~VirtualProcessor() { Shutdown(); }

void VirtualProcessor::Initialize() {
  const uint256 &genesis = blocks_.GetGenesisHash();
  auto txs = blocks_.GetTransactions(genesis);

  // Genesis outputs enter the UTXO set directly; genesis has no diff record
  chain::UtxoDiff diff;
  for (const auto &tx : *txs) {
    validation::ValidationState state;
    if (!chain::ApplyTransaction(tx, blocks_.Utxo(), diff, 0, state)) {
      throw chain::StoreError("genesis transaction rejected: " + state.ToString());
    }
  }
  blocks_.Utxo().Apply(diff);
  blocks_.SetStatus(genesis, chain::BlockStatus::UTXOValid);

  std::shared_ptr<const VirtualState> state;
  {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    tips_ = {genesis};
    selected_chain_ = {genesis};
    chain_set_ = {genesis};
    state = BuildVirtualStateLocked({genesis}, {});
  }
  Publish(std::move(state));
  LOG_CHAIN_INFO("Virtual state initialized at genesis {} ({} UTXO entries)",
                 genesis.ToShortString(), blocks_.Utxo().Size());
}

void VirtualProcessor::SetChainChangedCallback(ChainChangedCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  chain_changed_ = std::move(callback);
}

void VirtualProcessor::Enqueue(std::shared_ptr<BlockTask> task) {
  pool_.enqueue([this, task]() {
    BlockProcessResult result;
    if (stopping_.load(std::memory_order_acquire)) {
      result.state.Error("shutdown");
      task->ResolveVirtual(result);
      return;
    }
    try {
      std::shared_lock<std::shared_mutex> prune_guard(pruning_lock_);
      result = ProcessNewBlock(task->hash());
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Virtual update for {} failed: {}", task->hash().ToShortString(), e.what());
      result.status = blocks_.GetStatus(task->hash()).value_or(chain::BlockStatus::HeaderOnly);
      result.state.Error("internal-error", e.what());
    }
    task->ResolveVirtual(result);
  });
}

BlockProcessResult VirtualProcessor::ProcessNewBlock(const uint256 &hash) {
  BlockProcessResult result;
  auto status = blocks_.GetStatus(hash);
  if (!status) {
    result.state.Error("block-pruned", hash.ToString());
    return result;
  }
  if (!chain::HasValidBody(*status)) {
    result.status = *status;
    result.state.Error("no-valid-body", chain::BlockStatusToString(*status));
    return result;
  }

  std::shared_ptr<const VirtualState> state;
  {
    std::lock_guard<std::mutex> lock(writer_mutex_);

    for (const auto &parent : blocks_.GetParents(hash)) {
      tips_.erase(parent);
    }
    tips_.insert(hash);

    std::vector<uint256> added;
    std::vector<uint256> removed;
    while (true) {
      const uint256 sink = ChooseSinkLocked();
      if (sink == selected_chain_.back()) {
        break;
      }
      if (MoveSinkLocked(sink, added, removed)) {
        break;
      }
      // A chain block was disqualified; choose again from the partial chain
    }

    state = BuildVirtualStateLocked(std::move(added), std::move(removed));
  }
  Publish(state);

  if (!state->added_chain.empty() || !state->removed_chain.empty()) {
    LOG_CHAIN_DEBUG("Virtual sink {} (blue_score={}): +{} -{} chain blocks, {} parents",
                    state->sink.ToShortString(), state->sink_blue_score,
                    state->added_chain.size(), state->removed_chain.size(),
                    state->parents.size());
  }

  result.status = blocks_.GetStatus(hash).value_or(chain::BlockStatus::HeaderOnly);
  return result;
}

std::optional<uint256> VirtualProcessor::ChainCandidateLocked(const uint256 &tip) const {
  uint256 candidate = tip;
  uint256 current = tip;
  while (!chain_set_.count(current)) {
    auto status = blocks_.GetStatus(current);
    auto data = blocks_.TryGetGhostdagData(current);
    if (!status || !data || data->selected_parent.IsNull()) {
      return std::nullopt;
    }
    if (!chain::IsChainEligible(*status)) {
      // Walking down, so the last assignment is the lowest bad block
      candidate = data->selected_parent;
    }
    current = data->selected_parent;
  }
  return candidate;
}

uint256 VirtualProcessor::ChooseSinkLocked() const {
  const uint256 &current_sink = selected_chain_.back();
  chain::SortableBlock best = blocks_.GetGhostdagData(current_sink)->ToSortable(current_sink);

  for (const auto &tip : tips_) {
    auto candidate = ChainCandidateLocked(tip);
    if (!candidate) {
      continue;
    }
    auto data = blocks_.TryGetGhostdagData(*candidate);
    if (!data) {
      continue;
    }
    chain::SortableBlock sortable = data->ToSortable(*candidate);
    if (best < sortable) {
      best = sortable;
    }
  }
  return best.hash;
}

bool VirtualProcessor::MoveSinkLocked(const uint256 &new_sink, std::vector<uint256> &added,
                                      std::vector<uint256> &removed) {
  std::vector<uint256> path;
  uint256 current = new_sink;
  while (!chain_set_.count(current)) {
    path.push_back(current);
    current = blocks_.GetGhostdagData(current)->selected_parent;
  }
  const uint256 fork = current;

  while (selected_chain_.back() != fork) {
    const uint256 tip = selected_chain_.back();
    RevertChainBlockLocked(tip);
    NoteRemoved(tip, added, removed);
  }

  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    if (!ConnectChainBlockLocked(*it)) {
      return false;
    }
    added.push_back(*it);
  }
  return true;
}

void VirtualProcessor::RevertChainBlockLocked(const uint256 &hash) {
  auto diff = blocks_.UtxoDiffs().Get(hash);
  if (!diff) {
    throw chain::StoreError("chain block " + hash.ToString() + " has no UTXO diff to revert");
  }
  blocks_.Utxo().Revert(diff->diff);
  blocks_.SetStatus(hash, chain::BlockStatus::UTXOPendingVerification);
  selected_chain_.pop_back();
  chain_set_.erase(hash);
  LOG_CHAIN_TRACE("Reverted chain block {}", hash.ToShortString());
}

bool VirtualProcessor::ConnectChainBlockLocked(const uint256 &hash) {
  auto diff = blocks_.UtxoDiffs().Get(hash);
  if (!diff) {
    validation::ValidationState state;
    diff = CalculateChainBlockDiff(hash, state);
    if (!diff) {
      blocks_.SetStatus(hash, chain::BlockStatus::DisqualifiedFromChain);
      LOG_CHAIN_WARN("Block {} disqualified from chain: {}", hash.ToShortString(),
                     state.ToString());
      return false;
    }
    blocks_.UtxoDiffs().Insert(hash, diff);
  }

  blocks_.Utxo().Apply(diff->diff);
  blocks_.SetStatus(hash, chain::BlockStatus::UTXOValid);
  selected_chain_.push_back(hash);
  chain_set_.insert(hash);

  counters_.chain_block_counts.fetch_add(1, std::memory_order_relaxed);
  counters_.mass_counts.fetch_add(diff->acceptedMass, std::memory_order_relaxed);
  LOG_CHAIN_TRACE("Connected chain block {}: {} txs accepted", hash.ToShortString(),
                  diff->acceptedTxCount);
  return true;
}

std::shared_ptr<const chain::BlockUtxoDiff>
VirtualProcessor::CalculateChainBlockDiff(const uint256 &hash,
                                          validation::ValidationState &state) const {
  auto data = blocks_.GetGhostdagData(hash);
  auto result = std::make_shared<chain::BlockUtxoDiff>();
  const chain::UtxoStore &utxo = blocks_.Utxo();

  for (const auto &blue : data->MergesetBluesWithoutSelectedParent()) {
    for (const auto &tx : *blocks_.GetTransactions(blue)) {
      validation::ValidationState tx_state;
      if (chain::ApplyTransaction(tx, utxo, result->diff, data->blue_score, tx_state)) {
        result->acceptedTxCount++;
        result->acceptedMass += tx.GetMass();
      }
    }
  }

  for (const auto &tx : *blocks_.GetTransactions(hash)) {
    if (!chain::ApplyTransaction(tx, utxo, result->diff, data->blue_score, state)) {
      return nullptr;
    }
    result->acceptedTxCount++;
    result->acceptedMass += tx.GetMass();
  }
  return result;
}

std::vector<uint256> VirtualProcessor::PickVirtualParentsLocked(const uint256 &sink) const {
  const auto &consensus = params_.GetConsensus();

  std::vector<chain::SortableBlock> candidates;
  for (const auto &tip : tips_) {
    if (tip == sink) {
      continue;
    }
    // Only tips whose own chain is clean; others would displace the sink
    auto candidate = ChainCandidateLocked(tip);
    if (!candidate || *candidate != tip) {
      continue;
    }
    candidates.push_back(blocks_.GetGhostdagData(tip)->ToSortable(tip));
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const chain::SortableBlock &a, const chain::SortableBlock &b) { return b < a; });

  std::vector<uint256> parents{sink};
  for (const auto &candidate : candidates) {
    if (parents.size() >= consensus.maxBlockParents) {
      break;
    }
    parents.push_back(candidate.hash);
    chain::GhostdagData data = ghostdag_.Run(parents);
    const bool blue = std::find(data.mergeset_blues.begin(), data.mergeset_blues.end(),
                                candidate.hash) != data.mergeset_blues.end();
    if (!blue || data.MergesetSize() > consensus.mergesetSizeLimit) {
      parents.pop_back();
    }
  }
  return parents;
}

std::shared_ptr<const VirtualState>
VirtualProcessor::BuildVirtualStateLocked(std::vector<uint256> added,
                                          std::vector<uint256> removed) const {
  auto state = std::make_shared<VirtualState>();
  state->sink = selected_chain_.back();
  state->parents = PickVirtualParentsLocked(state->sink);
  state->ghostdag_data = ghostdag_.Run(state->parents);
  state->mergeset = ghostdag_.ConsensusOrderedMergeset(state->ghostdag_data);
  state->sink_blue_score = blocks_.GetGhostdagData(state->sink)->blue_score;
  state->added_chain = std::move(added);
  state->removed_chain = std::move(removed);

  const chain::UtxoStore &utxo = blocks_.Utxo();
  for (const auto &blue : state->ghostdag_data.MergesetBluesWithoutSelectedParent()) {
    for (const auto &tx : *blocks_.GetTransactions(blue)) {
      validation::ValidationState tx_state;
      if (chain::ApplyTransaction(tx, utxo, state->utxo_diff, state->ghostdag_data.blue_score,
                                  tx_state)) {
        state->accepted_tx_count++;
      }
    }
  }
  return state;
}

void VirtualProcessor::Publish(std::shared_ptr<const VirtualState> state) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
  }
  ChainChangedCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = chain_changed_;
  }
  if (callback) {
    callback(state);
  }
}

std::shared_ptr<const VirtualState> VirtualProcessor::GetVirtualState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

uint256 VirtualProcessor::GetSink() const {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  return selected_chain_.empty() ? uint256() : selected_chain_.back();
}

std::vector<uint256> VirtualProcessor::GetSelectedChain() const {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  return selected_chain_;
}

std::vector<uint256> VirtualProcessor::GetTips() const {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  return std::vector<uint256>(tips_.begin(), tips_.end());
}

void VirtualProcessor::OnBlocksPruned(const uint256 &pruning_point,
                                      const chain::HashSet &deleted) {
  std::lock_guard<std::mutex> lock(writer_mutex_);

  auto root = std::find(selected_chain_.begin(), selected_chain_.end(), pruning_point);
  if (root == selected_chain_.end()) {
    throw chain::StoreError("pruning point " + pruning_point.ToString() +
                            " is not on the selected chain");
  }
  for (auto it = selected_chain_.begin(); it != root; ++it) {
    chain_set_.erase(*it);
  }
  selected_chain_.erase(selected_chain_.begin(), root);

  for (auto it = tips_.begin(); it != tips_.end();) {
    if (deleted.count(*it)) {
      it = tips_.erase(it);
    } else {
      ++it;
    }
  }
  LOG_CHAIN_DEBUG("Virtual chain trimmed to pruning point {}: {} chain blocks, {} tips",
                  pruning_point.ToShortString(), selected_chain_.size(), tips_.size());
}

void VirtualProcessor::WaitIdle() { pool_.wait_idle(); }

void VirtualProcessor::Shutdown() {
  pool_.shutdown();
  pool_.wait_for_completion();
}

} // namespace pipeline
} // namespace blockdag
