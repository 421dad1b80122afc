// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "consensus/consensus.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/dag_traversal.hpp"
#include "chain/ghostdag.hpp"
#include "chain/validation.hpp"
#include "pipeline/body_processor.hpp"
#include "pipeline/header_processor.hpp"
#include "pipeline/monitor.hpp"
#include "pipeline/pruning_processor.hpp"
#include "pipeline/virtual_processor.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockdag {
namespace consensus {

using pipeline::BlockProcessResult;
using pipeline::BlockTask;

// ============================================================================
// Consensus::Session
// ============================================================================

Consensus::Session::Session(const Consensus &consensus)
    : consensus_(consensus), lock_(consensus.pruning_lock_) {}

bool Consensus::Session::HasBlock(const uint256 &hash) const {
  return consensus_.blocks_->HasBlock(hash);
}

std::optional<chain::BlockStatus> Consensus::Session::GetBlockStatus(const uint256 &hash) const {
  return consensus_.blocks_->GetStatus(hash);
}

std::shared_ptr<const CBlockHeader> Consensus::Session::GetHeader(const uint256 &hash) const {
  return consensus_.blocks_->GetHeader(hash);
}

std::shared_ptr<const chain::GhostdagData>
Consensus::Session::GetGhostdagData(const uint256 &hash) const {
  return consensus_.blocks_->GetGhostdagData(hash);
}

std::vector<uint256> Consensus::Session::GetAnticone(const uint256 &block, const uint256 &context,
                                                     size_t max_traversal) const {
  std::vector<uint256> anticone =
      consensus_.traversal_->AnticoneFromPov(block, context, max_traversal);
  consensus_.ghostdag_->SortBlocks(anticone);
  return anticone;
}

pipeline::PruningPointInfo Consensus::Session::GetPruningPoint() const {
  return consensus_.pruning_processor_->GetPruningPoint();
}

// ============================================================================
// Consensus
// ============================================================================

Consensus::Consensus(const chain::ChainParams &params, ConsensusConfig config)
    : Consensus(params, config,
                chain::BlockStores::InMemory(params.GetConsensus().maxBlockLevel)) {}

Consensus::Consensus(const chain::ChainParams &params, ConsensusConfig config,
                     chain::BlockStores stores)
    : params_(params), config_(config),
      blocks_(std::make_unique<chain::BlockManager>(std::move(stores))),
      traversal_(std::make_unique<chain::DagTraversal>(*blocks_)),
      ghostdag_(std::make_unique<chain::GhostdagManager>(params.GetConsensus().ghostdagK,
                                                         *blocks_, *traversal_)),
      deps_([this](const uint256 &hash) { return blocks_->GetStatus(hash); },
            config.max_pending_blocks) {
  if (!blocks_->Initialize(params_.GenesisBlock())) {
    throw std::runtime_error("failed to initialize block stores with genesis");
  }

  header_processor_ = std::make_unique<pipeline::HeaderProcessor>(params_, *blocks_, *traversal_,
                                                                  *ghostdag_, counters_);
  body_processor_ = std::make_unique<pipeline::BodyProcessor>(params_, *blocks_, counters_);
  virtual_processor_ = std::make_unique<pipeline::VirtualProcessor>(
      params_, *blocks_, *ghostdag_, counters_, pruning_lock_, stopping_);
  pruning_processor_ = std::make_unique<pipeline::PruningProcessor>(
      params_, *blocks_, *traversal_, *virtual_processor_, pruning_lock_, stopping_,
      config_.enable_pruning);

  virtual_processor_->Initialize();
  virtual_processor_->SetChainChangedCallback(
      [this](const std::shared_ptr<const pipeline::VirtualState> &state) {
        OnVirtualStatePublished(state);
      });
  pruning_processor_->SetAdvancedCallback([this](const pipeline::PruningPointInfo &info) {
    notifications_.NotifyPruningPointAdvanced(info);
  });

  processing_pool_ = std::make_unique<util::ThreadPool>(config_.processing_threads, "processing");

  monitor_ = std::make_unique<pipeline::ConsensusMonitor>(
      counters_, std::chrono::milliseconds(config_.monitor_interval_ms));
  monitor_->Start();

  const auto &consensus = params_.GetConsensus();
  LOG_CHAIN_INFO("Consensus started on {} (genesis {}): k={} mergeset_limit={} "
                 "max_parents={} pruning_depth={} finality_depth={} workers={}",
                 params_.GetChainTypeString(), blocks_->GetGenesisHash().ToShortString(),
                 consensus.ghostdagK, consensus.mergesetSizeLimit, consensus.maxBlockParents,
                 consensus.pruningDepth, consensus.finalityDepth, processing_pool_->size());
}

Consensus::~Consensus() { Shutdown(); }

pipeline::BlockValidationFutures Consensus::ValidateAndInsertBlock(const CBlock &block) {
  counters_.blocks_submitted.fetch_add(1, std::memory_order_relaxed);

  const uint256 hash = block.GetHash();
  auto shared_block = std::make_shared<const CBlock>(block);

  if (stopping_.load(std::memory_order_acquire)) {
    BlockProcessResult result;
    result.state.Error("shutdown");
    return BlockTask::Completed(hash, shared_block, result)->Futures();
  }

  if (auto live = deps_.Find(hash)) {
    return live->Futures();
  }

  // HeaderOnly means an earlier attempt stopped between header and body
  // commit; such a block goes through the pipeline again
  auto status = blocks_->GetStatus(hash);
  if (status && *status != chain::BlockStatus::HeaderOnly) {
    BlockProcessResult result;
    result.status = *status;
    if (*status == chain::BlockStatus::Invalid) {
      result.state.Invalid("duplicate-invalid", "block " + hash.ToString() + " is invalid");
    }
    return BlockTask::Completed(hash, shared_block, result)->Futures();
  }

  auto task = std::make_shared<BlockTask>(hash, shared_block);

  validation::ValidationState state;
  if (!header_processor_->CheckHeaderInIsolation(block.header, state)) {
    LOG_PIPE_DEBUG("Block {} rejected in isolation: {}", hash.ToShortString(), state.ToString());
    // A timestamp too far ahead may become acceptable later; blocks waiting
    // on this hash keep waiting for a resubmission
    if (state.GetRejectReason() == "time-too-new") {
      BlockProcessResult result;
      result.state = state;
      task->ResolveAll(result);
    } else {
      RejectTask(task, state);
    }
    return task->Futures();
  }

  auto registration = deps_.Register(task);
  switch (registration.result) {
  case pipeline::DependencyManager::RegisterResult::Ready:
    Dispatch(task);
    break;
  case pipeline::DependencyManager::RegisterResult::Pending:
    break;
  case pipeline::DependencyManager::RegisterResult::Duplicate:
    return registration.existing->Futures();
  case pipeline::DependencyManager::RegisterResult::Known: {
    BlockProcessResult result;
    result.status = *registration.known_status;
    if (result.status == chain::BlockStatus::Invalid) {
      result.state.Invalid("duplicate-invalid", "block " + hash.ToString() + " is invalid");
    }
    task->ResolveAll(result);
    break;
  }
  case pipeline::DependencyManager::RegisterResult::ParentFailed: {
    validation::ValidationState parent_state;
    parent_state.Invalid("invalid-parent",
                         "parent " + registration.failed_parent.ToString() + " is invalid");
    RejectTask(task, parent_state);
    break;
  }
  case pipeline::DependencyManager::RegisterResult::Full: {
    BlockProcessResult result;
    result.state.Error("too-many-pending", std::to_string(deps_.PendingCount()) +
                                               " blocks already wait for parents");
    task->ResolveAll(result);
    break;
  }
  }
  return task->Futures();
}

void Consensus::Dispatch(const std::shared_ptr<BlockTask> &task) {
  try {
    processing_pool_->enqueue([this, task]() { ProcessBlockTask(task); });
  } catch (const std::runtime_error &e) {
    LOG_PIPE_DEBUG("Dropping block {}: {}", task->hash().ToShortString(), e.what());
    AbandonTask(task, "shutdown");
  }
}

void Consensus::ProcessBlockTask(const std::shared_ptr<BlockTask> &task) {
  const uint256 &hash = task->hash();
  std::vector<std::shared_ptr<BlockTask>> released;
  {
    std::shared_lock<std::shared_mutex> prune_guard(pruning_lock_);
    if (stopping_.load(std::memory_order_acquire)) {
      AbandonTask(task, "shutdown");
      return;
    }

    validation::ValidationState state;
    try {
      const bool header_stored = blocks_->GetStatus(hash) == chain::BlockStatus::HeaderOnly;
      if ((!header_stored &&
           !header_processor_->ProcessHeader(hash, task->block().header, state)) ||
          !body_processor_->ProcessBody(hash, task->block(), state)) {
        RejectTask(task, state);
        return;
      }
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Processing block {} failed: {}", hash.ToShortString(), e.what());
      state.Error("internal-error", e.what());
      RejectTask(task, state);
      return;
    }

    released = deps_.Resolve(hash);
    BlockProcessResult result;
    result.status = chain::BlockStatus::UTXOPendingVerification;
    result.state = state;
    task->ResolveBlock(result);
    deps_.Complete(hash);
  }

  notifications_.NotifyBlockAdded(hash, chain::BlockStatus::UTXOPendingVerification);

  try {
    virtual_processor_->Enqueue(task);
  } catch (const std::runtime_error &e) {
    BlockProcessResult result;
    result.status = chain::BlockStatus::UTXOPendingVerification;
    result.state.Error("shutdown", e.what());
    task->ResolveVirtual(result);
  }

  for (const auto &next : released) {
    Dispatch(next);
  }
}

void Consensus::RejectTask(const std::shared_ptr<BlockTask> &task,
                           const validation::ValidationState &state) {
  const uint256 &hash = task->hash();
  const bool invalid = state.IsInvalid();

  BlockProcessResult result;
  result.state = state;
  if (invalid) {
    // Marked before Fail() so late registrations see ParentFailed
    blocks_->MarkInvalid(hash);
    result.status = chain::BlockStatus::Invalid;
    LOG_PIPE_INFO("Block {} invalid: {}", hash.ToShortString(), state.ToString());
  } else {
    result.status = blocks_->GetStatus(hash).value_or(chain::BlockStatus::HeaderOnly);
  }

  auto dependents = deps_.Fail(hash);
  deps_.Complete(hash);
  task->ResolveAll(result);

  for (const auto &dependent : dependents) {
    BlockProcessResult dependent_result;
    if (invalid) {
      blocks_->MarkInvalid(dependent->hash());
      dependent_result.status = chain::BlockStatus::Invalid;
      dependent_result.state.Invalid("invalid-parent", "ancestor " + hash.ToString() +
                                                           " is invalid: " +
                                                           state.GetRejectReason());
    } else {
      dependent_result.state = state;
    }
    dependent->ResolveAll(dependent_result);
  }
  if (!dependents.empty()) {
    LOG_PIPE_INFO("{} dependent block(s) of {} dropped ({})", dependents.size(),
                  hash.ToShortString(), invalid ? "invalid" : state.GetRejectReason());
  }
}

void Consensus::AbandonTask(const std::shared_ptr<BlockTask> &task, const std::string &reason) {
  deps_.Complete(task->hash());
  BlockProcessResult result;
  result.status = blocks_->GetStatus(task->hash()).value_or(chain::BlockStatus::HeaderOnly);
  result.state.Error(reason);
  task->ResolveAll(result);
}

void Consensus::OnVirtualStatePublished(const std::shared_ptr<const pipeline::VirtualState> &state) {
  if (!state->added_chain.empty() || !state->removed_chain.empty()) {
    notifications_.NotifyVirtualChainChanged(state->added_chain, state->removed_chain);
  }
  pruning_processor_->OnVirtualChanged(state->sink);
}

CBlock Consensus::BuildBlockTemplate(const std::vector<CTransaction> &txs,
                                     uint64_t timestamp) const {
  std::shared_lock<std::shared_mutex> lock(pruning_lock_);
  auto state = virtual_processor_->GetVirtualState();
  const auto &consensus = params_.GetConsensus();

  CBlock block;
  block.header.nVersion = 1;
  block.header.parentsByLevel = {state->parents};
  block.header.nBits = consensus.genesisBits;
  block.header.nNonce = 0;
  block.vtx = txs;
  block.header.hashMerkleRoot = BlockMerkleRoot(block.vtx);

  const int64_t past_median_time =
      blocks_->GetPastMedianTime(state->sink, consensus.pastMedianTimeWindow);
  block.header.nTime = std::max<uint64_t>(timestamp, static_cast<uint64_t>(past_median_time) + 1);
  return block;
}

pipeline::ProcessingCountersSnapshot Consensus::GetCountersSnapshot() const {
  return counters_.Snapshot();
}

pipeline::PruningPointInfo Consensus::GetPruningPoint() const {
  return pruning_processor_->GetPruningPoint();
}

std::shared_ptr<const pipeline::VirtualState> Consensus::GetVirtualState() const {
  return virtual_processor_->GetVirtualState();
}

uint256 Consensus::GetSink() const { return virtual_processor_->GetSink(); }

std::vector<uint256> Consensus::GetTips() const { return virtual_processor_->GetTips(); }

std::vector<uint256> Consensus::GetSelectedChain() const {
  return virtual_processor_->GetSelectedChain();
}

std::optional<chain::BlockStatus> Consensus::GetBlockStatus(const uint256 &hash) const {
  return blocks_->GetStatus(hash);
}

std::shared_ptr<const chain::GhostdagData> Consensus::GetGhostdagData(const uint256 &hash) const {
  return blocks_->TryGetGhostdagData(hash);
}

std::optional<chain::UtxoEntry> Consensus::GetUtxo(const COutPoint &outpoint) const {
  return blocks_->Utxo().Get(outpoint);
}

size_t Consensus::GetUtxoCount() const { return blocks_->Utxo().Size(); }

size_t Consensus::GetBlockCount() const { return blocks_->GetBlockCount(); }

bool Consensus::IsPending(const uint256 &hash) const { return deps_.IsPending(hash); }

std::vector<uint256> Consensus::GetMissingParents(const uint256 &hash) const {
  return deps_.GetMissingParents(hash);
}

size_t Consensus::PendingCount() const { return deps_.PendingCount(); }

bool Consensus::SaveBlocks(const std::string &filepath) const {
  std::shared_lock<std::shared_mutex> lock(pruning_lock_);
  return blocks_->Save(filepath);
}

void Consensus::WaitIdle() {
  // Processing tasks dispatch released blocks before finishing, virtual
  // updates queue pruning passes: draining in this order empties all three
  processing_pool_->wait_idle();
  virtual_processor_->WaitIdle();
  pruning_processor_->WaitIdle();
}

void Consensus::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  LOG_CHAIN_INFO("Consensus shutting down ({} blocks pending on parents)", deps_.PendingCount());

  if (monitor_) {
    monitor_->Stop();
  }
  if (processing_pool_) {
    processing_pool_->shutdown();
    processing_pool_->wait_for_completion();
  }
  if (virtual_processor_) {
    virtual_processor_->Shutdown();
  }
  if (pruning_processor_) {
    pruning_processor_->Shutdown();
  }

  // Blocks still waiting on parents never ran; resolve their futures
  for (const auto &task : deps_.TakeAll()) {
    BlockProcessResult result;
    result.state.Error("shutdown");
    task->ResolveAll(result);
  }
}

} // namespace consensus
} // namespace blockdag
