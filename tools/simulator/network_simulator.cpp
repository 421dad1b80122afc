// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network_simulator.hpp"
#include "chain/block_status.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <limits>

namespace blockdag {
namespace sim {

namespace {

constexpr size_t kValidationChunkSize = 1000;

// Per-block chance of a GHOSTDAG k violation the parameters are sized for
constexpr double kGhostdagKDelta = 0.05;

void WriteLE64(std::vector<uint8_t> &out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

} // namespace

void ApplyArgsToConsensusParams(const SimulatorOptions &options, chain::ChainParams &params) {
  const double x = 2.0 * options.delay * options.bps;
  if (x > 2.0) {
    const auto &consensus = params.GetConsensus();
    const uint32_t k =
        std::max(chain::CalculateGhostdagK(x, kGhostdagKDelta), consensus.ghostdagK);
    params.SetGhostdagK(k);
    params.SetTargetTimePerBlock(static_cast<int64_t>(1000.0 / options.bps));
    params.SetMergeDepth(static_cast<uint64_t>(consensus.mergeDepth * options.bps));
    LOG_INFO("The delay times bps product is larger than 2 (2Dλ={}), setting GHOSTDAG K={}, "
             "mergeset size limit={}, max parents={}",
             x, k, consensus.mergesetSizeLimit, consensus.maxBlockParents);
  }

  if (options.test_pruning) {
    params.SetFinalityDepth(128);
    params.SetMergeDepth(128);
    params.SetMergesetSizeLimit(32);
    params.SetPruningDepth(params.GetConsensus().AnticoneFinalizationDepth());
    LOG_INFO("Setting pruning depth to {}", params.GetConsensus().pruningDepth);
  } else {
    params.SetPruningDepth(0);
  }
}

NetworkSimulator::NetworkSimulator(const chain::ChainParams &params, SimulatorOptions options)
    : params_(params), options_(std::move(options)),
      rng_(options_.seed != 0 ? options_.seed : std::random_device{}()),
      mine_interval_(options_.bps / static_cast<double>(options_.miners) / 1000.0),
      delivery_delay_(0.0, options_.delay * 1000.0) {
  consensus::ConsensusConfig config;
  config.processing_threads = options_.processors_threads;
  config.enable_pruning = options_.test_pruning;

  miners_.resize(options_.miners);
  for (auto &miner : miners_) {
    miner.consensus = std::make_unique<consensus::Consensus>(params_, config);
  }
}

NetworkSimulator::~NetworkSimulator() { Shutdown(); }

void NetworkSimulator::Shutdown() {
  for (auto &miner : miners_) {
    miner.consensus->Shutdown();
  }
}

void NetworkSimulator::Schedule(uint64_t time, Event::Kind kind, size_t miner,
                                std::shared_ptr<const CBlock> block) {
  events_.push(Event{time, next_seq_++, kind, miner, std::move(block)});
}

void NetworkSimulator::ScheduleNextMine(uint64_t now, size_t miner) {
  const double interval = mine_interval_(rng_);
  Schedule(now + static_cast<uint64_t>(std::llround(interval)), Event::Kind::Mine, miner);
}

bool NetworkSimulator::TargetReached() const {
  return options_.target_blocks && mined_.size() >= *options_.target_blocks;
}

void NetworkSimulator::Run(uint64_t until_ms) {
  const uint64_t start = params_.GenesisBlock().header.nTime;
  for (size_t i = 0; i < miners_.size(); ++i) {
    ScheduleNextMine(start, i);
  }

  const auto wall_start = util::GetSteadyTime();
  while (!events_.empty()) {
    Event event = events_.top();
    events_.pop();

    if (event.kind == Event::Kind::Mine) {
      if (event.time > until_ms || TargetReached()) {
        continue; // Stop mining, keep draining deliveries
      }
      Mine(event.time, event.miner);
      ScheduleNextMine(event.time, event.miner);
    } else {
      Deliver(event.miner, event.block);
    }
  }

  for (auto &miner : miners_) {
    miner.consensus->WaitIdle();
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      util::GetSteadyTime() - wall_start);
  LOG_INFO("Simulation done: {} blocks mined by {} miner(s) in {} ms", mined_.size(),
           miners_.size(), elapsed.count());
}

std::vector<CTransaction> NetworkSimulator::MakeTransactions(size_t miner) {
  std::vector<CTransaction> txs;
  txs.reserve(options_.tpb);
  const uint64_t max_mass = params_.GetConsensus().maxBlockMass;
  uint64_t mass = 0;

  for (uint64_t i = 0; i < options_.tpb; ++i) {
    CTransaction tx;
    tx.nVersion = 1;
    CTxOut out;
    out.nValue = 1;
    out.scriptPubKey = {0x51};
    tx.vout.push_back(std::move(out));
    // Unique payload keeps every transaction hash distinct across the DAG
    WriteLE64(tx.payload, miner);
    WriteLE64(tx.payload, next_tx_id_++);

    mass += tx.GetMass();
    if (mass > max_mass) {
      break;
    }
    txs.push_back(std::move(tx));
  }
  return txs;
}

void NetworkSimulator::Mine(uint64_t now, size_t miner) {
  auto &consensus = *miners_[miner].consensus;
  CBlock block = consensus.BuildBlockTemplate(MakeTransactions(miner), now);
  block.header.nNonce = rng_();

  auto shared = std::make_shared<const CBlock>(std::move(block));
  mined_.push_back(shared);
  ++miners_[miner].blocks_mined;

  LOG_DEBUG("Miner {} mined {} at {} with {} parents and {} txs", miner,
            shared->GetHash().ToShortString(), shared->header.nTime,
            shared->header.DirectParents().size(), shared->vtx.size());

  for (size_t i = 0; i < miners_.size(); ++i) {
    const double delay = delivery_delay_(rng_);
    Schedule(now + static_cast<uint64_t>(std::llround(delay)), Event::Kind::Deliver, i, shared);
  }
}

void NetworkSimulator::Deliver(size_t miner, const std::shared_ptr<const CBlock> &block) {
  auto &consensus = *miners_[miner].consensus;
  auto futures = consensus.ValidateAndInsertBlock(*block);

  // Pending blocks resolve only once their parents arrive, so wait for the
  // pipeline to drain rather than on the futures
  consensus.WaitIdle();

  if (futures.block_task.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    const auto &result = futures.block_task.get();
    if (result.state.IsInvalid()) {
      LOG_WARN("Miner {} rejected {}: {}", miner, block->GetHash().ToShortString(),
               result.state.ToString());
    }
  }
}

DagStats ComputeDagStats(const consensus::Consensus &consensus,
                         const std::vector<std::shared_ptr<const CBlock>> &blocks) {
  DagStats stats;
  if (blocks.empty()) {
    return stats;
  }

  size_t blues = 0;
  size_t reds = 0;
  size_t parents = 0;
  for (const auto &block : blocks) {
    parents += block->header.DirectParents().size();
    stats.num_txs += block->vtx.size();
    auto data = consensus.GetGhostdagData(block->GetHash());
    if (data) {
      blues += data->mergeset_blues.size();
      reds += data->mergeset_reds.size();
    }
  }

  const double n = static_cast<double>(blocks.size());
  stats.blues_mean = static_cast<double>(blues) / n;
  stats.reds_mean = static_cast<double>(reds) / n;
  stats.parents_mean = static_cast<double>(parents) / n;
  stats.txs_mean = static_cast<double>(stats.num_txs) / n;
  return stats;
}

bool ValidateDag(consensus::Consensus &dst,
                 const std::vector<std::shared_ptr<const CBlock>> &blocks) {
  size_t num_txs = 0;
  for (const auto &block : blocks) {
    num_txs += block->vtx.size();
  }
  LOG_INFO("Validating {} blocks with {} transactions overall...", blocks.size(), num_txs);

  bool all_ok = true;
  auto check = [&](const std::vector<std::shared_future<pipeline::BlockProcessResult>> &joins) {
    for (const auto &join : joins) {
      const auto &result = join.get();
      if (result.status != chain::BlockStatus::UTXOValid &&
          result.status != chain::BlockStatus::UTXOPendingVerification) {
        LOG_ERROR("Block ended {} ({})", chain::BlockStatusToString(result.status),
                  result.state.ToString());
        all_ok = false;
      }
    }
  };

  const auto start = util::GetSteadyTime();
  std::vector<std::shared_future<pipeline::BlockProcessResult>> prev_joins;
  for (size_t offset = 0; offset < blocks.size(); offset += kValidationChunkSize) {
    const size_t end = std::min(blocks.size(), offset + kValidationChunkSize);
    std::vector<std::shared_future<pipeline::BlockProcessResult>> current_joins;
    current_joins.reserve(end - offset);
    for (size_t i = offset; i < end; ++i) {
      current_joins.push_back(dst.ValidateAndInsertBlock(*blocks[i]).virtual_state_task);
    }
    check(prev_joins);
    prev_joins = std::move(current_joins);
  }
  check(prev_joins);
  dst.WaitIdle();

  bool any_valid_tip = false;
  for (const auto &tip : dst.GetTips()) {
    if (dst.GetBlockStatus(tip) == chain::BlockStatus::UTXOValid) {
      any_valid_tip = true;
      break;
    }
  }
  if (!any_valid_tip) {
    LOG_ERROR("No tip was resolved with a valid UTXO state");
  }

  const double elapsed =
      std::chrono::duration<double>(util::GetSteadyTime() - start).count();
  const double safe_elapsed = std::max(elapsed, std::numeric_limits<double>::min());
  LOG_INFO("Total validation time: {:.3f}s, block processing rate: {:.2f} (b/s), "
           "transaction processing rate: {:.2f} (t/s)",
           elapsed, static_cast<double>(blocks.size()) / safe_elapsed,
           static_cast<double>(num_txs) / safe_elapsed);

  return all_ok && any_valid_tip;
}

} // namespace sim
} // namespace blockdag
