// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <queue>
#include <random>
#include <string>
#include <vector>

namespace blockdag {
namespace sim {

struct SimulatorOptions {
  double bps{1.0};                      // Blocks per second (whole network)
  double delay{2.0};                    // Max propagation delay (seconds)
  uint64_t miners{1};
  uint64_t tpb{200};                    // Target transactions per block
  uint64_t sim_time{600};               // Simulated seconds
  std::optional<uint64_t> target_blocks; // Overrides sim_time when set
  size_t processors_threads{0};         // 0 = hardware concurrency
  bool test_pruning{false};
  std::string output;                   // Export path for the mined DAG
  std::string input;                    // Previously exported DAG to re-validate
  uint64_t seed{0};                     // 0 = random
};

// Adjust k, the mergeset limit, timing and pruning depths to the simulated
// network (bps * delay decides how wide the DAG gets)
void ApplyArgsToConsensusParams(const SimulatorOptions &options, chain::ChainParams &params);

// Mean GHOSTDAG shape of a block set
struct DagStats {
  double blues_mean{0.0};
  double reds_mean{0.0};
  double parents_mean{0.0};
  double txs_mean{0.0};
  size_t num_txs{0};
};

/**
 * NetworkSimulator - discrete-event miner network
 *
 * Every miner runs its own Consensus. Mining is a Poisson process with rate
 * bps / miners per miner; each mined block is delivered to every miner
 * (its own miner included) after a uniform random delay in [0, delay].
 * Events are processed in simulated-time order on the calling thread, and
 * each delivery waits for the receiving consensus to go idle, so templates
 * always reflect everything a miner has received.
 */
class NetworkSimulator {
public:
  NetworkSimulator(const chain::ChainParams &params, SimulatorOptions options);
  ~NetworkSimulator();

  NetworkSimulator(const NetworkSimulator &) = delete;
  NetworkSimulator &operator=(const NetworkSimulator &) = delete;

  // Run until simulated time `until_ms` (or the block target), then drain
  // in-flight deliveries
  void Run(uint64_t until_ms);

  // Miner 0's consensus (sees every block once Run returns)
  consensus::Consensus &Primary() { return *miners_.front().consensus; }

  // Mined blocks in mining order (parents always precede children)
  const std::vector<std::shared_ptr<const CBlock>> &MinedBlocks() const { return mined_; }

  // Stop every miner's consensus
  void Shutdown();

private:
  struct Event {
    enum class Kind { Mine, Deliver };
    uint64_t time;
    uint64_t seq;
    Kind kind;
    size_t miner;
    std::shared_ptr<const CBlock> block;

    friend bool operator>(const Event &a, const Event &b) {
      if (a.time != b.time) {
        return a.time > b.time;
      }
      return a.seq > b.seq;
    }
  };

  struct Miner {
    std::unique_ptr<consensus::Consensus> consensus;
    uint64_t blocks_mined{0};
  };

  void Schedule(uint64_t time, Event::Kind kind, size_t miner,
                std::shared_ptr<const CBlock> block = nullptr);
  void ScheduleNextMine(uint64_t now, size_t miner);
  void Mine(uint64_t now, size_t miner);
  void Deliver(size_t miner, const std::shared_ptr<const CBlock> &block);

  std::vector<CTransaction> MakeTransactions(size_t miner);
  bool TargetReached() const;

  const chain::ChainParams &params_;
  const SimulatorOptions options_;

  std::vector<Miner> miners_;
  std::priority_queue<Event, std::vector<Event>, std::greater<Event>> events_;
  uint64_t next_seq_{0};
  uint64_t next_tx_id_{0};
  std::vector<std::shared_ptr<const CBlock>> mined_;

  std::mt19937_64 rng_;
  std::exponential_distribution<double> mine_interval_;
  std::uniform_real_distribution<double> delivery_delay_;
};

// Mean blues, reds, parents and txs over `blocks` as seen by `consensus`
DagStats ComputeDagStats(const consensus::Consensus &consensus,
                         const std::vector<std::shared_ptr<const CBlock>> &blocks);

/**
 * Re-validate `blocks` (topologically ordered) through `dst`, submitting in
 * chunks of 1000 and waiting on chunk i only after chunk i+1 is in flight.
 * True if every block ended UTXOValid or UTXOPendingVerification and at
 * least one tip is UTXOValid.
 */
bool ValidateDag(consensus::Consensus &dst,
                 const std::vector<std::shared_ptr<const CBlock>> &blocks);

} // namespace sim
} // namespace blockdag
