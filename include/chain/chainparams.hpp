// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace blockdag {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,    // Production mainnet
  TESTNET, // Public test network
  REGTEST, // Regression test (local testing, no PoW)
  SIMNET   // Simulator network (no PoW, genesis at time 0)
};

/**
 * Consensus parameters
 *
 * Depths are measured in blue score, times in milliseconds.
 */
struct ConsensusParams {
  // Proof of Work
  uint256 powLimit;                 // Maximum target (easiest difficulty)
  uint32_t genesisBits{0};          // Compact target used for every block
  bool skipProofOfWork{false};      // Range-check nBits only

  // GHOSTDAG
  uint32_t ghostdagK{18};           // Anticone bound for blue blocks
  uint64_t mergesetSizeLimit{180};  // Max |mergeset| of a block
  uint32_t maxBlockParents{10};     // Max direct parents
  uint32_t maxBlockLevel{32};       // Max parent levels in a header

  // Block body limits
  uint64_t maxBlockMass{500'000};
  uint32_t maxBlockTxs{10'000};

  // Finality and pruning
  uint64_t finalityDepth{86'400};
  uint64_t mergeDepth{3'600};
  uint64_t pruningDepth{0};         // 0 until finalized by the constructor

  // Timestamps
  int64_t targetTimePerBlock{1'000};       // Target spacing (ms)
  uint64_t timestampDeviationTolerance{132}; // In units of targetTimePerBlock
  uint32_t pastMedianTimeWindow{11};       // Selected-chain blocks in the median

  // Hash of genesis block
  uint256 hashGenesisBlock;

  /**
   * Depth after which no block can enter the anticone of a chain block:
   * finality + merge depth + 4 * mergeset_limit * k + 2k + 2
   */
  [[nodiscard]] uint64_t AnticoneFinalizationDepth() const;

  /**
   * Largest accepted lead of a block timestamp over the local clock
   */
  [[nodiscard]] int64_t MaxFutureBlockTime() const {
    return static_cast<int64_t>(timestampDeviationTolerance) * targetTimePerBlock;
  }
};

/**
 * ChainParams - Chain-specific parameters
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlock &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Mutators (simulator and test overrides)
  // Sets k, mergeset limit (10k) and max parents (max(0.66k, 10))
  void SetGhostdagK(uint32_t k);
  void SetMergesetSizeLimit(uint64_t limit) { consensus.mergesetSizeLimit = limit; }
  void SetMaxBlockParents(uint32_t parents) { consensus.maxBlockParents = parents; }
  void SetFinalityDepth(uint64_t depth) { consensus.finalityDepth = depth; }
  void SetMergeDepth(uint64_t depth) { consensus.mergeDepth = depth; }
  // 0 restores the safe default max(finality depth, anticone finalization depth)
  void SetPruningDepth(uint64_t depth);
  void SetTargetTimePerBlock(int64_t ms) { consensus.targetTimePerBlock = ms; }
  void SetMaxBlockMass(uint64_t mass) { consensus.maxBlockMass = mass; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> CreateSimNet();

protected:
  // Recomputes pruningDepth and the genesis hash once fields are set
  void Finalize();

  ConsensusParams consensus;
  ChainType chainType{ChainType::MAIN};
  CBlock genesis;
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

class CSimNetParams : public ChainParams {
public:
  CSimNetParams();
};

// Genesis block: no parents, a single output-only transaction carrying the
// initial outputs (so UTXO application has something to spend)
CBlock CreateGenesisBlock(uint64_t nTime, uint32_t nBits, const std::string &message,
                          int32_t nVersion = 1);

/**
 * Smallest k such that, for a Poisson anticone with mean x, the probability
 * of exceeding k is below delta (PHANTOM security bound). x is typically
 * 2 * delay * blocks_per_second.
 */
uint32_t CalculateGhostdagK(double x, double delta);

} // namespace chain
} // namespace blockdag
