// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace blockdag {
namespace chain {

// Number of outputs minted by the genesis transaction and their value
static constexpr uint32_t kGenesisOutputs = 16;
static constexpr int64_t kGenesisOutputValue = 50LL * 100'000'000LL;

CBlock CreateGenesisBlock(uint64_t nTime, uint32_t nBits, const std::string &message,
                          int32_t nVersion) {
  CTransaction tx;
  tx.nVersion = 1;
  tx.payload.assign(message.begin(), message.end());
  for (uint32_t i = 0; i < kGenesisOutputs; ++i) {
    CTxOut out;
    out.nValue = kGenesisOutputValue;
    out.scriptPubKey = {0x51}; // OP_TRUE
    tx.vout.push_back(std::move(out));
  }

  CBlock genesis;
  genesis.header.nVersion = nVersion;
  genesis.header.nTime = nTime;
  genesis.header.nBits = nBits;
  genesis.header.nNonce = 0;
  genesis.vtx.push_back(std::move(tx));
  genesis.header.hashMerkleRoot = BlockMerkleRoot(genesis.vtx);
  return genesis;
}

uint32_t CalculateGhostdagK(double x, double delta) {
  if (!(x > 0.0) || !(delta > 0.0 && delta < 1.0)) {
    throw std::invalid_argument("CalculateGhostdagK: x must be positive and delta in (0, 1)");
  }
  uint32_t k_hat = 0;
  double sigma = 0.0;
  double fraction = 1.0; // x^k_hat / k_hat!
  const double exp = std::exp(-x);
  while (true) {
    sigma += exp * fraction;
    if (1.0 - sigma < delta) {
      return k_hat;
    }
    ++k_hat;
    fraction *= x / static_cast<double>(k_hat);
  }
}

uint64_t ConsensusParams::AnticoneFinalizationDepth() const {
  const uint64_t k = ghostdagK;
  return finalityDepth + mergeDepth + 4 * mergesetSizeLimit * k + 2 * k + 2;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  case ChainType::SIMNET:
    return "simnet";
  }
  return "unknown";
}

void ChainParams::SetGhostdagK(uint32_t k) {
  consensus.ghostdagK = k;
  consensus.mergesetSizeLimit = static_cast<uint64_t>(k) * 10;
  consensus.maxBlockParents = std::max<uint32_t>(static_cast<uint32_t>(0.66 * k), 10);
}

void ChainParams::SetPruningDepth(uint64_t depth) {
  consensus.pruningDepth = depth != 0
                               ? depth
                               : std::max(consensus.finalityDepth,
                                          consensus.AnticoneFinalizationDepth());
}

void ChainParams::Finalize() {
  SetPruningDepth(0);
  consensus.hashGenesisBlock = genesis.GetHash();
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateSimNet() {
  return std::make_unique<CSimNetParams>();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.powLimit = uint256S(
      "00000000ffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.genesisBits = 0x1d00ffff;
  consensus.skipProofOfWork = false;

  consensus.ghostdagK = 18;
  consensus.mergesetSizeLimit = 180;
  consensus.maxBlockParents = 10;
  consensus.maxBlockLevel = 225;

  consensus.maxBlockMass = 500'000;
  consensus.maxBlockTxs = 10'000;

  consensus.finalityDepth = 86'400;  // 24 hours at 1 block per second
  consensus.mergeDepth = 3'600;      // 1 hour

  consensus.targetTimePerBlock = 1'000;
  consensus.timestampDeviationTolerance = 132;
  consensus.pastMedianTimeWindow = 11;

  genesis = CreateGenesisBlock(1761330012000ULL, consensus.genesisBits,
                               "blockdag mainnet genesis");
  Finalize();
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  consensus.powLimit = uint256S(
      "007fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.genesisBits = 0x1f7fffff;
  consensus.skipProofOfWork = false;

  consensus.ghostdagK = 18;
  consensus.mergesetSizeLimit = 180;
  consensus.maxBlockParents = 10;
  consensus.maxBlockLevel = 225;

  consensus.maxBlockMass = 500'000;
  consensus.maxBlockTxs = 10'000;

  consensus.finalityDepth = 86'400;
  consensus.mergeDepth = 3'600;

  consensus.targetTimePerBlock = 1'000;
  consensus.timestampDeviationTolerance = 132;
  consensus.pastMedianTimeWindow = 11;

  genesis = CreateGenesisBlock(1761330012000ULL, consensus.genesisBits,
                               "blockdag testnet genesis");
  Finalize();
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  consensus.powLimit = uint256S(
      "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.genesisBits = 0x207fffff;
  consensus.skipProofOfWork = true;

  consensus.ghostdagK = 18;
  consensus.mergesetSizeLimit = 180;
  consensus.maxBlockParents = 10;
  consensus.maxBlockLevel = 32;

  consensus.maxBlockMass = 500'000;
  consensus.maxBlockTxs = 10'000;

  // Short enough for unit tests to cross
  consensus.finalityDepth = 100;
  consensus.mergeDepth = 100;

  consensus.targetTimePerBlock = 1'000;
  consensus.timestampDeviationTolerance = 132;
  consensus.pastMedianTimeWindow = 11;

  genesis = CreateGenesisBlock(1700000000000ULL, consensus.genesisBits,
                               "blockdag regtest genesis");
  Finalize();
}

// ============================================================================
// SimNet Parameters
// ============================================================================

CSimNetParams::CSimNetParams() {
  chainType = ChainType::SIMNET;

  consensus.powLimit = uint256S(
      "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.genesisBits = 0x207fffff;
  consensus.skipProofOfWork = true;

  consensus.ghostdagK = 18;
  consensus.mergesetSizeLimit = 180;
  consensus.maxBlockParents = 10;
  consensus.maxBlockLevel = 32;

  consensus.maxBlockMass = 500'000;
  consensus.maxBlockTxs = 10'000;

  consensus.finalityDepth = 86'400;
  consensus.mergeDepth = 3'600;

  consensus.targetTimePerBlock = 1'000;
  consensus.timestampDeviationTolerance = 132;
  consensus.pastMedianTimeWindow = 11;

  // Simulated time starts at 1 ms so it never collides with "unset" (0)
  genesis = CreateGenesisBlock(1, consensus.genesisBits, "blockdag simnet genesis");
  Finalize();
}

} // namespace chain
} // namespace blockdag
