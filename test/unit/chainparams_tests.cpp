// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test suite for chain parameters

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include <stdexcept>

using namespace blockdag::chain;

TEST_CASE("ChainParams creation", "[chainparams]") {
    SECTION("Create MainNet") {
        auto params = ChainParams::CreateMainNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::MAIN);
        REQUIRE(params->GetChainTypeString() == "main");

        const auto& consensus = params->GetConsensus();
        REQUIRE_FALSE(consensus.skipProofOfWork);
        REQUIRE(consensus.ghostdagK == 18);
        REQUIRE(consensus.finalityDepth == 86'400);
        REQUIRE(consensus.targetTimePerBlock == 1'000);
    }

    SECTION("Create TestNet") {
        auto params = ChainParams::CreateTestNet();
        REQUIRE(params->GetChainType() == ChainType::TESTNET);
        REQUIRE(params->GetChainTypeString() == "test");
    }

    SECTION("Create RegTest") {
        auto params = ChainParams::CreateRegTest();
        REQUIRE(params->GetChainType() == ChainType::REGTEST);
        REQUIRE(params->GetChainTypeString() == "regtest");

        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.skipProofOfWork);
        REQUIRE(consensus.mergesetSizeLimit == 180);
        REQUIRE(consensus.maxBlockParents == 10);
        REQUIRE(consensus.finalityDepth == 100);
        REQUIRE(consensus.pastMedianTimeWindow == 11);
    }

    SECTION("Create SimNet") {
        auto params = ChainParams::CreateSimNet();
        REQUIRE(params->GetChainType() == ChainType::SIMNET);
        REQUIRE(params->GetChainTypeString() == "simnet");
        REQUIRE(params->GenesisBlock().header.nTime == 1);
    }
}

TEST_CASE("Genesis block creation", "[chainparams]") {
    auto params = ChainParams::CreateRegTest();
    const auto& genesis = params->GenesisBlock();

    SECTION("Genesis block properties") {
        REQUIRE(genesis.header.nVersion == 1);
        REQUIRE(genesis.header.DirectParents().empty());
        REQUIRE(genesis.header.nTime == 1'700'000'000'000ULL);
        REQUIRE(genesis.header.nBits == params->GetConsensus().genesisBits);
        REQUIRE(genesis.header.hashMerkleRoot == BlockMerkleRoot(genesis.vtx));
    }

    SECTION("Genesis outputs") {
        REQUIRE(genesis.vtx.size() == 1);
        const auto& tx = genesis.vtx.front();
        REQUIRE(tx.IsCoinbase());
        REQUIRE(tx.vout.size() == 16);
        for (const auto& out : tx.vout) {
            REQUIRE(out.nValue == 50LL * 100'000'000LL);
            REQUIRE(out.scriptPubKey == std::vector<uint8_t>{0x51});
        }
    }

    SECTION("Genesis hash") {
        uint256 hash = genesis.GetHash();
        REQUIRE(!hash.IsNull());
        REQUIRE(params->GetConsensus().hashGenesisBlock == hash);
    }

    SECTION("Networks have distinct genesis blocks") {
        auto main = ChainParams::CreateMainNet();
        auto test = ChainParams::CreateTestNet();
        REQUIRE(main->GenesisBlock().GetHash() != test->GenesisBlock().GetHash());
        REQUIRE(main->GenesisBlock().GetHash() != genesis.GetHash());
    }
}

TEST_CASE("GHOSTDAG k from network delay", "[chainparams][ghostdag]") {
    // Poisson tail below delta
    REQUIRE(CalculateGhostdagK(0.1, 0.05) == 1);
    REQUIRE(CalculateGhostdagK(2.0, 0.05) == 5);

    // Monotonic in the expected number of blocks per delay window
    uint32_t previous = 0;
    for (double x : {1.0, 4.0, 10.0, 20.0}) {
        uint32_t k = CalculateGhostdagK(x, 0.01);
        REQUIRE(k >= previous);
        previous = k;
    }

    REQUIRE_THROWS_AS(CalculateGhostdagK(0.0, 0.05), std::invalid_argument);
    REQUIRE_THROWS_AS(CalculateGhostdagK(2.0, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(CalculateGhostdagK(2.0, 1.0), std::invalid_argument);
}

TEST_CASE("Parameter overrides", "[chainparams]") {
    auto params = ChainParams::CreateRegTest();
    const auto& consensus = params->GetConsensus();

    SECTION("SetGhostdagK derives the mergeset limit and parent count") {
        params->SetGhostdagK(40);
        REQUIRE(consensus.ghostdagK == 40);
        REQUIRE(consensus.mergesetSizeLimit == 400);
        REQUIRE(consensus.maxBlockParents == 26);

        params->SetGhostdagK(5);
        REQUIRE(consensus.mergesetSizeLimit == 50);
        REQUIRE(consensus.maxBlockParents == 10);
    }

    SECTION("Pruning depth defaults to the anticone finalization depth") {
        // 100 + 100 + 4 * 180 * 18 + 2 * 18 + 2
        REQUIRE(consensus.AnticoneFinalizationDepth() == 13'198);
        REQUIRE(consensus.pruningDepth == 13'198);

        params->SetPruningDepth(10);
        REQUIRE(consensus.pruningDepth == 10);

        params->SetFinalityDepth(20'000);
        params->SetPruningDepth(0);
        REQUIRE(consensus.pruningDepth == consensus.AnticoneFinalizationDepth());
    }

    SECTION("Timing and mass") {
        params->SetTargetTimePerBlock(100);
        params->SetMaxBlockMass(1'000);
        REQUIRE(consensus.targetTimePerBlock == 100);
        REQUIRE(consensus.MaxFutureBlockTime() == 132 * 100);
        REQUIRE(consensus.maxBlockMass == 1'000);
    }
}
