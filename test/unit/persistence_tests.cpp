// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// DAG export and re-import through the pipeline

#include <catch2/catch_test_macros.hpp>
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include "test_blocks.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace blockdag;
using namespace blockdag::test;
using chain::BlockManager;
using chain::BlockStatus;

namespace {

std::filesystem::path TestDir() {
    auto dir = std::filesystem::temp_directory_path() / "blockdag_persistence_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<uint256> Sorted(std::vector<uint256> hashes) {
    std::sort(hashes.begin(), hashes.end());
    return hashes;
}

} // namespace

TEST_CASE("BlockManager persistence", "[persistence][chain]") {
    auto params = chain::ChainParams::CreateRegTest();
    auto dir = TestDir();
    const auto file = (dir / "blocks.json").string();

    TestDag dag(*params);
    consensus::Consensus original(*params, TestConfig());

    // G <- main chain of 4 (with transactions), G <- side, merge of both tips
    auto main_chain = dag.Chain(dag.Genesis(), 4, 2);
    CBlock side = dag.Block({dag.Genesis()}, {MakeSpend(GenesisOutpoint(*params, 3), 1000)});
    CBlock merge = dag.Block({main_chain.back().GetHash(), side.GetHash()});
    for (const auto& block : main_chain) {
        SubmitAndWait(original, block);
    }
    SubmitAndWait(original, side);
    REQUIRE(SubmitAndWait(original, merge).status == BlockStatus::UTXOValid);

    // Pending blocks have no body yet and are not exported
    CBlock orphan = dag.Block({uint256S("ee")});
    original.ValidateAndInsertBlock(orphan);
    REQUIRE(original.IsPending(orphan.GetHash()));

    REQUIRE(original.SaveBlocks(file));
    REQUIRE(std::filesystem::exists(file));

    SECTION("Loaded blocks are ordered parents first, genesis excluded") {
        std::vector<CBlock> loaded;
        REQUIRE(BlockManager::LoadBlocks(file, dag.Genesis(), loaded));
        REQUIRE(loaded.size() == 6);

        std::vector<uint256> seen{dag.Genesis()};
        for (const auto& block : loaded) {
            REQUIRE(block.GetHash() != dag.Genesis());
            REQUIRE(block.GetHash() != orphan.GetHash());
            for (const auto& parent : block.header.DirectParents()) {
                REQUIRE(std::find(seen.begin(), seen.end(), parent) != seen.end());
            }
            seen.push_back(block.GetHash());
        }

        auto side_it = std::find_if(loaded.begin(), loaded.end(),
                                    [&](const CBlock& b) { return b.GetHash() == side.GetHash(); });
        REQUIRE(side_it != loaded.end());
        REQUIRE(side_it->vtx.size() == 1);
        REQUIRE(side_it->vtx[0].vin[0].prevout == GenesisOutpoint(*params, 3));
    }

    SECTION("Replay reproduces the DAG") {
        std::vector<CBlock> loaded;
        REQUIRE(BlockManager::LoadBlocks(file, dag.Genesis(), loaded));

        consensus::Consensus replayed(*params, TestConfig());
        std::vector<pipeline::BlockValidationFutures> futures;
        for (const auto& block : loaded) {
            futures.push_back(replayed.ValidateAndInsertBlock(block));
        }
        for (auto& f : futures) {
            REQUIRE(f.virtual_state_task.get().state.IsValid());
        }

        REQUIRE(replayed.GetSink() == original.GetSink());
        REQUIRE(Sorted(replayed.GetTips()) == Sorted(original.GetTips()));
        REQUIRE(replayed.GetSelectedChain() == original.GetSelectedChain());
        REQUIRE(replayed.GetUtxoCount() == original.GetUtxoCount());
        REQUIRE(replayed.GetBlockCount() == 7);
    }

    SECTION("Wrong network genesis is refused") {
        auto mainnet = chain::ChainParams::CreateMainNet();
        std::vector<CBlock> loaded;
        REQUIRE_FALSE(BlockManager::LoadBlocks(file, mainnet->GenesisBlock().GetHash(), loaded));
        REQUIRE(loaded.empty());
    }

    SECTION("Unsupported format version is refused") {
        auto contents = util::read_file_string(file);
        REQUIRE(contents.has_value());
        auto root = nlohmann::json::parse(*contents);
        root["version"] = 2;
        REQUIRE(util::atomic_write_file(file, root.dump()));

        std::vector<CBlock> loaded;
        REQUIRE_FALSE(BlockManager::LoadBlocks(file, dag.Genesis(), loaded));
    }

    SECTION("Tampered block is refused") {
        auto contents = util::read_file_string(file);
        REQUIRE(contents.has_value());
        auto root = nlohmann::json::parse(*contents);
        root["blocks"][1]["nonce"] = 999999;
        REQUIRE(util::atomic_write_file(file, root.dump()));

        std::vector<CBlock> loaded;
        REQUIRE_FALSE(BlockManager::LoadBlocks(file, dag.Genesis(), loaded));
    }

    SECTION("Malformed or missing files are refused") {
        std::vector<CBlock> loaded;
        REQUIRE(util::atomic_write_file(file, "{ not json"));
        REQUIRE_FALSE(BlockManager::LoadBlocks(file, dag.Genesis(), loaded));
        REQUIRE_FALSE(BlockManager::LoadBlocks((dir / "missing.json").string(), dag.Genesis(),
                                               loaded));
    }

    original.Shutdown();
    std::filesystem::remove_all(dir);
}
