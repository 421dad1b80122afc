// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include "consensus/notifications.hpp"
#include "test_blocks.hpp"
#include <mutex>
#include <vector>

using namespace blockdag;
using namespace blockdag::test;
using blockdag::chain::BlockStatus;
using blockdag::consensus::ConsensusNotifications;

TEST_CASE("Notifications - Subscription RAII cleanup", "[notifications]") {
    ConsensusNotifications notifications;
    int calls = 0;

    SECTION("Destroyed subscription stops delivery") {
        {
            auto sub = notifications.SubscribeBlockAdded(
                [&](const uint256&, BlockStatus) { ++calls; });
            notifications.NotifyBlockAdded(uint256S("01"), BlockStatus::UTXOPendingVerification);
            REQUIRE(calls == 1);
        }
        notifications.NotifyBlockAdded(uint256S("02"), BlockStatus::UTXOPendingVerification);
        REQUIRE(calls == 1);
    }

    SECTION("Explicit unsubscribe is idempotent") {
        auto sub = notifications.SubscribeBlockAdded([&](const uint256&, BlockStatus) { ++calls; });
        sub.Unsubscribe();
        sub.Unsubscribe();
        notifications.NotifyBlockAdded(uint256S("01"), BlockStatus::UTXOPendingVerification);
        REQUIRE(calls == 0);
    }

    SECTION("Moved subscription keeps the callback alive") {
        ConsensusNotifications::Subscription outer;
        {
            auto inner = notifications.SubscribeBlockAdded(
                [&](const uint256&, BlockStatus) { ++calls; });
            outer = std::move(inner);
        }
        notifications.NotifyBlockAdded(uint256S("01"), BlockStatus::UTXOPendingVerification);
        REQUIRE(calls == 1);

        // Move-assigning over a live subscription releases the old one
        int other_calls = 0;
        outer = notifications.SubscribeBlockAdded(
            [&](const uint256&, BlockStatus) { ++other_calls; });
        notifications.NotifyBlockAdded(uint256S("02"), BlockStatus::UTXOPendingVerification);
        REQUIRE(calls == 1);
        REQUIRE(other_calls == 1);
    }
}

TEST_CASE("Notifications - events reach only their own subscribers", "[notifications]") {
    ConsensusNotifications notifications;
    int block_added = 0;
    int chain_changed = 0;
    int pruned = 0;

    auto s1 = notifications.SubscribeBlockAdded([&](const uint256&, BlockStatus) { ++block_added; });
    auto s2 = notifications.SubscribeVirtualChainChanged(
        [&](const std::vector<uint256>& added, const std::vector<uint256>& removed) {
            chain_changed += static_cast<int>(added.size() + removed.size());
        });
    auto s3 = notifications.SubscribePruningPointAdvanced(
        [&](const pipeline::PruningPointInfo& info) { pruned += static_cast<int>(info.blue_score); });
    auto s4 = notifications.SubscribeBlockAdded([&](const uint256&, BlockStatus) { ++block_added; });

    notifications.NotifyBlockAdded(uint256S("01"), BlockStatus::UTXOPendingVerification);
    notifications.NotifyVirtualChainChanged({uint256S("01"), uint256S("02")}, {uint256S("03")});
    notifications.NotifyPruningPointAdvanced({uint256S("04"), 40});

    REQUIRE(block_added == 2);
    REQUIRE(chain_changed == 3);
    REQUIRE(pruned == 40);
}

TEST_CASE("Notifications - consensus pipeline events", "[notifications][consensus]") {
    auto params = chain::ChainParams::CreateRegTest();
    TestDag dag(*params);
    consensus::Consensus consensus(*params, TestConfig());

    std::mutex mutex;
    std::vector<std::pair<uint256, BlockStatus>> added_blocks;
    std::vector<uint256> connected;

    auto block_sub = consensus.Notifications().SubscribeBlockAdded(
        [&](const uint256& hash, BlockStatus status) {
            std::lock_guard<std::mutex> lock(mutex);
            added_blocks.emplace_back(hash, status);
        });
    auto chain_sub = consensus.Notifications().SubscribeVirtualChainChanged(
        [&](const std::vector<uint256>& added, const std::vector<uint256>&) {
            std::lock_guard<std::mutex> lock(mutex);
            connected.insert(connected.end(), added.begin(), added.end());
        });

    auto blocks = dag.Chain(dag.Genesis(), 3);
    for (const auto& block : blocks) {
        SubmitAndWait(consensus, block);
    }

    SECTION("Every accepted body is announced once, pending verification") {
        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(added_blocks.size() == 3);
        for (size_t i = 0; i < blocks.size(); ++i) {
            REQUIRE(added_blocks[i].first == blocks[i].GetHash());
            REQUIRE(added_blocks[i].second == BlockStatus::UTXOPendingVerification);
        }
    }

    SECTION("Chain blocks are connected oldest first") {
        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(connected == std::vector<uint256>{blocks[0].GetHash(), blocks[1].GetHash(),
                                                  blocks[2].GetHash()});
    }

    SECTION("Rejected blocks are not announced") {
        CBlock bad = dag.Block({blocks.back().GetHash()}, {MakeTx(1)});
        bad.header.hashMerkleRoot = uint256S("01");
        REQUIRE(SubmitAndWait(consensus, bad).status == BlockStatus::Invalid);

        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(added_blocks.size() == 3);
    }

    consensus.Shutdown();
}
