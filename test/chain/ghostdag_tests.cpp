// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// GHOSTDAG coloring and ordering as computed by the header stage

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include "test_blocks.hpp"
#include <algorithm>
#include <set>

using namespace blockdag;
using namespace blockdag::test;

namespace {

std::set<uint256> AsSet(const std::vector<uint256> &hashes) {
    return std::set<uint256>(hashes.begin(), hashes.end());
}

} // namespace

TEST_CASE("GHOSTDAG genesis data", "[ghostdag]") {
    auto params = chain::ChainParams::CreateRegTest();
    consensus::Consensus consensus(*params, TestConfig());

    auto data = consensus.GetGhostdagData(params->GenesisBlock().GetHash());
    REQUIRE(data != nullptr);
    REQUIRE(data->blue_score == 0);
    REQUIRE(data->blue_work == 0);
    REQUIRE(data->selected_parent.IsNull());
    REQUIRE(data->MergesetSize() == 0);
}

TEST_CASE("GHOSTDAG colors the third parallel block red with k=1", "[ghostdag]") {
    auto params = chain::ChainParams::CreateRegTest();
    params->SetGhostdagK(1);
    REQUIRE(params->GetConsensus().mergesetSizeLimit == 10);
    REQUIRE(params->GetConsensus().maxBlockParents == 10);

    consensus::Consensus consensus(*params, TestConfig());
    TestDag dag(*params);

    std::vector<uint256> parallel;
    for (int i = 0; i < 3; ++i) {
        CBlock block = dag.Block({dag.Genesis()});
        REQUIRE(SubmitAndWait(consensus, block).state.IsValid());
        parallel.push_back(block.GetHash());
    }

    CBlock merger = dag.Block(parallel);
    REQUIRE(SubmitAndWait(consensus, merger).state.IsValid());

    auto data = consensus.GetGhostdagData(merger.GetHash());
    REQUIRE(data != nullptr);
    REQUIRE(data->mergeset_blues.size() == 2);
    REQUIRE(data->mergeset_reds.size() == 1);
    REQUIRE(data->blue_score == 3);

    // Blues and reds partition the mergeset
    std::set<uint256> blues = AsSet(data->mergeset_blues);
    std::set<uint256> reds = AsSet(data->mergeset_reds);
    for (const auto &red : reds) {
        REQUIRE_FALSE(blues.count(red));
    }
    std::set<uint256> all = blues;
    all.insert(reds.begin(), reds.end());
    REQUIRE(all == AsSet(parallel));

    // Each blue in the mergeset has at most k blues in its anticone
    for (const auto &[blue, anticone_size] : data->blues_anticone_sizes) {
        REQUIRE(anticone_size <= 1);
    }

    // Selected parent is the parallel block with the highest (blue_work, hash)
    std::vector<uint256> sorted = parallel;
    std::sort(sorted.begin(), sorted.end());
    REQUIRE(data->selected_parent == sorted.back());
    REQUIRE(data->mergeset_blues.front() == data->selected_parent);
}

TEST_CASE("GHOSTDAG blue work grows along parent links", "[ghostdag]") {
    auto params = chain::ChainParams::CreateRegTest();
    consensus::Consensus consensus(*params, TestConfig());
    TestDag dag(*params);

    // Two short branches joined, then extended
    auto left = dag.Chain(dag.Genesis(), 3);
    auto right = dag.Chain(dag.Genesis(), 2);
    std::vector<CBlock> blocks = left;
    blocks.insert(blocks.end(), right.begin(), right.end());
    blocks.push_back(dag.Block({left.back().GetHash(), right.back().GetHash()}));
    auto tail = dag.Chain(blocks.back().GetHash(), 3);
    blocks.insert(blocks.end(), tail.begin(), tail.end());

    for (const auto &block : blocks) {
        REQUIRE(SubmitAndWait(consensus, block).state.IsValid());
    }

    for (const auto &block : blocks) {
        auto data = consensus.GetGhostdagData(block.GetHash());
        REQUIRE(data != nullptr);
        for (const auto &parent : block.header.DirectParents()) {
            auto parent_data = consensus.GetGhostdagData(parent);
            REQUIRE(parent_data != nullptr);
            REQUIRE(data->blue_work > parent_data->blue_work);
            REQUIRE(data->blue_score > parent_data->blue_score);
        }
        REQUIRE(data->MergesetSize() ==
                AsSet(data->mergeset_blues).size() + AsSet(data->mergeset_reds).size());
    }

    // The joining block merges the whole right branch
    auto join = consensus.GetGhostdagData(blocks[5].GetHash());
    REQUIRE(join->selected_parent == left.back().GetHash());
    REQUIRE(join->mergeset_blues.size() == 3);
    REQUIRE(join->mergeset_reds.empty());
    REQUIRE(join->blue_score == 6);
    REQUIRE(consensus.GetSink() == tail.back().GetHash());
}

TEST_CASE("Merging past the mergeset limit is rejected", "[ghostdag][invalid]") {
    auto params = chain::ChainParams::CreateRegTest();
    params->SetGhostdagK(1);
    params->SetMergesetSizeLimit(2);
    consensus::Consensus consensus(*params, TestConfig());
    TestDag dag(*params);

    std::vector<uint256> parallel;
    for (int i = 0; i < 3; ++i) {
        CBlock block = dag.Block({dag.Genesis()});
        REQUIRE(SubmitAndWait(consensus, block).state.IsValid());
        parallel.push_back(block.GetHash());
    }

    CBlock merger = dag.Block(parallel);
    auto result = SubmitAndWait(consensus, merger);
    REQUIRE(result.status == chain::BlockStatus::Invalid);
    REQUIRE(result.state.GetRejectReason() == "violating-mergeset-limit");
}
