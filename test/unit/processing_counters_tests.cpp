// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "pipeline/processing_counters.hpp"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace blockdag::pipeline;

TEST_CASE("ProcessingCounters snapshot", "[pipeline][counters]") {
    ProcessingCounters counters;
    REQUIRE(counters.Snapshot() == ProcessingCountersSnapshot{});

    counters.blocks_submitted += 3;
    counters.header_counts += 2;
    counters.dep_counts += 4;
    counters.body_counts += 1;
    counters.txs_counts += 7;
    counters.chain_block_counts += 1;
    counters.mass_counts += 900;

    auto snapshot = counters.Snapshot();
    REQUIRE(snapshot.blocks_submitted == 3);
    REQUIRE(snapshot.header_counts == 2);
    REQUIRE(snapshot.dep_counts == 4);
    REQUIRE(snapshot.body_counts == 1);
    REQUIRE(snapshot.txs_counts == 7);
    REQUIRE(snapshot.chain_block_counts == 1);
    REQUIRE(snapshot.mass_counts == 900);

    REQUIRE(snapshot.ToString() ==
            "blocks_submitted=3 headers=2 deps=4 bodies=1 txs=7 chain_blocks=1 mass=900");
}

TEST_CASE("ProcessingCountersSnapshot difference", "[pipeline][counters]") {
    ProcessingCounters counters;
    counters.header_counts += 5;
    counters.mass_counts += 100;
    auto earlier = counters.Snapshot();

    counters.header_counts += 3;
    counters.mass_counts += 50;
    auto later = counters.Snapshot();

    SECTION("Later minus earlier is the activity in between") {
        auto delta = later - earlier;
        REQUIRE(delta.header_counts == 3);
        REQUIRE(delta.mass_counts == 50);
        REQUIRE(delta.body_counts == 0);
    }

    SECTION("Snapshot minus itself is zero") {
        REQUIRE(later - later == ProcessingCountersSnapshot{});
    }

    SECTION("Reversed order throws instead of wrapping") {
        REQUIRE_THROWS_AS(earlier - later, std::invalid_argument);
    }
}

TEST_CASE("ProcessingCounters concurrent increments", "[pipeline][counters]") {
    ProcessingCounters counters;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&counters]() {
            for (int i = 0; i < 1000; ++i) {
                counters.txs_counts.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(counters.Snapshot().txs_counts == 8000);
}
