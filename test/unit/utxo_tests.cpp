// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// UTXO diffs, transaction application and the in-memory UTXO store

#include <catch2/catch_test_macros.hpp>
#include "chain/memory_stores.hpp"
#include "chain/utxo.hpp"
#include "chain/validation.hpp"
#include "test_blocks.hpp"

using namespace blockdag;
using namespace blockdag::chain;
using blockdag::test::MakeSpend;
using blockdag::test::MakeTx;
using blockdag::validation::ValidationState;

namespace {

UtxoEntry Entry(int64_t amount, uint64_t blue_score = 0) {
    UtxoEntry entry;
    entry.amount = amount;
    entry.scriptPubKey = {0x51};
    entry.blockBlueScore = blue_score;
    return entry;
}

// Store holding one funded output
struct FundedStore {
    MemoryUtxoStore store;
    COutPoint funded{uint256S("aa"), 0};

    FundedStore() {
        UtxoDiff diff;
        diff.Add(funded, Entry(5000));
        store.Apply(diff);
    }
};

} // namespace

TEST_CASE("UtxoDiff lookup through layers", "[utxo]") {
    FundedStore base;
    UtxoDiff diff;

    SECTION("Base entries are visible until spent") {
        auto entry = diff.Lookup(base.funded, base.store);
        REQUIRE(entry.has_value());
        REQUIRE(entry->amount == 5000);

        diff.Spend(base.funded, *entry);
        REQUIRE_FALSE(diff.Lookup(base.funded, base.store).has_value());
        REQUIRE(diff.removed.count(base.funded) == 1);
        REQUIRE(diff.added.empty());
    }

    SECTION("Added entries shadow the base") {
        COutPoint created(uint256S("bb"), 1);
        diff.Add(created, Entry(10));
        REQUIRE(diff.Lookup(created, base.store)->amount == 10);
        REQUIRE_FALSE(diff.IsEmpty());
    }

    SECTION("Created then spent in the same diff cancels out") {
        COutPoint created(uint256S("bb"), 1);
        diff.Add(created, Entry(10));
        diff.Spend(created, Entry(10));
        REQUIRE(diff.IsEmpty());
        REQUIRE_FALSE(diff.Lookup(created, base.store).has_value());
    }
}

TEST_CASE("ApplyTransaction", "[utxo]") {
    FundedStore base;
    UtxoDiff diff;
    ValidationState state;

    SECTION("Output-only transaction creates entries at the blue score") {
        CTransaction tx = MakeTx(1, 700);
        REQUIRE(ApplyTransaction(tx, base.store, diff, 9, state));

        auto entry = diff.Lookup(COutPoint(tx.GetHash(), 0), base.store);
        REQUIRE(entry.has_value());
        REQUIRE(entry->amount == 700);
        REQUIRE(entry->blockBlueScore == 9);
        REQUIRE(entry->isCoinbase);
    }

    SECTION("Spend moves value from the input to the outputs") {
        CTransaction tx = MakeSpend(base.funded, 4000);
        REQUIRE(ApplyTransaction(tx, base.store, diff, 3, state));

        REQUIRE(diff.removed.count(base.funded) == 1);
        auto entry = diff.Lookup(COutPoint(tx.GetHash(), 0), base.store);
        REQUIRE(entry.has_value());
        REQUIRE_FALSE(entry->isCoinbase);
        REQUIRE(entry->blockBlueScore == 3);
    }

    SECTION("Chained spends inside one diff") {
        CTransaction first = MakeSpend(base.funded, 4000);
        CTransaction second = MakeSpend(COutPoint(first.GetHash(), 0), 3000);
        REQUIRE(ApplyTransaction(first, base.store, diff, 1, state));
        REQUIRE(ApplyTransaction(second, base.store, diff, 1, state));

        // The intermediate output never reaches the diff
        REQUIRE(diff.added.size() == 1);
        REQUIRE(diff.added.count(COutPoint(second.GetHash(), 0)) == 1);
        REQUIRE(diff.removed.size() == 1);
    }

    SECTION("Missing input") {
        CTransaction tx = MakeSpend(COutPoint(uint256S("cc"), 0), 1);
        REQUIRE_FALSE(ApplyTransaction(tx, base.store, diff, 1, state));
        REQUIRE(state.GetRejectReason() == "missing-or-spent-input");
        REQUIRE(diff.IsEmpty());
    }

    SECTION("Double spend across transactions") {
        REQUIRE(ApplyTransaction(MakeSpend(base.funded, 100), base.store, diff, 1, state));
        UtxoDiff before = diff;

        REQUIRE_FALSE(ApplyTransaction(MakeSpend(base.funded, 200), base.store, diff, 1, state));
        REQUIRE(state.GetRejectReason() == "missing-or-spent-input");
        REQUIRE(diff.added == before.added);
        REQUIRE(diff.removed == before.removed);
    }

    SECTION("Outputs above inputs") {
        CTransaction tx = MakeSpend(base.funded, 5001);
        REQUIRE_FALSE(ApplyTransaction(tx, base.store, diff, 1, state));
        REQUIRE(state.GetRejectReason() == "bad-txns-in-belowout");
        REQUIRE(diff.IsEmpty());
    }

    SECTION("Same transaction accepted twice") {
        CTransaction tx = MakeTx(7);
        REQUIRE(ApplyTransaction(tx, base.store, diff, 1, state));
        REQUIRE_FALSE(ApplyTransaction(tx, base.store, diff, 2, state));
        REQUIRE(state.GetRejectReason() == "tx-already-accepted");
    }
}

TEST_CASE("MemoryUtxoStore apply and revert", "[utxo][stores]") {
    FundedStore base;
    REQUIRE(base.store.Size() == 1);

    UtxoDiff diff;
    ValidationState state;
    CTransaction tx = MakeSpend(base.funded, 4000);
    REQUIRE(ApplyTransaction(tx, base.store, diff, 1, state));

    base.store.Apply(diff);
    REQUIRE(base.store.Size() == 1);
    REQUIRE_FALSE(base.store.Get(base.funded).has_value());
    REQUIRE(base.store.Get(COutPoint(tx.GetHash(), 0)).has_value());

    SECTION("Revert restores the previous set") {
        base.store.Revert(diff);
        REQUIRE(base.store.Get(base.funded) == Entry(5000));
        REQUIRE_FALSE(base.store.Get(COutPoint(tx.GetHash(), 0)).has_value());
    }

    SECTION("Applying twice is a store error and changes nothing") {
        REQUIRE_THROWS_AS(base.store.Apply(diff), StoreError);
        REQUIRE(base.store.Size() == 1);
        REQUIRE(base.store.Get(COutPoint(tx.GetHash(), 0)).has_value());
    }
}
