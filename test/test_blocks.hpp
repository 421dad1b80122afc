// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Block builders shared by the pipeline and chain tests

#pragma once

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "consensus/consensus.hpp"
#include "pipeline/block_task.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <vector>

namespace blockdag {
namespace test {

// Output-only transaction made unique by `id`
inline CTransaction MakeTx(uint64_t id, int64_t value = 1000) {
    CTransaction tx;
    tx.nVersion = 1;
    CTxOut out;
    out.nValue = value;
    out.scriptPubKey = {0x51};
    tx.vout.push_back(out);
    for (int i = 0; i < 8; ++i) {
        tx.payload.push_back(static_cast<uint8_t>(id >> (8 * i)));
    }
    return tx;
}

// Spend `prevout` into a single output of `value`
inline CTransaction MakeSpend(const COutPoint& prevout, int64_t value) {
    CTransaction tx;
    tx.nVersion = 1;
    CTxIn in;
    in.prevout = prevout;
    tx.vin.push_back(in);
    CTxOut out;
    out.nValue = value;
    out.scriptPubKey = {0x51};
    tx.vout.push_back(out);
    return tx;
}

// Output `n` of the genesis transaction
inline COutPoint GenesisOutpoint(const chain::ChainParams& params, uint32_t n) {
    return COutPoint(params.GenesisBlock().vtx.front().GetHash(), n);
}

/**
 * TestDag - block factory on top of a chain's genesis
 *
 * Every block gets a fresh nonce and a timestamp one second after the
 * previous block built here, so timestamps always clear the past median
 * time and siblings never collide.
 */
class TestDag {
public:
    explicit TestDag(const chain::ChainParams& params)
        : params_(params), next_time_(params.GenesisBlock().header.nTime) {}

    uint256 Genesis() const { return params_.GenesisBlock().GetHash(); }

    CBlock Block(const std::vector<uint256>& parents, std::vector<CTransaction> txs = {}) {
        CBlock block;
        block.header.nVersion = 1;
        block.header.parentsByLevel = {parents};
        block.header.nBits = params_.GetConsensus().genesisBits;
        block.header.nNonce = next_nonce_++;
        next_time_ += 1000;
        block.header.nTime = next_time_;
        block.vtx = std::move(txs);
        block.header.hashMerkleRoot = BlockMerkleRoot(block.vtx);
        return block;
    }

    // Chain of `length` blocks on top of `base`, each with `txs_per_block`
    // output-only transactions
    std::vector<CBlock> Chain(const uint256& base, size_t length, size_t txs_per_block = 0) {
        std::vector<CBlock> blocks;
        uint256 parent = base;
        for (size_t i = 0; i < length; ++i) {
            std::vector<CTransaction> txs;
            for (size_t j = 0; j < txs_per_block; ++j) {
                txs.push_back(MakeTx(next_tx_id_++));
            }
            blocks.push_back(Block({parent}, std::move(txs)));
            parent = blocks.back().GetHash();
        }
        return blocks;
    }

private:
    const chain::ChainParams& params_;
    uint64_t next_time_;
    uint64_t next_nonce_{1};
    uint64_t next_tx_id_{1};
};

// Submit and wait until the virtual processor handled the block
inline pipeline::BlockProcessResult SubmitAndWait(consensus::Consensus& consensus,
                                                  const CBlock& block) {
    return consensus.ValidateAndInsertBlock(block).virtual_state_task.get();
}

template <typename T>
bool IsReady(const std::shared_future<T>& future,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
    return future.wait_for(timeout) == std::future_status::ready;
}

// Small pools keep the tests deterministic enough and fast
inline consensus::ConsensusConfig TestConfig(bool enable_pruning = false) {
    consensus::ConsensusConfig config;
    config.processing_threads = 2;
    config.enable_pruning = enable_pruning;
    return config;
}

} // namespace test
} // namespace blockdag
