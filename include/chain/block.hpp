// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

// Mass weights (block mass is the sum of transaction masses)
static constexpr uint64_t MASS_PER_TX_BYTE = 1;
static constexpr uint64_t MASS_PER_SCRIPT_PUB_KEY_BYTE = 10;

// Largest amount a single output (or a transaction's outputs) may carry
static constexpr int64_t MAX_MONEY = 29'000'000'000LL * 100'000'000LL;

// COutPoint - Reference to a transaction output
struct COutPoint {
  uint256 hash{};
  uint32_t n{0};

  COutPoint() = default;
  COutPoint(const uint256 &hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

  friend bool operator<(const COutPoint &a, const COutPoint &b) {
    int cmp = a.hash.Compare(b.hash);
    return cmp < 0 || (cmp == 0 && a.n < b.n);
  }
  friend bool operator==(const COutPoint &a, const COutPoint &b) {
    return a.hash == b.hash && a.n == b.n;
  }
  friend bool operator!=(const COutPoint &a, const COutPoint &b) {
    return !(a == b);
  }

  [[nodiscard]] std::string ToString() const;
};

// CTxIn - Spends a previous output. Scripts are carried, not executed.
struct CTxIn {
  COutPoint prevout;
  std::vector<uint8_t> signatureScript;
  uint64_t nSequence{0};
};

// CTxOut - Value plus locking script
struct CTxOut {
  int64_t nValue{0};
  std::vector<uint8_t> scriptPubKey;
};

// CTransaction - A transaction with no inputs only creates outputs
class CTransaction {
public:
  int32_t nVersion{1};
  std::vector<CTxIn> vin;
  std::vector<CTxOut> vout;
  uint64_t nLockTime{0};
  std::vector<uint8_t> payload;

  [[nodiscard]] bool IsCoinbase() const noexcept { return vin.empty(); }

  [[nodiscard]] uint256 GetHash() const;

  // Size of the canonical hashing serialization
  [[nodiscard]] uint64_t GetSerializedSize() const;

  // size * MASS_PER_TX_BYTE + script bytes * MASS_PER_SCRIPT_PUB_KEY_BYTE
  [[nodiscard]] uint64_t GetMass() const;

  [[nodiscard]] std::string ToString() const;
};

// CBlockHeader - DAG block header
//
// Unlike a chain header there is no single hashPrevBlock: parentsByLevel[0]
// holds the direct parents, higher levels hold the parents a block claims at
// each proof level. nTime is in Unix milliseconds.
class CBlockHeader
{
public:
    int32_t nVersion{0};
    std::vector<std::vector<uint256>> parentsByLevel{};
    uint256 hashMerkleRoot{};
    uint64_t nTime{0};
    uint32_t nBits{0};
    uint64_t nNonce{0};

    void SetNull() noexcept
    {
        nVersion = 0;
        parentsByLevel.clear();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce = 0;
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return nTime == 0 && nBits == 0 && nNonce == 0 && parentsByLevel.empty() &&
               hashMerkleRoot.IsNull();
    }

    // Level-0 parents (empty for genesis)
    [[nodiscard]] const std::vector<uint256> &DirectParents() const noexcept;

    // Compute the hash of this header
    [[nodiscard]] uint256 GetHash() const;

    [[nodiscard]] int64_t GetBlockTime() const noexcept
    {
        return static_cast<int64_t>(nTime);
    }

    [[nodiscard]] std::string ToString() const;
};

// CBlock - Header plus transaction body
class CBlock
{
public:
    CBlockHeader header;
    std::vector<CTransaction> vtx;

    CBlock() = default;
    explicit CBlock(CBlockHeader headerIn) : header(std::move(headerIn)) {}

    [[nodiscard]] uint256 GetHash() const { return header.GetHash(); }

    // Sum of transaction masses
    [[nodiscard]] uint64_t GetMass() const;

    [[nodiscard]] std::string ToString() const;
};

// Merkle root over transaction hashes (odd levels duplicate their last node).
// An empty body commits to the null hash.
[[nodiscard]] uint256 BlockMerkleRoot(const std::vector<CTransaction> &vtx);
