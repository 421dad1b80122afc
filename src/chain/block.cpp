// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block.hpp"
#include "util/hash.hpp"
#include "util/time.hpp"
#include <sstream>

namespace {

void WriteTransaction(blockdag::util::HashWriter &writer, const CTransaction &tx) {
  writer.WriteU32(static_cast<uint32_t>(tx.nVersion));
  writer.WriteU64(tx.vin.size());
  for (const auto &in : tx.vin) {
    writer.WriteHash(in.prevout.hash);
    writer.WriteU32(in.prevout.n);
    writer.WriteBytes(in.signatureScript);
    writer.WriteU64(in.nSequence);
  }
  writer.WriteU64(tx.vout.size());
  for (const auto &out : tx.vout) {
    writer.WriteI64(out.nValue);
    writer.WriteBytes(out.scriptPubKey);
  }
  writer.WriteU64(tx.nLockTime);
  writer.WriteBytes(tx.payload);
}

const std::vector<uint256> kNoParents;

} // namespace

std::string COutPoint::ToString() const {
  return hash.ToShortString() + ":" + std::to_string(n);
}

uint256 CTransaction::GetHash() const {
  blockdag::util::HashWriter writer;
  WriteTransaction(writer, *this);
  return writer.GetHash();
}

uint64_t CTransaction::GetSerializedSize() const {
  blockdag::util::HashWriter writer;
  WriteTransaction(writer, *this);
  return writer.size();
}

uint64_t CTransaction::GetMass() const {
  uint64_t script_bytes = 0;
  for (const auto &out : vout) {
    script_bytes += out.scriptPubKey.size();
  }
  return GetSerializedSize() * MASS_PER_TX_BYTE +
         script_bytes * MASS_PER_SCRIPT_PUB_KEY_BYTE;
}

std::string CTransaction::ToString() const {
  std::stringstream s;
  s << "CTransaction(hash=" << GetHash().ToShortString()
    << ", ver=" << nVersion
    << ", vin.size=" << vin.size()
    << ", vout.size=" << vout.size()
    << ", payload=" << payload.size() << " bytes)";
  return s.str();
}

const std::vector<uint256> &CBlockHeader::DirectParents() const noexcept {
  return parentsByLevel.empty() ? kNoParents : parentsByLevel.front();
}

uint256 CBlockHeader::GetHash() const {
  blockdag::util::HashWriter writer;
  writer.WriteU32(static_cast<uint32_t>(nVersion));
  writer.WriteU64(parentsByLevel.size());
  for (const auto &level : parentsByLevel) {
    writer.WriteU64(level.size());
    for (const auto &parent : level) {
      writer.WriteHash(parent);
    }
  }
  writer.WriteHash(hashMerkleRoot);
  writer.WriteU64(nTime);
  writer.WriteU32(nBits);
  writer.WriteU64(nNonce);
  return writer.GetHash();
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(hash=" << GetHash().ToShortString()
    << ", ver=0x" << std::hex << nVersion << std::dec
    << ", parents=[";
  const auto &parents = DirectParents();
  for (size_t i = 0; i < parents.size(); ++i) {
    s << (i ? "," : "") << parents[i].ToShortString();
  }
  s << "], levels=" << parentsByLevel.size()
    << ", hashMerkleRoot=" << hashMerkleRoot.ToShortString()
    << ", nTime=" << blockdag::util::FormatTimeMillis(static_cast<int64_t>(nTime))
    << ", nBits=0x" << std::hex << nBits << std::dec
    << ", nNonce=" << nNonce << ")";
  return s.str();
}

uint64_t CBlock::GetMass() const {
  uint64_t mass = 0;
  for (const auto &tx : vtx) {
    mass += tx.GetMass();
  }
  return mass;
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(" << header.ToString() << ", vtx=" << vtx.size() << ")";
  return s.str();
}

uint256 BlockMerkleRoot(const std::vector<CTransaction> &vtx) {
  if (vtx.empty()) {
    return uint256();
  }

  std::vector<uint256> level;
  level.reserve(vtx.size());
  for (const auto &tx : vtx) {
    level.push_back(tx.GetHash());
  }

  while (level.size() > 1) {
    if (level.size() % 2 == 1) {
      level.push_back(level.back());
    }
    std::vector<uint256> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(blockdag::util::Hash(level[i], level[i + 1]));
    }
    level = std::move(next);
  }
  return level.front();
}
