// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_manager.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>
#include "util/arith_uint256.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace blockdag {
namespace chain {

BlockManager::BlockManager(BlockStores stores) : m_stores(std::move(stores)) {
  if (!m_stores.headers || !m_stores.relations || !m_stores.ghostdag ||
      !m_stores.transactions || !m_stores.statuses || !m_stores.utxo ||
      !m_stores.utxo_diffs) {
    throw StoreError("BlockManager requires every store");
  }
}

BlockManager::~BlockManager() = default;

bool BlockManager::Initialize(const CBlock &genesis) {
  const uint256 hash = genesis.GetHash();
  LOG_CHAIN_TRACE("Initialize: called with genesis hash={}", hash.ToShortString());

  if (m_initialized) {
    LOG_CHAIN_ERROR("BlockManager already initialized");
    return false;
  }

  if (!genesis.header.DirectParents().empty()) {
    LOG_CHAIN_ERROR("Genesis block {} declares parents", hash.ToShortString());
    return false;
  }

  m_stores.headers->Insert(hash, std::make_shared<const CBlockHeader>(genesis.header));
  for (size_t level = 0; level < m_stores.relations->Levels(); ++level) {
    m_stores.relations->Insert(level, hash, {});
  }
  m_stores.ghostdag->Insert(hash, std::make_shared<const GhostdagData>(GhostdagManager::GenesisData()));
  m_stores.transactions->Insert(hash, std::make_shared<const std::vector<CTransaction>>(genesis.vtx));

  m_genesis_hash = hash;
  m_initialized = true;

  LOG_CHAIN_TRACE("BlockManager initialized with genesis: {}", m_genesis_hash.ToShortString());
  return true;
}

bool BlockManager::HasBlock(const uint256 &hash) const {
  return m_stores.statuses->Get(hash).has_value();
}

std::optional<BlockStatus> BlockManager::GetStatus(const uint256 &hash) const {
  return m_stores.statuses->Get(hash);
}

void BlockManager::SetStatus(const uint256 &hash, BlockStatus status) {
  m_stores.statuses->Set(hash, status);
}

std::shared_ptr<const CBlockHeader> BlockManager::GetHeader(const uint256 &hash) const {
  auto header = m_stores.headers->Get(hash);
  if (!header) {
    throw StoreError("header not found: " + hash.ToString());
  }
  return header;
}

std::shared_ptr<const GhostdagData> BlockManager::GetGhostdagData(const uint256 &hash) const {
  auto data = m_stores.ghostdag->Get(hash);
  if (!data) {
    throw StoreError("ghostdag data not found: " + hash.ToString());
  }
  return data;
}

std::shared_ptr<const GhostdagData> BlockManager::TryGetGhostdagData(const uint256 &hash) const {
  return m_stores.ghostdag->Get(hash);
}

std::shared_ptr<const std::vector<CTransaction>>
BlockManager::GetTransactions(const uint256 &hash) const {
  auto txs = m_stores.transactions->Get(hash);
  if (!txs) {
    throw StoreError("block transactions not found: " + hash.ToString());
  }
  return txs;
}

std::vector<uint256> BlockManager::GetParents(const uint256 &hash, size_t level) const {
  return m_stores.relations->GetParents(level, hash);
}

std::vector<uint256> BlockManager::GetChildren(const uint256 &hash, size_t level) const {
  return m_stores.relations->GetChildren(level, hash);
}

void BlockManager::CommitHeader(const uint256 &hash, std::shared_ptr<const CBlockHeader> header,
                                std::shared_ptr<const GhostdagData> ghostdag) {
  const size_t levels = std::min(header->parentsByLevel.size(), m_stores.relations->Levels());
  for (size_t level = 0; level < levels; ++level) {
    m_stores.relations->Insert(level, hash, header->parentsByLevel[level]);
  }
  m_stores.headers->Insert(hash, std::move(header));
  m_stores.ghostdag->Insert(hash, std::move(ghostdag));

  // Status last: the block becomes visible only when complete
  m_stores.statuses->Set(hash, BlockStatus::HeaderOnly);
}

void BlockManager::MarkInvalid(const uint256 &hash) {
  m_stores.statuses->Set(hash, BlockStatus::Invalid);
}

void BlockManager::CommitBody(const uint256 &hash,
                              std::shared_ptr<const std::vector<CTransaction>> txs) {
  m_stores.transactions->Insert(hash, std::move(txs));
}

void BlockManager::DeleteBlock(const uint256 &hash) {
  // Status first: the block stops being visible before its records go
  m_stores.statuses->Delete(hash);
  for (size_t level = 0; level < m_stores.relations->Levels(); ++level) {
    m_stores.relations->Delete(level, hash);
  }
  m_stores.ghostdag->Delete(hash);
  m_stores.transactions->Delete(hash);
  m_stores.utxo_diffs->Delete(hash);
  m_stores.headers->Delete(hash);
}

int64_t BlockManager::GetPastMedianTime(const uint256 &hash, size_t window) const {
  std::vector<int64_t> times;
  times.reserve(window);

  uint256 current = hash;
  while (times.size() < window && !current.IsNull()) {
    auto header = m_stores.headers->Get(current);
    auto data = m_stores.ghostdag->Get(current);
    if (!header || !data) {
      break; // Chain continues below the pruning point
    }
    times.push_back(header->GetBlockTime());
    current = data->selected_parent;
  }

  if (times.empty()) {
    throw StoreError("past median time: unknown block " + hash.ToString());
  }

  std::sort(times.begin(), times.end());
  return times[times.size() / 2];
}

std::vector<uint256> BlockManager::GetBlockHashes() const {
  return m_stores.statuses->Hashes();
}

size_t BlockManager::GetBlockCount() const {
  return m_stores.statuses->Size();
}

bool BlockManager::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  try {
    // Only blocks with a complete body can be replayed
    std::vector<SortableBlock> sorted_blocks;
    for (const auto &hash : GetBlockHashes()) {
      auto status = GetStatus(hash);
      if (!status || !HasValidBody(*status)) {
        continue;
      }
      auto data = TryGetGhostdagData(hash);
      if (data) {
        sorted_blocks.push_back(data->ToSortable(hash));
      }
    }
    std::sort(sorted_blocks.begin(), sorted_blocks.end());

    LOG_CHAIN_TRACE("Saving {} blocks to {}", sorted_blocks.size(), filepath);

    json root;
    root["version"] = 1; // Format version for future compatibility
    root["genesis_hash"] = m_genesis_hash.ToString();
    root["block_count"] = sorted_blocks.size();

    json blocks = json::array();
    for (const auto &entry : sorted_blocks) {
      auto header = GetHeader(entry.hash);
      auto txs = GetTransactions(entry.hash);

      json block_data;
      block_data["hash"] = entry.hash.ToString();
      block_data["version"] = header->nVersion;
      json levels = json::array();
      for (const auto &level : header->parentsByLevel) {
        json parents = json::array();
        for (const auto &parent : level) {
          parents.push_back(parent.ToString());
        }
        levels.push_back(parents);
      }
      block_data["parents"] = levels;
      block_data["merkle_root"] = header->hashMerkleRoot.ToString();
      block_data["time"] = header->nTime;
      block_data["bits"] = header->nBits;
      block_data["nonce"] = header->nNonce;
      block_data["blue_work"] = ArithToHex(entry.blue_work);

      json vtx = json::array();
      for (const auto &tx : *txs) {
        json tx_data;
        tx_data["version"] = tx.nVersion;
        tx_data["lock_time"] = tx.nLockTime;
        tx_data["payload"] = util::HexStr(tx.payload);
        json vin = json::array();
        for (const auto &in : tx.vin) {
          vin.push_back({{"hash", in.prevout.hash.ToString()},
                         {"n", in.prevout.n},
                         {"script", util::HexStr(in.signatureScript)},
                         {"sequence", in.nSequence}});
        }
        json vout = json::array();
        for (const auto &out : tx.vout) {
          vout.push_back({{"value", out.nValue}, {"script", util::HexStr(out.scriptPubKey)}});
        }
        tx_data["vin"] = vin;
        tx_data["vout"] = vout;
        vtx.push_back(tx_data);
      }
      block_data["txs"] = vtx;
      blocks.push_back(block_data);
    }
    root["blocks"] = blocks;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_CHAIN_ERROR("Failed to write block file: {}", filepath);
      return false;
    }

    LOG_CHAIN_TRACE("Successfully saved {} blocks", sorted_blocks.size());
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

namespace {

uint256 ParseHashField(const nlohmann::json &value) {
  auto hash = util::SafeParseHash(value.get<std::string>());
  if (!hash) {
    throw std::invalid_argument("malformed hash: " + value.get<std::string>());
  }
  return *hash;
}

std::vector<uint8_t> ParseHexField(const nlohmann::json &value) {
  auto bytes = util::ParseHex(value.get<std::string>());
  if (!bytes) {
    throw std::invalid_argument("malformed hex: " + value.get<std::string>());
  }
  return *bytes;
}

} // namespace

bool BlockManager::LoadBlocks(const std::string &filepath, const uint256 &expected_genesis_hash,
                              std::vector<CBlock> &blocks) {
  using json = nlohmann::json;

  try {
    LOG_CHAIN_TRACE("Loading blocks from {}", filepath);

    auto contents = util::read_file_string(filepath);
    if (!contents) {
      LOG_CHAIN_ERROR("Block file not found or unreadable: {}", filepath);
      return false;
    }

    json root = json::parse(*contents);

    // Validate format version
    int version = root.value("version", 0);
    if (version != 1) {
      LOG_CHAIN_ERROR("Unsupported block file version: {}", version);
      return false;
    }

    // Validate genesis block hash matches expected network
    if (ParseHashField(root.at("genesis_hash")) != expected_genesis_hash) {
      LOG_CHAIN_ERROR("GENESIS MISMATCH: block file {} was written for genesis {}",
                      filepath, root.at("genesis_hash").get<std::string>());
      return false;
    }

    if (!root.contains("blocks") || !root["blocks"].is_array()) {
      LOG_CHAIN_ERROR("Block file missing 'blocks' array");
      return false;
    }

    std::vector<CBlock> loaded;
    loaded.reserve(root["blocks"].size());
    for (const auto &block_data : root["blocks"]) {
      CBlock block;
      block.header.nVersion = block_data.at("version").get<int32_t>();
      for (const auto &level : block_data.at("parents")) {
        std::vector<uint256> parents;
        for (const auto &parent : level) {
          parents.push_back(ParseHashField(parent));
        }
        block.header.parentsByLevel.push_back(std::move(parents));
      }
      block.header.hashMerkleRoot = ParseHashField(block_data.at("merkle_root"));
      block.header.nTime = block_data.at("time").get<uint64_t>();
      block.header.nBits = block_data.at("bits").get<uint32_t>();
      block.header.nNonce = block_data.at("nonce").get<uint64_t>();

      for (const auto &tx_data : block_data.at("txs")) {
        CTransaction tx;
        tx.nVersion = tx_data.at("version").get<int32_t>();
        tx.nLockTime = tx_data.at("lock_time").get<uint64_t>();
        tx.payload = ParseHexField(tx_data.at("payload"));
        for (const auto &in_data : tx_data.at("vin")) {
          CTxIn in;
          in.prevout = COutPoint(ParseHashField(in_data.at("hash")),
                                 in_data.at("n").get<uint32_t>());
          in.signatureScript = ParseHexField(in_data.at("script"));
          in.nSequence = in_data.at("sequence").get<uint64_t>();
          tx.vin.push_back(std::move(in));
        }
        for (const auto &out_data : tx_data.at("vout")) {
          CTxOut out;
          out.nValue = out_data.at("value").get<int64_t>();
          out.scriptPubKey = ParseHexField(out_data.at("script"));
          tx.vout.push_back(std::move(out));
        }
        block.vtx.push_back(std::move(tx));
      }

      // The file's hash must match the reconstructed header
      const uint256 hash = block.GetHash();
      if (hash != ParseHashField(block_data.at("hash"))) {
        LOG_CHAIN_ERROR("Block hash mismatch for entry {}: recomputed {}",
                        block_data.at("hash").get<std::string>(), hash.ToString());
        return false;
      }
      if (hash == expected_genesis_hash) {
        continue;
      }
      loaded.push_back(std::move(block));
    }

    blocks = std::move(loaded);
    LOG_CHAIN_TRACE("Loaded {} blocks from {}", blocks.size(), filepath);
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during LoadBlocks: {}", e.what());
    return false;
  }
}

} // namespace chain
} // namespace blockdag
