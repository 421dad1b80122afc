// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace blockdag {
namespace util {

/**
 * Streaming serializer feeding a double SHA-256 (OpenSSL)
 *
 * Scalars are written little-endian, variable-length fields are prefixed
 * with their length, so the byte stream is unambiguous. Hashes of headers,
 * transactions and merkle nodes all go through this writer.
 */
class HashWriter {
public:
  HashWriter() = default;

  HashWriter &WriteU8(uint8_t v);
  HashWriter &WriteU32(uint32_t v);
  HashWriter &WriteU64(uint64_t v);
  HashWriter &WriteI64(int64_t v) { return WriteU64(static_cast<uint64_t>(v)); }
  HashWriter &WriteHash(const uint256 &hash);
  /** Length-prefixed byte string */
  HashWriter &WriteBytes(std::span<const uint8_t> bytes);
  HashWriter &WriteString(std::string_view str);

  /** Double SHA-256 of everything written so far */
  [[nodiscard]] uint256 GetHash() const;

  [[nodiscard]] size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/** Double SHA-256 of a byte range */
[[nodiscard]] uint256 Hash(std::span<const uint8_t> bytes);

/** Double SHA-256 of two concatenated hashes (merkle node) */
[[nodiscard]] uint256 Hash(const uint256 &left, const uint256 &right);

} // namespace util
} // namespace blockdag
