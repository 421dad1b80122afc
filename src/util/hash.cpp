// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"
#include <algorithm>
#include <openssl/sha.h>

namespace blockdag {
namespace util {

HashWriter &HashWriter::WriteU8(uint8_t v) {
  buffer_.push_back(v);
  return *this;
}

HashWriter &HashWriter::WriteU32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  return *this;
}

HashWriter &HashWriter::WriteU64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  return *this;
}

HashWriter &HashWriter::WriteHash(const uint256 &hash) {
  buffer_.insert(buffer_.end(), hash.begin(), hash.end());
  return *this;
}

HashWriter &HashWriter::WriteBytes(std::span<const uint8_t> bytes) {
  WriteU64(bytes.size());
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  return *this;
}

HashWriter &HashWriter::WriteString(std::string_view str) {
  WriteU64(str.size());
  buffer_.insert(buffer_.end(), str.begin(), str.end());
  return *this;
}

uint256 HashWriter::GetHash() const {
  return Hash(std::span<const uint8_t>(buffer_.data(), buffer_.size()));
}

uint256 Hash(std::span<const uint8_t> bytes) {
  unsigned char first[SHA256_DIGEST_LENGTH];
  SHA256(bytes.data(), bytes.size(), first);

  uint256 out;
  SHA256(first, sizeof(first), out.begin());
  return out;
}

uint256 Hash(const uint256 &left, const uint256 &right) {
  uint8_t concat[64];
  std::copy(left.begin(), left.end(), concat);
  std::copy(right.begin(), right.end(), concat + 32);
  return Hash(std::span<const uint8_t>(concat, sizeof(concat)));
}

} // namespace util
} // namespace blockdag
