// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  /* copies min(WIDTH, vch.size()) bytes, remaining bytes are zero */
  explicit base_blob(std::span<const unsigned char> vch) : m_data() {
    std::copy_n(vch.begin(), std::min<size_t>(vch.size(), WIDTH), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic byte ordering (used as the hash tie-break everywhere) */
  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }
  friend bool operator>(const base_blob &a, const base_blob &b) {
    return a.Compare(b) > 0;
  }

  /** Hex shows bytes in reverse order (Bitcoin display convention). */
  std::string GetHex() const;
  std::string ToString() const;
  /** First 8 hex characters, for log lines */
  std::string ToShortString() const { return GetHex().substr(0, 8); }

  /** Set from hex string. Supports optional "0x" prefix. */
  void SetHex(std::string_view str);

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  /** Little-endian 64-bit word at position pos */
  uint64_t GetUint64(int pos) const {
    uint64_t x = 0;
    for (int i = 7; i >= 0; --i) {
      x = (x << 8) | m_data[pos * 8 + i];
    }
    return x;
  }
};

/** 256-bit opaque blob used for block, transaction and merkle hashes. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  explicit uint256(std::span<const unsigned char> vch)
      : base_blob<256>(vch) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from hex string.
 * This is a separate function because a uint256(const char*) constructor
 * would silently accept uint256(0).
 */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

namespace blockdag {
namespace util {

/**
 * Hasher for unordered containers keyed by block hash
 * Block hashes are uniformly distributed, so one word is enough.
 */
struct Uint256Hasher {
  size_t operator()(const uint256 &hash) const noexcept {
    return static_cast<size_t>(hash.GetUint64(0));
  }
};

} // namespace util
} // namespace blockdag
