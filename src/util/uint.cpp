// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (int i = WIDTH - 1; i >= 0; --i) {
    out.push_back(kHexChars[m_data[i] >> 4]);
    out.push_back(kHexChars[m_data[i] & 0x0f]);
  }
  return out;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    ++digits;
  }

  // Most significant digit first in the string, least significant byte first
  // in memory
  size_t byte = 0;
  for (size_t pos = digits; pos > 0 && byte < WIDTH; ++byte) {
    uint8_t value = static_cast<uint8_t>(HexDigit(str[--pos]));
    if (pos > 0) {
      value |= static_cast<uint8_t>(HexDigit(str[--pos]) << 4);
    }
    m_data[byte] = value;
  }
}

template class base_blob<256>;

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
