// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/arith_uint256.hpp"
#include <cctype>
#include <stdexcept>

arith_uint256 UintToArith256(const uint256 &blob) {
  arith_uint256 num = 0;
  for (int i = static_cast<int>(uint256::size()) - 1; i >= 0; --i) {
    num <<= 8;
    num |= blob.data()[i];
  }
  return num;
}

uint256 ArithToUint256(const arith_uint256 &num) {
  uint256 blob;
  arith_uint256 tmp = num;
  for (unsigned int i = 0; i < uint256::size(); ++i) {
    blob.data()[i] = static_cast<uint8_t>(arith_uint256(tmp & 0xff));
    tmp >>= 8;
  }
  return blob;
}

std::string ArithToHex(const arith_uint256 &num) {
  if (num == 0) {
    return "0";
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  arith_uint256 tmp = num;
  while (tmp != 0) {
    out.insert(out.begin(), kHex[static_cast<unsigned>(arith_uint256(tmp & 0x0f))]);
    tmp >>= 4;
  }
  return out;
}

arith_uint256 ArithFromHex(const std::string &hex) {
  size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    start = 2;
  }
  if (start == hex.size() || hex.size() - start > 64) {
    throw std::invalid_argument("invalid 256-bit hex value: '" + hex + "'");
  }

  arith_uint256 num = 0;
  for (size_t i = start; i < hex.size(); ++i) {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(hex[i])));
    unsigned digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<unsigned>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<unsigned>(c - 'a' + 10);
    } else {
      throw std::invalid_argument("invalid 256-bit hex value: '" + hex + "'");
    }
    num <<= 4;
    num |= digit;
  }
  return num;
}
