// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <string>

/**
 * 256-bit unsigned arithmetic (targets, block work, cumulative blue work)
 *
 * uint256 is an opaque little-endian blob; arith_uint256 is a number. The
 * two convert explicitly, the same way hashes are compared against targets.
 */
using arith_uint256 = boost::multiprecision::uint256_t;

/** Interpret a little-endian blob as a number */
arith_uint256 UintToArith256(const uint256 &blob);

/** Store a number as a little-endian blob */
uint256 ArithToUint256(const arith_uint256 &num);

/** Lower-case hex without leading zeros ("0" for zero) */
std::string ArithToHex(const arith_uint256 &num);

/** Parse hex (optional 0x prefix); throws std::invalid_argument on bad input */
arith_uint256 ArithFromHex(const std::string &hex);
