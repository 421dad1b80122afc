// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include <boost/multiprecision/integer.hpp>

namespace blockdag {
namespace consensus {

arith_uint256 DecodeCompact(uint32_t nCompact, bool *pfNegative, bool *pfOverflow) {
  const int nSize = static_cast<int>(nCompact >> 24);
  uint32_t nWord = nCompact & 0x007fffff;
  arith_uint256 result;
  if (nSize <= 3) {
    nWord >>= 8 * (3 - nSize);
    result = nWord;
  } else {
    result = nWord;
    result <<= 8 * (nSize - 3);
  }
  if (pfNegative) {
    *pfNegative = nWord != 0 && (nCompact & 0x00800000) != 0;
  }
  if (pfOverflow) {
    *pfOverflow = nWord != 0 && ((nSize > 34) || (nWord > 0xff && nSize > 33) ||
                                 (nWord > 0xffff && nSize > 32));
  }
  return result;
}

uint32_t EncodeCompact(const arith_uint256 &target) {
  if (target == 0) {
    return 0;
  }
  int nSize = static_cast<int>((boost::multiprecision::msb(target) + 8) / 8);
  uint32_t nCompact = 0;
  if (nSize <= 3) {
    nCompact = static_cast<uint32_t>(target) << (8 * (3 - nSize));
  } else {
    arith_uint256 bn = target >> (8 * (nSize - 3));
    nCompact = static_cast<uint32_t>(bn);
  }
  // The 0x00800000 bit denotes the sign, so if it is already set, divide the
  // mantissa by 256 and increase the exponent.
  if (nCompact & 0x00800000) {
    nCompact >>= 8;
    nSize++;
  }
  nCompact |= static_cast<uint32_t>(nSize) << 24;
  return nCompact;
}

arith_uint256 GetTargetFromBits(uint32_t nBits) {
  bool fNegative = false;
  bool fOverflow = false;
  arith_uint256 target = DecodeCompact(nBits, &fNegative, &fOverflow);
  if (fNegative || fOverflow || target == 0) {
    return 0;
  }
  return target;
}

arith_uint256 GetBlockProof(uint32_t nBits) {
  const arith_uint256 target = GetTargetFromBits(nBits);
  if (target == 0) {
    return 0;
  }
  // 2^256 does not fit; (~target / (target + 1)) + 1 is the same value
  return (~target / (target + 1)) + 1;
}

double GetDifficulty(uint32_t nBits, const chain::ChainParams &params) {
  const arith_uint256 target = GetTargetFromBits(nBits);
  if (target == 0) {
    return 0.0;
  }
  const arith_uint256 limit = UintToArith256(params.GetConsensus().powLimit);
  return limit.convert_to<double>() / target.convert_to<double>();
}

bool CheckProofOfWork(const CBlockHeader &header, const chain::ChainParams &params) {
  const arith_uint256 target = GetTargetFromBits(header.nBits);
  if (target == 0 || target > UintToArith256(params.GetConsensus().powLimit)) {
    return false;
  }

  if (params.GetConsensus().skipProofOfWork) {
    return true;
  }

  if (UintToArith256(header.GetHash()) > target) {
    LOG_PIPE_TRACE("Header {} does not meet target 0x{:08x}",
                   header.GetHash().ToShortString(), header.nBits);
    return false;
  }
  return true;
}

} // namespace consensus
} // namespace blockdag
