// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

namespace equirelay {
namespace consensus {

std::optional<arith_uint256> GetTargetFromBits(uint32_t nBits,
                                               validation::ValidationState *state) {
  arith_uint256 target;
  bool fNegative;
  bool fOverflow;
  target.SetCompact(nBits, &fNegative, &fOverflow);

  if (fNegative || fOverflow || target == 0) {
    LOG_CHAIN_TRACE("GetTargetFromBits: rejected bits={:#010x} (negative={} overflow={} zero={})",
                    nBits, fNegative, fOverflow, target == 0);
    if (state) {
      state->Invalid(validation::VerifyError::INVALID_DIFFICULTY_TARGET,
                     fNegative ? "negative target" : fOverflow ? "target overflow" : "zero target");
    }
    return std::nullopt;
  }

  return target;
}

arith_uint256 GetBlockProof(uint32_t nBits) {
  auto target = GetTargetFromBits(nBits);
  if (!target)
    return arith_uint256(0);

  // bnTarget + 1 would wrap to 0
  if (*target == ~arith_uint256())
    return arith_uint256(1);

  // We need to compute 2**256 / (bnTarget+1), but we can't represent 2**256
  // as it's too large for an arith_uint256. However, as 2**256 is at least as
  // large as bnTarget+1, it is equal to ((2**256 - bnTarget - 1) /
  // (bnTarget+1)) + 1, or ~bnTarget / (bnTarget+1) + 1.
  return (~*target / (*target + 1)) + 1;
}

bool CheckProofOfWork(const uint256 &hash, const arith_uint256 &target) {
  if (UintToArith256(hash) > target) {
    LOG_CHAIN_TRACE("CheckProofOfWork: FAILED - hash {} > target {}",
                    hash.GetHex(), target.GetHex());
    return false;
  }
  return true;
}

/**
 * Get difficulty as a floating point number
 *
 * @param nBits Compact representation of target
 * @return Difficulty value, 0.0 for undecodable bits
 */
double GetDifficulty(uint32_t nBits) {
  if (!GetTargetFromBits(nBits)) {
    return 0.0;
  }

  // nBits format: 0xEEMMMMMM where EE is exponent, MMMMMM is mantissa
  int nShift = (nBits >> 24) & 0xff;
  double dDiff = (double)0x0000ffff / (double)(nBits & 0x00ffffff);

  // Standard difficulty uses shift=29 as baseline
  while (nShift < 29) {
    dDiff *= 256.0;
    nShift++;
  }
  while (nShift > 29) {
    dDiff /= 256.0;
    nShift--;
  }

  return dDiff;
}

} // namespace consensus
} // namespace equirelay
