// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>

namespace equirelay {

namespace validation {
class ValidationState;
}

namespace consensus {

// Decode compact nBits into a 256-bit target.
// Rejects (std::nullopt) a negative mantissa, an overflowing exponent and a
// zero result; state, when given, is set to INVALID_DIFFICULTY_TARGET.
std::optional<arith_uint256> GetTargetFromBits(uint32_t nBits,
                                               validation::ValidationState *state = nullptr);

// Work represented by a block at this difficulty: 2^256 / (target + 1).
// Zero for undecodable bits.
arith_uint256 GetBlockProof(uint32_t nBits);

// Block hash, read as a little-endian 256-bit number, must not exceed target
bool CheckProofOfWork(const uint256 &hash, const arith_uint256 &target);

// Returns difficulty as floating point relative to the 0x1d00ffff baseline
double GetDifficulty(uint32_t nBits);

} // namespace consensus
} // namespace equirelay
