// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <vector>

namespace equirelay {

namespace validation {
class ValidationState;
}

namespace chain {

class ChainStore;

/**
 * Fold a Merkle branch into a root.
 *
 * `branch` lists sibling hashes from the leaf level up; bit i of `index`
 * says whether the running hash is the right (1) or left (0) child at
 * level i. Nodes are double-SHA256 of left || right in internal byte order,
 * with the last node duplicated on odd levels when the branch was built.
 */
uint256 ComputeMerkleRootFromBranch(const uint256 &leaf,
                                    const std::vector<uint256> &branch,
                                    uint32_t index);

/**
 * Check that `txid` is committed by the merkle root of a registered block.
 * Fails with BLOCK_NOT_FOUND or INVALID_MERKLE_PROOF.
 */
bool VerifyTransactionInclusion(const ChainStore &store, const uint256 &block_hash,
                                const uint256 &txid, const std::vector<uint256> &branch,
                                uint32_t index, validation::ValidationState &state);

} // namespace chain
} // namespace equirelay
