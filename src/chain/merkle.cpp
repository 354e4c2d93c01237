// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "chain/merkle.hpp"
#include "chain/chain_store.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include <algorithm>
#include <array>

namespace equirelay {
namespace chain {

uint256 ComputeMerkleRootFromBranch(const uint256 &leaf,
                                    const std::vector<uint256> &branch,
                                    uint32_t index) {
  uint256 hash = leaf;
  std::array<uint8_t, 64> pair;
  for (const uint256 &sibling : branch) {
    if (index & 1) {
      std::copy(sibling.begin(), sibling.end(), pair.begin());
      std::copy(hash.begin(), hash.end(), pair.begin() + 32);
    } else {
      std::copy(hash.begin(), hash.end(), pair.begin());
      std::copy(sibling.begin(), sibling.end(), pair.begin() + 32);
    }
    hash = Hash256(pair);
    index >>= 1;
  }
  return hash;
}

bool VerifyTransactionInclusion(const ChainStore &store, const uint256 &block_hash,
                                const uint256 &txid, const std::vector<uint256> &branch,
                                uint32_t index, validation::ValidationState &state) {
  const BlockRecord *record = store.GetBlock(block_hash);
  if (!record) {
    return state.Invalid(validation::VerifyError::BLOCK_NOT_FOUND,
                         "block " + block_hash.GetHex() + " not registered");
  }

  // Index bits beyond the branch depth would name a position the proof never reaches
  if (branch.size() < 32 && (index >> branch.size()) != 0) {
    return state.Invalid(validation::VerifyError::INVALID_MERKLE_PROOF,
                         "index " + std::to_string(index) + " out of range for branch of " +
                             std::to_string(branch.size()));
  }

  const uint256 root = ComputeMerkleRootFromBranch(txid, branch, index);
  if (root != record->merkle_root) {
    LOG_CHAIN_DEBUG("Merkle proof for {} in {} failed: computed root {} expected {}",
                    txid.GetHex(), block_hash.GetHex(), root.GetHex(),
                    record->merkle_root.GetHex());
    return state.Invalid(validation::VerifyError::INVALID_MERKLE_PROOF,
                         "computed root " + root.GetHex());
  }
  return true;
}

} // namespace chain
} // namespace equirelay
