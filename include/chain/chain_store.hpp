// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

class CBlockHeader;

namespace equirelay {

namespace validation {
class ValidationState;
}

namespace chain {

class ChainParams;

// Everything the store keeps about a verified block
struct BlockRecord {
  int64_t registration_time{0};
  uint256 prev_hash;
  arith_uint256 pow;        // Work of this block alone (GetBlockProof)
  arith_uint256 chain_work; // Cumulative work along this block's branch
  uint32_t time{0};         // Header timestamp
  uint32_t bits{0};
  uint256 merkle_root;
  int height{0};            // Height on its own branch
};

enum class BlockStatus {
  UNKNOWN,    // Never registered
  REGISTERED, // Verified, on a side branch
  CANONICAL,  // On the canonical chain, not yet final
  FINALIZED   // Canonical and at or below the last finalized height
};

const char *BlockStatusString(BlockStatus status);

// ChainStore - registry of verified blocks and the canonical chain
//
// The first block ever registered becomes height 0 regardless of its
// parent. After that a block is accepted only if its parent is registered.
// The canonical chain advances when a block extends the current tip;
// blocks on other branches are kept and can be activated later with
// ActivateBranch() if they carry more work.
//
// THREAD SAFETY: NO internal synchronization - the verifier and the relay
// driver call it from a single thread
class ChainStore {
public:
  explicit ChainStore(const ChainParams &params);

  /**
   * Record a block that passed verification.
   * @param tip_advanced set to whether the canonical tip moved to this block
   * @return false (BLOCK_ALREADY_REGISTERED / PREV_BLOCK_NOT_FOUND) if not stored
   */
  bool OnBlockFinalized(const CBlockHeader &header, int64_t registration_time,
                        validation::ValidationState &state,
                        bool *tip_advanced = nullptr);

  /**
   * Make the branch ending at `tip_hash` canonical. It must carry strictly
   * more cumulative work than the current tip, and must not fork below the
   * last finalized height.
   */
  bool ActivateBranch(const uint256 &tip_hash, validation::ValidationState &state);

  // Height of the canonical tip, -1 while empty
  int GetChainHeight() const { return static_cast<int>(canonical_.size()) - 1; }

  // Canonical tip hash, null while empty
  uint256 GetTip() const;

  std::optional<uint256> GetBlockHashAtHeight(int height) const;

  const BlockRecord *GetBlock(const uint256 &hash) const;
  BlockStatus GetStatus(const uint256 &hash) const;
  bool IsRegistered(const uint256 &hash) const { return blocks_.count(hash) != 0; }

  // Height on the canonical chain (side-branch blocks: std::nullopt)
  std::optional<int> GetBlockHeight(const uint256 &hash) const;

  bool IsBlockFinalized(const uint256 &hash) const;

  // -1 until the chain is nFinalityDepth blocks long
  int GetLastFinalizedHeight() const { return last_finalized_height_; }
  int GetFinalityDepth() const { return finality_depth_; }

  /**
   * Sum of individual work of the canonical blocks at heights
   * (height - max_depth, height]. std::nullopt if height is not canonical.
   */
  std::optional<arith_uint256> GetCumulativePowAtHeight(int height, int max_depth) const;

  // Median header time of the block and up to 10 ancestors
  std::optional<int64_t> GetMedianTimePast(const uint256 &hash) const;

  size_t GetBlockCount() const { return blocks_.size(); }

  bool Save(const std::string &filepath) const;

  // Replace the in-memory state with the file contents.
  // Returns false (state unchanged) on a missing, malformed or inconsistent file.
  bool Load(const std::string &filepath);

private:
  bool IsCanonical(const uint256 &hash, const BlockRecord &record) const;
  void UpdateFinality();

  std::map<uint256, BlockRecord> blocks_;
  std::vector<uint256> canonical_; // index = height
  int last_finalized_height_{-1};
  int finality_depth_;
};

} // namespace chain
} // namespace equirelay
