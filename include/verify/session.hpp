// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "crypto/equihash.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace equirelay {
namespace verify {

// Leaves are hashed in LEAF_BATCHES fixed slices of LEAVES_PER_BATCH indices
static constexpr size_t LEAF_BATCHES = 8;
static constexpr size_t LEAVES_PER_BATCH = crypto::SOLUTION_INDICES / LEAF_BATCHES;
static constexpr uint8_t ALL_BATCHES_DONE = 0xff;

static_assert(LEAF_BATCHES * LEAVES_PER_BATCH == crypto::SOLUTION_INDICES,
              "batches must cover every solution index");
static_assert(LEAF_BATCHES <= 8, "completed batches are tracked in one byte");

/**
 * Key of a verification session: the block hash (internal byte order)
 * with its last 4 bytes cleared, so it carries 224 bits of the hash.
 */
using VerificationId = uint256;

VerificationId ComputeVerificationId(const uint256 &block_hash);

// Uninitialized is represented by the absence of a session
enum class SessionState {
  STARTED,
  LEAVES_IN_PROGRESS,
  LEAVES_COMPLETE,
  TREE_BUILT,
  FINALIZED,
  FAILED
};

const char *SessionStateString(SessionState state);
std::optional<SessionState> SessionStateFromString(std::string_view name);

/**
 * Per-block verification progress.
 *
 * Leaf hashes, the completed-batch bitmap and the tree root live in the
 * SessionStore next to this record; it holds what every step re-reads.
 */
struct VerificationSession {
  VerificationId id;
  uint256 block_hash;
  uint256 header_commitment;                  // Hash256 of header_bytes
  CBlockHeader::HeaderBytes header_bytes{};   // Equihash input, replayed by every batch
  crypto::Blake2bMidstate midstate{};         // Chain value after header bytes 0..127
  crypto::EquihashIndices indices{};
  uint160 initiator;
  int64_t created{0};
  int64_t deadline{0};
  arith_uint256 target;
  uint32_t n_bits{0};
  SessionState state{SessionState::STARTED};
};

} // namespace verify
} // namespace equirelay
