// Copyright (c) 2016 Jack Grigg
// Copyright (c) 2016 The Zcash developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "crypto/blake2b.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace equirelay {

namespace validation {
class ValidationState;
}

namespace crypto {

// Equihash(200,9) constants
static constexpr unsigned int EQUIHASH_N = 200;
static constexpr unsigned int EQUIHASH_K = 9;
static constexpr size_t COLLISION_BIT_LENGTH = EQUIHASH_N / (EQUIHASH_K + 1);      // 20
static constexpr size_t COLLISION_BYTE_LENGTH = (COLLISION_BIT_LENGTH + 7) / 8;    // 3
static constexpr size_t HASH_LENGTH = (EQUIHASH_K + 1) * COLLISION_BYTE_LENGTH;    // 30
static constexpr size_t INDICES_PER_HASH_OUTPUT = 512 / EQUIHASH_N;                // 2
static constexpr size_t HASH_OUTPUT = INDICES_PER_HASH_OUTPUT * EQUIHASH_N / 8;    // 50
static constexpr size_t INDEX_BIT_LENGTH = COLLISION_BIT_LENGTH + 1;               // 21
static constexpr size_t SOLUTION_INDICES = size_t{1} << EQUIHASH_K;                // 512
static constexpr size_t SOLUTION_SIZE = SOLUTION_INDICES * INDEX_BIT_LENGTH / 8;   // 1344

static_assert(HASH_OUTPUT == EQUIHASH_DIGEST_SIZE, "Blake2b output must match Equihash parameters");
static_assert(SOLUTION_SIZE == 1344, "Equihash(200,9) solutions are 1344 bytes");

using EquihashIndices = std::array<uint32_t, SOLUTION_INDICES>;

/**
 * Unpack bit_len-bit big-endian groups from `in` into (bit_len+7)/8 + byte_pad
 * byte groups in `out`, each left-padded with byte_pad zero bytes.
 * @throws std::invalid_argument if the buffer sizes do not correspond
 */
void ExpandArray(std::span<const uint8_t> in, std::span<uint8_t> out,
                 size_t bit_len, size_t byte_pad = 0);

/** Inverse of ExpandArray. */
void CompressArray(std::span<const uint8_t> in, std::span<uint8_t> out,
                   size_t bit_len, size_t byte_pad = 0);

/**
 * Decode the 512 packed 21-bit indices of a solution.
 * std::nullopt if the size is wrong or re-encoding the indices does not
 * reproduce the input bytes.
 */
std::optional<EquihashIndices> DecodeIndices(std::span<const uint8_t> solution);

/** Pack indices as 21-bit big-endian groups. */
std::vector<uint8_t> EncodeIndices(std::span<const uint32_t> indices);

/**
 * A vertex of the collision tree.
 *
 * Leaves carry the 30-byte expanded half-digest for one index; every merge
 * strips COLLISION_BYTE_LENGTH leading bytes, so the root has 3 bytes left.
 * `indices` is the left child's list followed by the right child's.
 */
struct EquihashNode {
  std::vector<uint8_t> hash;
  std::vector<uint32_t> indices;

  EquihashNode() = default;
  EquihashNode(std::vector<uint8_t> hash_in, uint32_t index)
      : hash(std::move(hash_in)), indices{index} {}
};

/**
 * Leaf hash for `index` from the Blake2b digest of counter index/2: select
 * the 25-byte half for index%2 and expand 20-bit groups into 3-byte groups.
 */
std::vector<uint8_t> GenerateLeafHash(const EquihashDigest &digest, uint32_t index);

/** First `len` bytes of a XOR b are zero. */
bool HasCollision(const EquihashNode &a, const EquihashNode &b, size_t len);

/** a's first index is strictly below b's first index. */
bool IndicesBefore(const EquihashNode &a, const EquihashNode &b);

/** No index appears in both a and b. */
bool DistinctIndices(const EquihashNode &a, const EquihashNode &b);

/**
 * Merge two siblings. Checks, in order: collision (NO_COLLISION), ordering
 * (BAD_ORDERING), distinctness (DUPLICATE_INDICES). On success `out` holds
 * the XOR of the hashes minus the collision bytes and the concatenated
 * indices.
 */
bool MergeNodes(const EquihashNode &left, const EquihashNode &right,
                EquihashNode &out, validation::ValidationState &state);

/**
 * Fold a power-of-two span of leaves into one root, recursing on halves.
 * Fails fast on the first bad merge.
 */
bool BuildTree(std::span<const EquihashNode> leaves, EquihashNode &root,
               validation::ValidationState &state);

/** The first `len` bytes of hash are zero (false if hash is shorter). */
bool IsZeroPrefix(std::span<const uint8_t> hash, size_t len);

/**
 * Leaf hashes for a run of solution indices, hashing each distinct
 * Blake2b counter (index/2) only once.
 */
std::vector<std::vector<uint8_t>> ComputeLeafBatch(const Blake2bMidstate &midstate,
                                                   EquihashHeaderView header,
                                                   std::span<const uint32_t> indices);

/**
 * One-shot validator: decode, hash all leaves, build the tree and check
 * the root. Mirrors what the incremental verifier does across its steps.
 */
bool IsValidSolution(EquihashHeaderView header, std::span<const uint8_t> solution,
                     validation::ValidationState &state);

} // namespace crypto
} // namespace equirelay
