// Copyright (c) 2016 Jack Grigg
// Copyright (c) 2016 The Zcash developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Equihash(200,9) solution checking, following the reference validator:
// indices are packed as 21-bit groups, each leaf is a 20-bit-expanded half
// of a Blake2b-50 digest, and siblings must collide on 3 leading bytes at
// every level of the 9-level tree.

#include "crypto/equihash.hpp"
#include "chain/endian.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace equirelay {
namespace crypto {

using validation::ValidationState;
using validation::VerifyError;

void ExpandArray(std::span<const uint8_t> in, std::span<uint8_t> out,
                 size_t bit_len, size_t byte_pad) {
  if (bit_len < 8 || bit_len + 7 > 32) {
    throw std::invalid_argument("ExpandArray: unsupported bit length");
  }
  const size_t out_width = (bit_len + 7) / 8 + byte_pad;
  if (out.size() != 8 * out_width * in.size() / bit_len) {
    throw std::invalid_argument("ExpandArray: output size mismatch");
  }

  const uint32_t bit_len_mask = (uint32_t{1} << bit_len) - 1;

  // The acc_bits least-significant bits of acc_value hold a big-endian bit sequence
  size_t acc_bits = 0;
  uint32_t acc_value = 0;

  size_t j = 0;
  for (uint8_t byte : in) {
    acc_value = (acc_value << 8) | byte;
    acc_bits += 8;

    if (acc_bits >= bit_len) {
      acc_bits -= bit_len;
      for (size_t x = 0; x < byte_pad; x++) {
        out[j + x] = 0;
      }
      for (size_t x = byte_pad; x < out_width; x++) {
        out[j + x] = static_cast<uint8_t>(
            (acc_value >> (acc_bits + 8 * (out_width - x - 1))) &
            ((bit_len_mask >> (8 * (out_width - x - 1))) & 0xFF));
      }
      j += out_width;
    }
  }
}

void CompressArray(std::span<const uint8_t> in, std::span<uint8_t> out,
                   size_t bit_len, size_t byte_pad) {
  if (bit_len < 8 || bit_len + 7 > 32) {
    throw std::invalid_argument("CompressArray: unsupported bit length");
  }
  const size_t in_width = (bit_len + 7) / 8 + byte_pad;
  if (out.size() != bit_len * in.size() / (8 * in_width)) {
    throw std::invalid_argument("CompressArray: output size mismatch");
  }

  const uint32_t bit_len_mask = (uint32_t{1} << bit_len) - 1;

  size_t acc_bits = 0;
  uint32_t acc_value = 0;

  size_t j = 0;
  for (size_t i = 0; i < out.size(); i++) {
    // Fewer than 8 bits buffered: pull in the next input group
    if (acc_bits < 8) {
      acc_value = acc_value << bit_len;
      for (size_t x = byte_pad; x < in_width; x++) {
        acc_value = acc_value |
                    ((in[j + x] & ((bit_len_mask >> (8 * (in_width - x - 1))) & 0xFF))
                     << (8 * (in_width - x - 1)));
      }
      j += in_width;
      acc_bits += bit_len;
    }

    acc_bits -= 8;
    out[i] = static_cast<uint8_t>((acc_value >> acc_bits) & 0xFF);
  }
}

// Indices are expanded into 4-byte big-endian words: 21 bits, one pad byte
static constexpr size_t kIndexWidth = sizeof(uint32_t);
static constexpr size_t kIndexPad = kIndexWidth - (INDEX_BIT_LENGTH + 7) / 8;

std::optional<EquihashIndices> DecodeIndices(std::span<const uint8_t> solution) {
  if (solution.size() != SOLUTION_SIZE) {
    return std::nullopt;
  }

  std::vector<uint8_t> expanded(SOLUTION_INDICES * kIndexWidth);
  ExpandArray(solution, expanded, INDEX_BIT_LENGTH, kIndexPad);

  EquihashIndices indices;
  for (size_t i = 0; i < SOLUTION_INDICES; i++) {
    indices[i] = endian::ReadBE32(expanded.data() + i * kIndexWidth);
  }

  // The packing must be canonical
  if (EncodeIndices(indices) != std::vector<uint8_t>(solution.begin(), solution.end())) {
    return std::nullopt;
  }

  return indices;
}

std::vector<uint8_t> EncodeIndices(std::span<const uint32_t> indices) {
  std::vector<uint8_t> expanded(indices.size() * kIndexWidth);
  for (size_t i = 0; i < indices.size(); i++) {
    endian::WriteBE32(expanded.data() + i * kIndexWidth, indices[i]);
  }

  std::vector<uint8_t> packed(INDEX_BIT_LENGTH * expanded.size() / (8 * kIndexWidth));
  CompressArray(expanded, packed, INDEX_BIT_LENGTH, kIndexPad);
  return packed;
}

std::vector<uint8_t> GenerateLeafHash(const EquihashDigest &digest, uint32_t index) {
  constexpr size_t kHalf = EQUIHASH_N / 8;
  const size_t offset = (index % INDICES_PER_HASH_OUTPUT) * kHalf;

  std::vector<uint8_t> hash(HASH_LENGTH);
  ExpandArray(std::span<const uint8_t>(digest.data() + offset, kHalf), hash,
              COLLISION_BIT_LENGTH);
  return hash;
}

bool HasCollision(const EquihashNode &a, const EquihashNode &b, size_t len) {
  if (a.hash.size() < len || b.hash.size() < len) {
    return false;
  }
  for (size_t j = 0; j < len; j++) {
    if (a.hash[j] != b.hash[j]) {
      return false;
    }
  }
  return true;
}

bool IndicesBefore(const EquihashNode &a, const EquihashNode &b) {
  if (a.indices.empty() || b.indices.empty()) {
    return false;
  }
  return a.indices.front() < b.indices.front();
}

bool DistinctIndices(const EquihashNode &a, const EquihashNode &b) {
  std::unordered_set<uint32_t> seen(a.indices.begin(), a.indices.end());
  for (uint32_t idx : b.indices) {
    if (seen.count(idx)) {
      return false;
    }
  }
  return true;
}

bool MergeNodes(const EquihashNode &left, const EquihashNode &right,
                EquihashNode &out, ValidationState &state) {
  if (left.hash.size() != right.hash.size() ||
      !HasCollision(left, right, COLLISION_BYTE_LENGTH)) {
    return state.Invalid(VerifyError::NO_COLLISION,
                         "invalid collision length between indices " +
                             std::to_string(left.indices.empty() ? 0 : left.indices.front()) +
                             " and " +
                             std::to_string(right.indices.empty() ? 0 : right.indices.front()));
  }
  if (!IndicesBefore(left, right)) {
    return state.Invalid(VerifyError::BAD_ORDERING, "index tree incorrectly ordered");
  }
  if (!DistinctIndices(left, right)) {
    return state.Invalid(VerifyError::DUPLICATE_INDICES, "duplicate indices");
  }

  EquihashNode parent;
  parent.hash.resize(left.hash.size() - COLLISION_BYTE_LENGTH);
  for (size_t i = 0; i < parent.hash.size(); i++) {
    parent.hash[i] = left.hash[i + COLLISION_BYTE_LENGTH] ^ right.hash[i + COLLISION_BYTE_LENGTH];
  }
  parent.indices.reserve(left.indices.size() + right.indices.size());
  parent.indices.insert(parent.indices.end(), left.indices.begin(), left.indices.end());
  parent.indices.insert(parent.indices.end(), right.indices.begin(), right.indices.end());

  out = std::move(parent);
  return true;
}

bool BuildTree(std::span<const EquihashNode> leaves, EquihashNode &root,
               ValidationState &state) {
  const size_t count = leaves.size();
  if (count == 0 || (count & (count - 1)) != 0) {
    throw std::invalid_argument("BuildTree: leaf count must be a power of two");
  }

  if (count == 1) {
    root = leaves.front();
    return true;
  }

  const size_t half = count / 2;
  EquihashNode left;
  if (!BuildTree(leaves.first(half), left, state)) {
    return false;
  }
  EquihashNode right;
  if (!BuildTree(leaves.subspan(half), right, state)) {
    return false;
  }
  return MergeNodes(left, right, root, state);
}

bool IsZeroPrefix(std::span<const uint8_t> hash, size_t len) {
  if (hash.size() < len) {
    return false;
  }
  return std::all_of(hash.begin(), hash.begin() + len, [](uint8_t b) { return b == 0; });
}

std::vector<std::vector<uint8_t>> ComputeLeafBatch(const Blake2bMidstate &midstate,
                                                   EquihashHeaderView header,
                                                   std::span<const uint32_t> indices) {
  // Indices 2g and 2g+1 share one digest
  std::map<uint32_t, EquihashDigest> digests;
  for (uint32_t index : indices) {
    const uint32_t g = index / INDICES_PER_HASH_OUTPUT;
    if (!digests.count(g)) {
      digests.emplace(g, HashEquihashFromMidstate(midstate, header, g));
    }
  }

  LOG_CRYPTO_TRACE("ComputeLeafBatch: {} leaves, {} distinct Blake2b inputs",
                   indices.size(), digests.size());

  std::vector<std::vector<uint8_t>> leaves;
  leaves.reserve(indices.size());
  for (uint32_t index : indices) {
    leaves.push_back(GenerateLeafHash(digests.at(index / INDICES_PER_HASH_OUTPUT), index));
  }
  return leaves;
}

bool IsValidSolution(EquihashHeaderView header, std::span<const uint8_t> solution,
                     ValidationState &state) {
  if (solution.size() != SOLUTION_SIZE) {
    return state.Invalid(VerifyError::INVALID_SOLUTION_SIZE);
  }
  auto indices = DecodeIndices(solution);
  if (!indices) {
    return state.Invalid(VerifyError::SOLUTION_DECODE_FAILURE);
  }

  const Blake2bMidstate midstate = ComputeEquihashMidstate(header);
  auto hashes = ComputeLeafBatch(midstate, header, *indices);

  std::vector<EquihashNode> leaves;
  leaves.reserve(SOLUTION_INDICES);
  for (size_t i = 0; i < SOLUTION_INDICES; i++) {
    leaves.emplace_back(std::move(hashes[i]), (*indices)[i]);
  }

  EquihashNode root;
  if (!BuildTree(leaves, root, state)) {
    return false;
  }
  if (!IsZeroPrefix(root.hash, COLLISION_BYTE_LENGTH)) {
    return state.Invalid(VerifyError::INVALID_ROOT_PREFIX, "root hash not zero");
  }
  return true;
}

} // namespace crypto
} // namespace equirelay
