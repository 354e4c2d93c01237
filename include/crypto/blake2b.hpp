// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace equirelay {
namespace crypto {

/**
 * BLAKE2b (RFC 7693), keyless, with optional 16-byte personalization
 *
 * Streaming hasher in the CSHA256 style: Write() any number of times, then
 * Finalize() once into OutputSize() bytes.
 */
class CBLAKE2b {
public:
  static constexpr size_t BLOCK_SIZE = 128;
  static constexpr size_t MAX_OUTPUT_SIZE = 64;
  static constexpr size_t PERSONAL_SIZE = 16;

  /**
   * @param outlen digest length in bytes, 1..64
   * @param personal personalization, at most 16 bytes (zero padded)
   * @throws std::invalid_argument on out-of-range arguments
   */
  explicit CBLAKE2b(size_t outlen, std::span<const uint8_t> personal = {});

  CBLAKE2b &Write(const uint8_t *data, size_t len);
  CBLAKE2b &Write(std::span<const uint8_t> data) { return Write(data.data(), data.size()); }

  /** Writes OutputSize() bytes to out. */
  void Finalize(uint8_t *out);

  size_t OutputSize() const { return outlen_; }

private:
  std::array<uint64_t, 8> h_;
  std::array<uint8_t, BLOCK_SIZE> buf_{};
  size_t buflen_{0};
  uint64_t t0_{0};
  uint64_t t1_{0};
  size_t outlen_;
};

namespace blake2b {

/** Standard BLAKE2b initialization vector */
extern const std::array<uint64_t, 8> IV;

/**
 * Compression function F
 * @param h chain value, updated in place
 * @param block one 128-byte message block
 * @param t0 low word of the byte counter after this block
 * @param t1 high word of the byte counter
 * @param last true for the final block of the message
 */
void Compress(std::array<uint64_t, 8> &h, const uint8_t *block,
              uint64_t t0, uint64_t t1, bool last) noexcept;

} // namespace blake2b

// ---------------------------------------------------------------------------
// Equihash(200,9) leaf hashing
//
// The hashed message is the 140-byte header (nonce included) followed by
// LE32(g). Bytes 0..127 are identical for every g, so their compression is
// done once per header and its chain value (the midstate) reused. The second
// and final block carries header bytes 128..139 plus LE32(g): 16 bytes, zero
// padded, byte counter 144.
// ---------------------------------------------------------------------------

static constexpr size_t EQUIHASH_HEADER_SIZE = 140;
static constexpr size_t EQUIHASH_DIGEST_SIZE = 50;
static constexpr size_t EQUIHASH_MESSAGE_SIZE = EQUIHASH_HEADER_SIZE + 4;

using EquihashHeaderView = std::span<const uint8_t, EQUIHASH_HEADER_SIZE>;
using EquihashDigest = std::array<uint8_t, EQUIHASH_DIGEST_SIZE>;
using Blake2bMidstate = std::array<uint64_t, 8>;

/** "ZcashPoW" || LE32(n) || LE32(k) */
std::array<uint8_t, CBLAKE2b::PERSONAL_SIZE> EquihashPersonalization(uint32_t n, uint32_t k);

/**
 * Initial chain value for outlen 50 and personalization (200,9),
 * i.e. IV xor the parameter block, precomputed.
 */
const Blake2bMidstate &EquihashIV();

/** Compress header bytes 0..127 once. */
Blake2bMidstate ComputeEquihashMidstate(EquihashHeaderView header);

/** Finish the hash for counter g from a midstate. Hashes the final block only. */
EquihashDigest HashEquihashFromMidstate(const Blake2bMidstate &midstate,
                                        EquihashHeaderView header, uint32_t g);

/** Same result through the generic streaming hasher. */
EquihashDigest HashEquihashInput(EquihashHeaderView header, uint32_t g);

} // namespace crypto
} // namespace equirelay
