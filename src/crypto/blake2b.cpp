// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "crypto/blake2b.hpp"
#include "chain/endian.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace equirelay {
namespace crypto {

namespace blake2b {

const std::array<uint64_t, 8> IV = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL, 0x3c6ef372fe94f82bULL,
    0xa54ff53a5f1d36f1ULL, 0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL};

namespace {

constexpr uint8_t SIGMA[12][16] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3},
    {11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4},
    {7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8},
    {9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13},
    {2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9},
    {12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11},
    {13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10},
    {6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5},
    {10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0},
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3}};

inline uint64_t Rotr64(uint64_t w, unsigned c) { return (w >> c) | (w << (64 - c)); }

inline void G(uint64_t *v, const uint64_t *m, int r, int i, int a, int b, int c, int d) {
  v[a] = v[a] + v[b] + m[SIGMA[r][2 * i]];
  v[d] = Rotr64(v[d] ^ v[a], 32);
  v[c] = v[c] + v[d];
  v[b] = Rotr64(v[b] ^ v[c], 24);
  v[a] = v[a] + v[b] + m[SIGMA[r][2 * i + 1]];
  v[d] = Rotr64(v[d] ^ v[a], 16);
  v[c] = v[c] + v[d];
  v[b] = Rotr64(v[b] ^ v[c], 63);
}

} // namespace

void Compress(std::array<uint64_t, 8> &h, const uint8_t *block,
              uint64_t t0, uint64_t t1, bool last) noexcept {
  uint64_t m[16];
  uint64_t v[16];

  for (int i = 0; i < 16; ++i) {
    m[i] = endian::ReadLE64(block + 8 * i);
  }
  for (int i = 0; i < 8; ++i) {
    v[i] = h[i];
    v[i + 8] = IV[i];
  }
  v[12] ^= t0;
  v[13] ^= t1;
  if (last) {
    v[14] = ~v[14];
  }

  for (int r = 0; r < 12; ++r) {
    G(v, m, r, 0, 0, 4, 8, 12);
    G(v, m, r, 1, 1, 5, 9, 13);
    G(v, m, r, 2, 2, 6, 10, 14);
    G(v, m, r, 3, 3, 7, 11, 15);
    G(v, m, r, 4, 0, 5, 10, 15);
    G(v, m, r, 5, 1, 6, 11, 12);
    G(v, m, r, 6, 2, 7, 8, 13);
    G(v, m, r, 7, 3, 4, 9, 14);
  }

  for (int i = 0; i < 8; ++i) {
    h[i] ^= v[i] ^ v[i + 8];
  }
}

} // namespace blake2b

CBLAKE2b::CBLAKE2b(size_t outlen, std::span<const uint8_t> personal)
    : h_(blake2b::IV), outlen_(outlen) {
  if (outlen == 0 || outlen > MAX_OUTPUT_SIZE) {
    throw std::invalid_argument("BLAKE2b output length must be 1..64");
  }
  if (personal.size() > PERSONAL_SIZE) {
    throw std::invalid_argument("BLAKE2b personalization exceeds 16 bytes");
  }

  // Parameter block: digest length, key length 0, fanout 1, depth 1;
  // salt zero; personalization in words 6 and 7
  std::array<uint8_t, 64> param{};
  param[0] = static_cast<uint8_t>(outlen);
  param[2] = 1;
  param[3] = 1;
  std::copy(personal.begin(), personal.end(), param.begin() + 48);

  for (int i = 0; i < 8; ++i) {
    h_[i] ^= endian::ReadLE64(param.data() + 8 * i);
  }
}

CBLAKE2b &CBLAKE2b::Write(const uint8_t *data, size_t len) {
  while (len > 0) {
    // The last block must be compressed with the final flag, so a full
    // buffer is only flushed once more input arrives
    if (buflen_ == BLOCK_SIZE) {
      t0_ += BLOCK_SIZE;
      if (t0_ < BLOCK_SIZE) ++t1_;
      blake2b::Compress(h_, buf_.data(), t0_, t1_, false);
      buflen_ = 0;
    }
    size_t take = std::min(len, BLOCK_SIZE - buflen_);
    std::memcpy(buf_.data() + buflen_, data, take);
    buflen_ += take;
    data += take;
    len -= take;
  }
  return *this;
}

void CBLAKE2b::Finalize(uint8_t *out) {
  t0_ += buflen_;
  if (t0_ < buflen_) ++t1_;
  std::fill(buf_.begin() + buflen_, buf_.end(), 0);
  blake2b::Compress(h_, buf_.data(), t0_, t1_, true);

  uint8_t full[MAX_OUTPUT_SIZE];
  for (int i = 0; i < 8; ++i) {
    endian::WriteLE64(full + 8 * i, h_[i]);
  }
  std::memcpy(out, full, outlen_);
}

std::array<uint8_t, CBLAKE2b::PERSONAL_SIZE> EquihashPersonalization(uint32_t n, uint32_t k) {
  std::array<uint8_t, CBLAKE2b::PERSONAL_SIZE> personal{};
  std::memcpy(personal.data(), "ZcashPoW", 8);
  endian::WriteLE32(personal.data() + 8, n);
  endian::WriteLE32(personal.data() + 12, k);
  return personal;
}

const Blake2bMidstate &EquihashIV() {
  static const Blake2bMidstate iv = {
      0x6a09e667f2bdc93aULL, 0xbb67ae8584caa73bULL, 0x3c6ef372fe94f82bULL,
      0xa54ff53a5f1d36f1ULL, 0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
      0x48ec89c38820de31ULL, 0x5be0cd10137e21b1ULL};
  return iv;
}

Blake2bMidstate ComputeEquihashMidstate(EquihashHeaderView header) {
  Blake2bMidstate h = EquihashIV();
  blake2b::Compress(h, header.data(), CBLAKE2b::BLOCK_SIZE, 0, false);
  return h;
}

EquihashDigest HashEquihashFromMidstate(const Blake2bMidstate &midstate,
                                        EquihashHeaderView header, uint32_t g) {
  constexpr size_t kTail = EQUIHASH_HEADER_SIZE - CBLAKE2b::BLOCK_SIZE;
  static_assert(kTail + 4 <= CBLAKE2b::BLOCK_SIZE);

  std::array<uint8_t, CBLAKE2b::BLOCK_SIZE> block{};
  std::memcpy(block.data(), header.data() + CBLAKE2b::BLOCK_SIZE, kTail);
  endian::WriteLE32(block.data() + kTail, g);

  Blake2bMidstate h = midstate;
  blake2b::Compress(h, block.data(), EQUIHASH_MESSAGE_SIZE, 0, true);

  uint8_t full[CBLAKE2b::MAX_OUTPUT_SIZE];
  for (int i = 0; i < 8; ++i) {
    endian::WriteLE64(full + 8 * i, h[i]);
  }
  EquihashDigest out;
  std::memcpy(out.data(), full, out.size());
  return out;
}

EquihashDigest HashEquihashInput(EquihashHeaderView header, uint32_t g) {
  uint8_t counter[4];
  endian::WriteLE32(counter, g);

  const auto personal = EquihashPersonalization(200, 9);
  EquihashDigest out;
  CBLAKE2b(EQUIHASH_DIGEST_SIZE, personal)
      .Write(header.data(), header.size())
      .Write(counter, sizeof(counter))
      .Finalize(out.data());
  return out;
}

} // namespace crypto
} // namespace equirelay
