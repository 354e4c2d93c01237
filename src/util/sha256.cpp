// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/sha256.hpp"
#include "chain/endian.hpp"
#include <cstring>

namespace {

constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

inline uint32_t Rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t Ch(uint32_t x, uint32_t y, uint32_t z) { return z ^ (x & (y ^ z)); }
inline uint32_t Maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) | (z & (x | y)); }
inline uint32_t Sigma0(uint32_t x) { return Rotr(x, 2) ^ Rotr(x, 13) ^ Rotr(x, 22); }
inline uint32_t Sigma1(uint32_t x) { return Rotr(x, 6) ^ Rotr(x, 11) ^ Rotr(x, 25); }
inline uint32_t sigma0(uint32_t x) { return Rotr(x, 7) ^ Rotr(x, 18) ^ (x >> 3); }
inline uint32_t sigma1(uint32_t x) { return Rotr(x, 17) ^ Rotr(x, 19) ^ (x >> 10); }

void Initialize(uint32_t *s) {
  s[0] = 0x6a09e667ul;
  s[1] = 0xbb67ae85ul;
  s[2] = 0x3c6ef372ul;
  s[3] = 0xa54ff53aul;
  s[4] = 0x510e527ful;
  s[5] = 0x9b05688cul;
  s[6] = 0x1f83d9abul;
  s[7] = 0x5be0cd19ul;
}

/** Process consecutive 64-byte chunks. */
void Transform(uint32_t *s, const unsigned char *chunk, size_t blocks) {
  while (blocks--) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i)
      w[i] = endian::ReadBE32(chunk + 4 * i);
    for (int i = 16; i < 64; ++i)
      w[i] = sigma1(w[i - 2]) + w[i - 7] + sigma0(w[i - 15]) + w[i - 16];

    uint32_t a = s[0], b = s[1], c = s[2], d = s[3];
    uint32_t e = s[4], f = s[5], g = s[6], h = s[7];
    for (int i = 0; i < 64; ++i) {
      uint32_t t1 = h + Sigma1(e) + Ch(e, f, g) + K[i] + w[i];
      uint32_t t2 = Sigma0(a) + Maj(a, b, c);
      h = g;
      g = f;
      f = e;
      e = d + t1;
      d = c;
      c = b;
      b = a;
      a = t1 + t2;
    }

    s[0] += a;
    s[1] += b;
    s[2] += c;
    s[3] += d;
    s[4] += e;
    s[5] += f;
    s[6] += g;
    s[7] += h;
    chunk += 64;
  }
}

} // namespace

CSHA256::CSHA256() { Initialize(s); }

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  const unsigned char *end = data + len;
  size_t bufsize = bytes % 64;
  if (bufsize && bufsize + len >= 64) {
    // Fill the buffer, and process it.
    std::memcpy(buf + bufsize, data, 64 - bufsize);
    bytes += 64 - bufsize;
    data += 64 - bufsize;
    Transform(s, buf, 1);
    bufsize = 0;
  }
  if (end - data >= 64) {
    size_t blocks = (end - data) / 64;
    Transform(s, data, blocks);
    data += 64 * blocks;
    bytes += 64 * blocks;
  }
  if (end > data) {
    std::memcpy(buf + bufsize, data, end - data);
    bytes += end - data;
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  static const unsigned char pad[64] = {0x80};
  unsigned char sizedesc[8];
  endian::WriteBE64(sizedesc, bytes << 3);
  Write(pad, 1 + ((119 - (bytes % 64)) % 64));
  Write(sizedesc, 8);
  for (int i = 0; i < 8; ++i)
    endian::WriteBE32(hash + 4 * i, s[i]);
}

CSHA256 &CSHA256::Reset() {
  bytes = 0;
  Initialize(s);
  return *this;
}

uint256 Hash256(std::span<const uint8_t> data) {
  unsigned char tmp[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(data.data(), data.size()).Finalize(tmp);

  uint256 out;
  CSHA256().Write(tmp, sizeof(tmp)).Finalize(out.begin());
  return out;
}
