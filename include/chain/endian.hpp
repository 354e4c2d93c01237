// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace endian {

inline uint16_t byteswap16(uint16_t x) { return static_cast<uint16_t>((x >> 8) | (x << 8)); }

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

inline uint16_t ReadLE16(const uint8_t *ptr) {
  uint16_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::big) v = byteswap16(v);
  return v;
}

inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::big) v = byteswap32(v);
  return v;
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::big) v = byteswap64(v);
  return v;
}

inline void WriteLE16(uint8_t *ptr, uint16_t v) {
  if constexpr (std::endian::native == std::endian::big) v = byteswap16(v);
  std::memcpy(ptr, &v, sizeof(v));
}

inline void WriteLE32(uint8_t *ptr, uint32_t v) {
  if constexpr (std::endian::native == std::endian::big) v = byteswap32(v);
  std::memcpy(ptr, &v, sizeof(v));
}

inline void WriteLE64(uint8_t *ptr, uint64_t v) {
  if constexpr (std::endian::native == std::endian::big) v = byteswap64(v);
  std::memcpy(ptr, &v, sizeof(v));
}

// Big endian: SHA-256 message schedule and Equihash index packing
inline uint32_t ReadBE32(const uint8_t *ptr) {
  uint32_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::little) v = byteswap32(v);
  return v;
}

inline void WriteBE32(uint8_t *ptr, uint32_t v) {
  if constexpr (std::endian::native == std::endian::little) v = byteswap32(v);
  std::memcpy(ptr, &v, sizeof(v));
}

inline void WriteBE64(uint8_t *ptr, uint64_t v) {
  if constexpr (std::endian::native == std::endian::little) v = byteswap64(v);
  std::memcpy(ptr, &v, sizeof(v));
}

} // namespace endian
