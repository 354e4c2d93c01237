// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

class uint_error : public std::runtime_error {
public:
  explicit uint_error(const std::string &str) : std::runtime_error(str) {}
};

/** Template base class for unsigned big integers (little-endian 32-bit limbs). */
template <unsigned int BITS> class base_uint {
protected:
  static_assert(BITS / 32 > 0 && BITS % 32 == 0,
                "Template parameter BITS must be a positive multiple of 32.");
  static constexpr int WIDTH = BITS / 32;
  uint32_t pn[WIDTH];

public:
  base_uint() {
    for (int i = 0; i < WIDTH; i++)
      pn[i] = 0;
  }

  base_uint(const base_uint &b) = default;
  base_uint &operator=(const base_uint &b) = default;

  base_uint(uint64_t b) {
    pn[0] = static_cast<uint32_t>(b);
    pn[1] = static_cast<uint32_t>(b >> 32);
    for (int i = 2; i < WIDTH; i++)
      pn[i] = 0;
  }

  base_uint operator~() const {
    base_uint ret;
    for (int i = 0; i < WIDTH; i++)
      ret.pn[i] = ~pn[i];
    return ret;
  }

  base_uint operator-() const {
    base_uint ret;
    for (int i = 0; i < WIDTH; i++)
      ret.pn[i] = ~pn[i];
    ++ret;
    return ret;
  }

  double getdouble() const;

  base_uint &operator=(uint64_t b) {
    pn[0] = static_cast<uint32_t>(b);
    pn[1] = static_cast<uint32_t>(b >> 32);
    for (int i = 2; i < WIDTH; i++)
      pn[i] = 0;
    return *this;
  }

  base_uint &operator^=(const base_uint &b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] ^= b.pn[i];
    return *this;
  }

  base_uint &operator&=(const base_uint &b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] &= b.pn[i];
    return *this;
  }

  base_uint &operator|=(const base_uint &b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] |= b.pn[i];
    return *this;
  }

  base_uint &operator<<=(unsigned int shift);
  base_uint &operator>>=(unsigned int shift);

  base_uint &operator+=(const base_uint &b) {
    uint64_t carry = 0;
    for (int i = 0; i < WIDTH; i++) {
      uint64_t n = carry + pn[i] + b.pn[i];
      pn[i] = n & 0xffffffff;
      carry = n >> 32;
    }
    return *this;
  }

  base_uint &operator-=(const base_uint &b) {
    *this += -b;
    return *this;
  }

  base_uint &operator+=(uint64_t b64) {
    *this += base_uint(b64);
    return *this;
  }

  base_uint &operator-=(uint64_t b64) {
    *this += -base_uint(b64);
    return *this;
  }

  base_uint &operator*=(uint32_t b32);
  base_uint &operator*=(const base_uint &b);
  base_uint &operator/=(const base_uint &b);

  base_uint &operator++() {
    int i = 0;
    while (i < WIDTH && ++pn[i] == 0)
      i++;
    return *this;
  }

  base_uint &operator--() {
    int i = 0;
    while (i < WIDTH && --pn[i] == std::numeric_limits<uint32_t>::max())
      i++;
    return *this;
  }

  int CompareTo(const base_uint &b) const;
  bool EqualTo(uint64_t b) const;

  friend inline base_uint operator+(const base_uint &a, const base_uint &b) { return base_uint(a) += b; }
  friend inline base_uint operator-(const base_uint &a, const base_uint &b) { return base_uint(a) -= b; }
  friend inline base_uint operator*(const base_uint &a, const base_uint &b) { return base_uint(a) *= b; }
  friend inline base_uint operator/(const base_uint &a, const base_uint &b) { return base_uint(a) /= b; }
  friend inline base_uint operator|(const base_uint &a, const base_uint &b) { return base_uint(a) |= b; }
  friend inline base_uint operator&(const base_uint &a, const base_uint &b) { return base_uint(a) &= b; }
  friend inline base_uint operator^(const base_uint &a, const base_uint &b) { return base_uint(a) ^= b; }
  friend inline base_uint operator>>(const base_uint &a, int shift) { return base_uint(a) >>= shift; }
  friend inline base_uint operator<<(const base_uint &a, int shift) { return base_uint(a) <<= shift; }
  friend inline base_uint operator*(const base_uint &a, uint32_t b) { return base_uint(a) *= b; }
  friend inline bool operator==(const base_uint &a, const base_uint &b) { return std::memcmp(a.pn, b.pn, sizeof(a.pn)) == 0; }
  friend inline bool operator!=(const base_uint &a, const base_uint &b) { return std::memcmp(a.pn, b.pn, sizeof(a.pn)) != 0; }
  friend inline bool operator>(const base_uint &a, const base_uint &b) { return a.CompareTo(b) > 0; }
  friend inline bool operator<(const base_uint &a, const base_uint &b) { return a.CompareTo(b) < 0; }
  friend inline bool operator>=(const base_uint &a, const base_uint &b) { return a.CompareTo(b) >= 0; }
  friend inline bool operator<=(const base_uint &a, const base_uint &b) { return a.CompareTo(b) <= 0; }
  friend inline bool operator==(const base_uint &a, uint64_t b) { return a.EqualTo(b); }
  friend inline bool operator!=(const base_uint &a, uint64_t b) { return !a.EqualTo(b); }

  /** Hex, most significant digit first. */
  std::string GetHex() const;
  std::string ToString() const;

  unsigned int size() const { return sizeof(pn); }

  /** Position of the highest bit set plus one, or zero if the value is zero. */
  unsigned int bits() const;

  uint64_t GetLow64() const {
    static_assert(WIDTH >= 2, "this method needs at least 2 limbs");
    return pn[0] | static_cast<uint64_t>(pn[1]) << 32;
  }
};

/** 256-bit unsigned big integer. */
class arith_uint256 : public base_uint<256> {
public:
  arith_uint256() = default;
  arith_uint256(const base_uint<256> &b) : base_uint<256>(b) {}
  arith_uint256(uint64_t b) : base_uint<256>(b) {}

  /**
   * The "compact" format is a representation of a whole number N using an
   * unsigned 32bit number similar to a floating point format. The most
   * significant 8 bits are the unsigned exponent of base 256. This exponent
   * can be thought of as "number of bytes of N". The lower 23 bits are the
   * mantissa. Bit number 24 (0x800000) represents the sign of N.
   * N = (-1^sign) * mantissa * 256^(exponent-3)
   *
   * pfNegative is set for a nonzero mantissa with the sign bit set.
   * pfOverflow is set when the encoded value does not fit in 256 bits.
   */
  arith_uint256 &SetCompact(uint32_t nCompact, bool *pfNegative = nullptr,
                            bool *pfOverflow = nullptr);
  uint32_t GetCompact(bool fNegative = false) const;

  friend uint256 ArithToUint256(const arith_uint256 &);
  friend arith_uint256 UintToArith256(const uint256 &);
};

/** Little-endian byte conversion between the blob and the number. */
uint256 ArithToUint256(const arith_uint256 &);
arith_uint256 UintToArith256(const uint256 &);
