// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "chain/endian.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

/** Fixed-size opaque byte blob (block hashes, digests, caller ids). */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob only supports whole bytes");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  /* constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr explicit base_blob(std::span<const unsigned char> vch) {
    assert(vch.size() == WIDTH);
    std::copy(vch.begin(), vch.end(), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic (memcmp) ordering, NOT numeric ordering. */
  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /**
   * Hex representation, byte-reversed (the usual block explorer form).
   * A little-endian number stored in the blob prints most significant
   * digit first.
   */
  std::string GetHex() const;
  std::string ToString() const;

  /** Set from byte-reversed hex. Accepts an optional "0x" prefix. */
  void SetHex(std::string_view str);

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  constexpr uint64_t GetUint64(int pos) const {
    return endian::ReadLE64(m_data.data() + pos * 8);
  }

  constexpr uint32_t GetUint32(int pos) const {
    assert(pos >= 0 && pos * 4 + 4 <= WIDTH);
    return endian::ReadLE32(m_data.data() + pos * 4);
  }
};

/** 160-bit opaque blob, used as caller identity. */
class uint160 : public base_blob<160> {
public:
  constexpr uint160() = default;
  constexpr explicit uint160(uint8_t v) : base_blob<160>(v) {}
  constexpr explicit uint160(std::span<const unsigned char> vch)
      : base_blob<160>(vch) {}
};

/** 256-bit opaque blob. Use arith_uint256 for arithmetic. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(std::span<const unsigned char> vch)
      : base_blob<256>(vch) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* Separate from the constructor so a literal 0 never converts to a string. */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

inline uint160 uint160S(std::string_view str) {
  uint160 rv;
  rv.SetHex(str);
  return rv;
}
