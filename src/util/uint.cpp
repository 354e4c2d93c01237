// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (int i = WIDTH - 1; i >= 0; --i) {
    out.push_back(kHexChars[m_data[i] >> 4]);
    out.push_back(kHexChars[m_data[i] & 0x0f]);
  }
  return out;
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  // Only the leading run of hex digits counts
  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    ++digits;
  }

  // Least significant digits sit at the end of the string and go to byte 0
  unsigned char *p = begin();
  size_t pos = digits;
  while (pos > 0 && p < end()) {
    *p = static_cast<unsigned char>(HexDigit(str[--pos]));
    if (pos > 0) {
      *p |= static_cast<unsigned char>(HexDigit(str[--pos]) << 4);
    }
    ++p;
  }
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template std::string base_blob<160>::GetHex() const;
template void base_blob<160>::SetHex(std::string_view);
template std::string base_blob<160>::ToString() const;

template std::string base_blob<256>::GetHex() const;
template void base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
