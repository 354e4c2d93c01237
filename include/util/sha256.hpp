// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

/** A hasher class for SHA-256. */
class CSHA256 {
private:
  uint32_t s[8];
  unsigned char buf[64];
  uint64_t bytes{0};

public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  CSHA256 &Write(const unsigned char *data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256 &Reset();
};

/** Double SHA-256 of a byte range (block hashes, header commitments). */
uint256 Hash256(std::span<const uint8_t> data);
