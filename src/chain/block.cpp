// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block.hpp"
#include "util/sha256.hpp"
#include "chain/endian.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

uint256 CBlockHeader::GetHash() const {
  return Hash256(Serialize());
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeEquihashInput() const noexcept {
  HeaderBytes data{};

  endian::WriteLE32(data.data() + OFF_VERSION, static_cast<uint32_t>(nVersion));
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(), data.begin() + OFF_PREV);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(), data.begin() + OFF_MERKLE);
  std::copy(hashBlockCommitments.begin(), hashBlockCommitments.end(),
            data.begin() + OFF_COMMITMENTS);
  endian::WriteLE32(data.data() + OFF_TIME, nTime);
  endian::WriteLE32(data.data() + OFF_BITS, nBits);
  // uint256 storage is already little-endian
  std::copy(nNonce.begin(), nNonce.end(), data.begin() + OFF_NONCE);

  return data;
}

void CBlockHeader::SetEquihashInput(const HeaderBytes &bytes) noexcept {
  const uint8_t *data = bytes.data();

  nVersion = static_cast<int32_t>(endian::ReadLE32(data + OFF_VERSION));
  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES, hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES, hashMerkleRoot.begin());
  std::copy(data + OFF_COMMITMENTS, data + OFF_COMMITMENTS + UINT256_BYTES,
            hashBlockCommitments.begin());
  nTime = endian::ReadLE32(data + OFF_TIME);
  nBits = endian::ReadLE32(data + OFF_BITS);
  std::copy(data + OFF_NONCE, data + OFF_NONCE + UINT256_BYTES, nNonce.begin());
}

std::vector<uint8_t> CBlockHeader::Serialize() const {
  const auto fixed = SerializeEquihashInput();

  std::vector<uint8_t> out;
  out.reserve(HEADER_SIZE + 9 + nSolution.size());
  out.insert(out.end(), fixed.begin(), fixed.end());
  WriteCompactSize(out, nSolution.size());
  out.insert(out.end(), nSolution.begin(), nSolution.end());
  return out;
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) {
  if (size < HEADER_SIZE) {
    return false;
  }

  uint64_t sol_len = 0;
  const size_t prefix = ReadCompactSize(data + HEADER_SIZE, size - HEADER_SIZE, sol_len);
  if (prefix == 0) {
    return false;
  }
  // Trailing or missing bytes are rejected
  if (sol_len != size - HEADER_SIZE - prefix) {
    return false;
  }

  HeaderBytes fixed;
  std::copy(data, data + HEADER_SIZE, fixed.begin());
  SetEquihashInput(fixed);

  const uint8_t *sol = data + HEADER_SIZE + prefix;
  nSolution.assign(sol, sol + sol_len);
  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  version=" << nVersion << "\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  hashBlockCommitments=" << hashBlockCommitments.GetHex() << "\n";
  s << "  nTime=" << nTime << "\n";
  s << "  nBits=0x" << std::hex << std::setw(8) << std::setfill('0') << nBits
    << std::dec << "\n";
  s << "  nNonce=" << nNonce.GetHex() << "\n";
  s << "  nSolution=" << nSolution.size() << " bytes\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

void WriteCompactSize(std::vector<uint8_t> &out, uint64_t n) {
  uint8_t buf[8];
  if (n < 0xfd) {
    out.push_back(static_cast<uint8_t>(n));
  } else if (n <= 0xffff) {
    out.push_back(0xfd);
    endian::WriteLE16(buf, static_cast<uint16_t>(n));
    out.insert(out.end(), buf, buf + 2);
  } else if (n <= 0xffffffff) {
    out.push_back(0xfe);
    endian::WriteLE32(buf, static_cast<uint32_t>(n));
    out.insert(out.end(), buf, buf + 4);
  } else {
    out.push_back(0xff);
    endian::WriteLE64(buf, n);
    out.insert(out.end(), buf, buf + 8);
  }
}

size_t ReadCompactSize(const uint8_t *data, size_t size, uint64_t &n) {
  if (size < 1) {
    return 0;
  }
  const uint8_t tag = data[0];
  if (tag < 0xfd) {
    n = tag;
    return 1;
  }
  if (tag == 0xfd) {
    if (size < 3) return 0;
    n = endian::ReadLE16(data + 1);
    return n < 0xfd ? 0 : 3;
  }
  if (tag == 0xfe) {
    if (size < 5) return 0;
    n = endian::ReadLE32(data + 1);
    return n <= 0xffff ? 0 : 5;
  }
  if (size < 9) return 0;
  n = endian::ReadLE64(data + 1);
  return n <= 0xffffffff ? 0 : 9;
}
