// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2016 The Zcash developers
// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// CBlockHeader - Zcash block header as relayed for verification
// - 140-byte Equihash input (version, three digests, time, bits, 256-bit nonce)
// - followed on the wire by CompactSize(len) and the Equihash solution
class CBlockHeader
{
public:
    int32_t nVersion{0};
    uint256 hashPrevBlock{};          // Digests are copied byte-for-byte as stored, no endian swap
    uint256 hashMerkleRoot{};
    uint256 hashBlockCommitments{};
    uint32_t nTime{0};
    uint32_t nBits{0};
    uint256 nNonce{};
    std::vector<uint8_t> nSolution;

    static constexpr size_t UINT256_BYTES = 32;

    // Equihash input: 4 + 32 + 32 + 32 + 4 + 4 + 32 = 140 bytes
    static constexpr size_t HEADER_SIZE =
        4 +                          // nVersion
        UINT256_BYTES +              // hashPrevBlock
        UINT256_BYTES +              // hashMerkleRoot
        UINT256_BYTES +              // hashBlockCommitments
        4 +                          // nTime
        4 +                          // nBits
        UINT256_BYTES;               // nNonce

    static constexpr size_t OFF_VERSION     = 0;
    static constexpr size_t OFF_PREV        = OFF_VERSION + 4;
    static constexpr size_t OFF_MERKLE      = OFF_PREV + UINT256_BYTES;
    static constexpr size_t OFF_COMMITMENTS = OFF_MERKLE + UINT256_BYTES;
    static constexpr size_t OFF_TIME        = OFF_COMMITMENTS + UINT256_BYTES;
    static constexpr size_t OFF_BITS        = OFF_TIME + 4;
    static constexpr size_t OFF_NONCE       = OFF_BITS + 4;

    static_assert(sizeof(int32_t) == 4, "int32_t must be 4 bytes");
    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(HEADER_SIZE == 140, "Equihash input must be 140 bytes");
    static_assert(OFF_NONCE + UINT256_BYTES == HEADER_SIZE, "offset math must be correct");

    using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

    void SetNull() noexcept
    {
        nVersion = 0;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        hashBlockCommitments.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce.SetNull();
        nSolution.clear();
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return nBits == 0;
    }

    // Block hash: double SHA256 of Serialize()
    [[nodiscard]] uint256 GetHash() const;

    // The 140 bytes hashed by Equihash (no solution)
    [[nodiscard]] HeaderBytes SerializeEquihashInput() const noexcept;

    // Full wire form: Equihash input || CompactSize(nSolution.size()) || nSolution
    [[nodiscard]] std::vector<uint8_t> Serialize() const;

    // Parse the full wire form. The input must be consumed exactly.
    [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size);

    [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) {
        return Deserialize(bytes.data(), bytes.size());
    }

    // Fill the fixed fields from a 140-byte Equihash input; nSolution is untouched
    void SetEquihashInput(const HeaderBytes& bytes) noexcept;

    [[nodiscard]] int64_t GetBlockTime() const noexcept
    {
        return static_cast<int64_t>(nTime);
    }

    [[nodiscard]] std::string ToString() const;
};

// Bitcoin CompactSize length prefix
void WriteCompactSize(std::vector<uint8_t>& out, uint64_t n);

// Returns bytes consumed, 0 on truncated or non-canonical input
[[nodiscard]] size_t ReadCompactSize(const uint8_t* data, size_t size, uint64_t& n);
