// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// Tests for BLAKE2b and the split Equihash leaf hashing

#include <catch2/catch_test_macros.hpp>
#include "crypto/blake2b.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

using namespace equirelay;
using namespace equirelay::crypto;

namespace {

std::string Blake2bHex(const std::vector<uint8_t>& data, size_t outlen,
                       std::span<const uint8_t> personal = {}) {
    CBLAKE2b hasher(outlen, personal);
    hasher.Write(data);
    std::vector<uint8_t> out(hasher.OutputSize());
    hasher.Finalize(out.data());
    return util::HexStr(out);
}

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("Blake2b - RFC 7693 vectors", "[blake2b]") {
    SECTION("abc") {
        REQUIRE(Blake2bHex(Bytes("abc"), 64) ==
                "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
                "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
    }

    SECTION("empty message") {
        REQUIRE(Blake2bHex({}, 64) ==
                "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
                "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce");
    }

    SECTION("exactly one block is not compressed until finalize") {
        std::vector<uint8_t> data(128);
        std::iota(data.begin(), data.end(), 0);
        REQUIRE(Blake2bHex(data, 64) ==
                "2319e3789c47e2daa5fe807f61bec2a1a6537fa03f19ff32e87eecbfd64b7e0e"
                "8ccff439ac333b040f19b0c4ddd11a61e24ac1fe0f10a039806c5dcc0da3d115");
    }
}

TEST_CASE("Blake2b - personalization and output length", "[blake2b]") {
    SECTION("Equihash personalization, 50-byte output") {
        auto personal = EquihashPersonalization(200, 9);
        REQUIRE(Blake2bHex(Bytes("abc"), 50, personal) ==
                "52e907446f88b0d5e63e3b2ed93b9cf178cff963d9b89e2a01fe2e42f247b0a5"
                "8f8f40ccd4471fdadee85d6ab7e69be29285");
    }

    SECTION("short personalization is zero padded") {
        std::vector<uint8_t> data(200);
        std::iota(data.begin(), data.end(), 0);
        auto personal = Bytes("ZcashTest");
        REQUIRE(Blake2bHex(data, 32, personal) ==
                "6c0118432aecfd29007bf15e860153d9432103f2855e921faf9f4851565f968a");
    }

    SECTION("incremental writes match a single write") {
        std::vector<uint8_t> data(300);
        std::iota(data.begin(), data.end(), 7);

        CBLAKE2b split(64);
        split.Write(data.data(), 1).Write(data.data() + 1, 127).Write(data.data() + 128, 172);
        std::vector<uint8_t> out(64);
        split.Finalize(out.data());

        REQUIRE(util::HexStr(out) == Blake2bHex(data, 64));
    }

    SECTION("invalid parameters throw") {
        REQUIRE_THROWS_AS(CBLAKE2b(0), std::invalid_argument);
        REQUIRE_THROWS_AS(CBLAKE2b(65), std::invalid_argument);
        std::vector<uint8_t> long_personal(17, 'x');
        REQUIRE_THROWS_AS(CBLAKE2b(32, long_personal), std::invalid_argument);
    }
}

TEST_CASE("Blake2b - Equihash split hashing", "[blake2b][equihash]") {
    const auto params = chain::ChainParams::CreateMainNet();
    const auto header = params->GenesisBlock().SerializeEquihashInput();

    SECTION("personalization layout") {
        auto personal = EquihashPersonalization(200, 9);
        REQUIRE(util::HexStr(personal) == "5a63617368506f57c800000009000000");
    }

    SECTION("split hashing matches a plain personalized hasher") {
        CBLAKE2b reference(EQUIHASH_DIGEST_SIZE, EquihashPersonalization(200, 9));
        std::array<uint8_t, 144> message{};
        std::copy(header.begin(), header.end(), message.begin());
        reference.Write(message);
        EquihashDigest expected;
        reference.Finalize(expected.data());

        REQUIRE(HashEquihashInput(header, 0) == expected);
        REQUIRE(EquihashIV() != blake2b::IV);
    }

    SECTION("genesis digests") {
        REQUIRE(util::HexStr(HashEquihashInput(header, 0)) ==
                "cbc22ce0c7c2f25ecadf6001322bac47afdf2e9327cea58fcf34ecee0c1470bb"
                "3e6a24b7c0d6332115561b31be7c2a4f31ce");
        REQUIRE(util::HexStr(HashEquihashInput(header, 168)) ==
                "48973a5e56b9af1a72720de04605b0172d068199bc2c66f3953414da3e59fcf5"
                "27fd909022c09266b7f08f37daece5266159");
    }

    SECTION("midstate path equals the streaming path") {
        const auto midstate = ComputeEquihashMidstate(header);
        for (uint32_t g : {0u, 1u, 168u, 81009u, 1048575u}) {
            REQUIRE(HashEquihashFromMidstate(midstate, header, g) == HashEquihashInput(header, g));
        }
    }

    SECTION("midstate depends only on the first 128 bytes") {
        auto changed = header;
        changed[130] ^= 0x01;
        REQUIRE(ComputeEquihashMidstate(changed) == ComputeEquihashMidstate(header));
        REQUIRE(HashEquihashInput(changed, 0) != HashEquihashInput(header, 0));

        changed = header;
        changed[5] ^= 0x01;
        REQUIRE(ComputeEquihashMidstate(changed) != ComputeEquihashMidstate(header));
    }
}
