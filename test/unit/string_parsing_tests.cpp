// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>
#include <string>
#include <vector>

using namespace equirelay;
using namespace equirelay::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE(SafeParseInt("-50", -100, 100) == -50);
    REQUIRE(SafeParseInt("0", 0, 100) == 0);
    REQUIRE(SafeParseInt("100", 0, 100) == 100);
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("99999999999", 0, std::numeric_limits<int>::max()).has_value());
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4.2", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 and SafeParseUint32", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("1477641360", 0, std::numeric_limits<int64_t>::max()) == 1477641360);
    REQUIRE_FALSE(SafeParseInt64("-5", 0, 10).has_value());

    REQUIRE(SafeParseUint32("0x1f07ffff") == 0x1f07ffffu);
    REQUIRE(SafeParseUint32("4294967295") == 0xffffffffu);
    REQUIRE_FALSE(SafeParseUint32("4294967296").has_value());
    REQUIRE_FALSE(SafeParseUint32("0x1g").has_value());
    REQUIRE_FALSE(SafeParseUint32("-1").has_value());
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("0123456789abcdefABCDEF"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("0x12"));
    REQUIRE_FALSE(IsValidHex("12 34"));
}

TEST_CASE("SafeParseHash and SafeParseUint160", "[util][string_parsing]") {
    const std::string hash_hex = "00040fe8ec8471911baa1db1266ea15dd06b4a8a5c453883c000b031973dce08";

    SECTION("Hash") {
        auto hash = SafeParseHash(hash_hex);
        REQUIRE(hash.has_value());
        REQUIRE(hash->GetHex() == hash_hex);
        REQUIRE_FALSE(SafeParseHash(hash_hex.substr(1)).has_value());
        REQUIRE_FALSE(SafeParseHash("0x" + hash_hex.substr(2)).has_value());
    }

    SECTION("Caller id") {
        auto caller = SafeParseUint160("00112233445566778899aabbccddeeff00112233");
        REQUIRE(caller.has_value());
        REQUIRE(caller->GetHex() == "00112233445566778899aabbccddeeff00112233");
        REQUIRE_FALSE(SafeParseUint160(hash_hex).has_value());
        REQUIRE_FALSE(SafeParseUint160("zz112233445566778899aabbccddeeff00112233").has_value());
    }
}

TEST_CASE("ParseHex and HexStr", "[util][string_parsing]") {
    SECTION("Decoding") {
        REQUIRE(ParseHex("00ff7A") == std::vector<uint8_t>{0x00, 0xff, 0x7a});
        REQUIRE(ParseHex("") == std::vector<uint8_t>{});
        REQUIRE_FALSE(ParseHex("abc").has_value());
        REQUIRE_FALSE(ParseHex("zz").has_value());
    }

    SECTION("Encoding is lowercase") {
        const std::vector<uint8_t> bytes = {0xde, 0xad, 0xBE, 0xef, 0x01};
        REQUIRE(HexStr(bytes) == "deadbeef01");
        REQUIRE(HexStr(std::vector<uint8_t>{}).empty());
    }
}
