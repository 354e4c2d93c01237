// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command line values and JSON string fields. Every function
 requires the whole input to be consumed and returns std::nullopt on any
 error; nothing here throws.
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "util/uint.hpp"

namespace equirelay {
namespace util {

/**
 * Parse a decimal integer within [min, max]
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse a decimal int64_t within [min, max]
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse a uint32_t given in decimal or as 0x-prefixed hex (compact bits)
 *
 * Examples:
 *   SafeParseUint32("0x1f07ffff") -> 0x1f07ffff
 *   SafeParseUint32("4294967296") -> std::nullopt (overflow)
 */
std::optional<uint32_t> SafeParseUint32(const std::string& str);

/**
 * True if str is non-empty and all characters are hex digits
 */
bool IsValidHex(const std::string& str);

/**
 * Parse a 64-character hash in display (byte-reversed) order
 */
std::optional<uint256> SafeParseHash(const std::string& str);

/**
 * Parse a 40-character caller id in display (byte-reversed) order
 */
std::optional<uint160> SafeParseUint160(const std::string& str);

/**
 * Decode hex to raw bytes in the order written. Rejects odd lengths.
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

/**
 * Encode raw bytes as lowercase hex in order
 */
std::string HexStr(std::span<const uint8_t> bytes);

} // namespace util
} // namespace equirelay
