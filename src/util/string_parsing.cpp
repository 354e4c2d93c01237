// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <charconv>

namespace equirelay {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseWhole(const std::string& str, int base) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }
  T value{};
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWhole<int>(str, 10);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  auto value = ParseWhole<int64_t>(str, 10);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint32_t> SafeParseUint32(const std::string& str) {
  if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    return ParseWhole<uint32_t>(str.substr(2), 16);
  }
  return ParseWhole<uint32_t>(str, 10);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  if (str.size() != 64 || !IsValidHex(str)) {
    return std::nullopt;
  }
  return uint256S(str);
}

std::optional<uint160> SafeParseUint160(const std::string& str) {
  if (str.size() != 40 || !IsValidHex(str)) {
    return std::nullopt;
  }
  return uint160S(str);
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexValue(str[i]);
    int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

} // namespace util
} // namespace equirelay
