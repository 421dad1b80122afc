#include "util/string_parsing.hpp"
#include "util/uint.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace blockdag {
namespace util {

namespace {

// std::sto* report bad input and overflow as std::invalid_argument and
// std::out_of_range, both std::logic_error
template <typename T, typename Parse>
std::optional<T> ParseBounded(const std::string& str, T min, T max, Parse parse) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  size_t pos = 0;
  T value{};
  try {
    value = static_cast<T>(parse(str, &pos));
  } catch (const std::logic_error&) {
    return std::nullopt;
  }

  // Check entire string was consumed
  if (pos != str.size()) {
    return std::nullopt;
  }

  // Check bounds
  if (value < min || value > max) {
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
  // Parse as long so out-of-int-range values fail the bounds check
  auto value = ParseBounded<long>(str, min, max, [](const std::string& s, size_t* pos) {
    return std::stol(s, pos);
  });
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  return ParseBounded<int64_t>(str, min, max, [](const std::string& s, size_t* pos) {
    return std::stoll(s, pos);
  });
}

std::optional<double> SafeParseDouble(const std::string& str, double min, double max) {
  auto value = ParseBounded<double>(str, min, max, [](const std::string& s, size_t* pos) {
    return std::stod(s, pos);
  });
  if (value && !std::isfinite(*value)) {
    return std::nullopt;
  }
  return value;
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
  // Check length
  if (str.size() != 64) {
    return std::nullopt;
  }

  // Validate hex characters using helper
  if (!IsValidHex(str)) {
    return std::nullopt;
  }

  uint256 hash;
  hash.SetHex(str);
  return hash;
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static constexpr char kHexChars[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHexChars[b >> 4]);
    out.push_back(kHexChars[b & 0x0f]);
  }
  return out;
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

} // namespace util
} // namespace blockdag
