#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Hex encoding of byte strings (scripts, payloads) for JSON export
 - Centralized input validation for command-line options and files

 Key functions:
 - SafeParseInt / SafeParseInt64 / SafeParseDouble: bounded numeric parsing
 - SafeParseHash: Parse 64-character hexadecimal hash string
 - HexStr / ParseHex: byte string <-> lower-case hex

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// uint256 must be fully defined for std::optional<uint256>
#include "util/uint.hpp"

namespace blockdag {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt (overflow)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse finite floating point string with bounds checking
 *
 * Examples:
 *   SafeParseDouble("2.5", 0.0, 10.0) -> 2.5
 *   SafeParseDouble("nan", 0.0, 10.0) -> std::nullopt
 */
std::optional<double> SafeParseDouble(const std::string& str, double min, double max);

/**
 * Validate hexadecimal string
 *
 * Examples:
 *   IsValidHex("deadbeef") -> true
 *   IsValidHex("xyz") -> false
 *   IsValidHex("") -> false
 */
bool IsValidHex(const std::string& str);

/**
 * Parse 64-character hexadecimal hash string
 *
 * Examples:
 *   SafeParseHash("0123456789abcdef...") -> valid uint256
 *   SafeParseHash("123") -> std::nullopt (wrong length)
 */
std::optional<uint256> SafeParseHash(const std::string& str);

/**
 * Lower-case hex of a byte string (in memory order)
 */
std::string HexStr(std::span<const uint8_t> bytes);

/**
 * Parse an even-length hex string into bytes ("" -> empty vector)
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

} // namespace util
} // namespace blockdag
