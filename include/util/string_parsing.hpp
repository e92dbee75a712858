#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config values with validation
 - Hex conversion for logging and replaying raw wire bytes

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace algoprobe {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse unsigned 64-bit value (rounds, nonces). Rejects signs.
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

/**
 * Split "host:port" (or "[v6]:port") into its parts
 */
std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str);

bool IsValidHex(const std::string& str);

/**
 * Strict UTF-8 check (rejects overlong forms, surrogates, > U+10FFFF)
 */
bool IsValidUtf8(const uint8_t* data, size_t size);

/**
 * Decode an even-length hex string. Returns std::nullopt on odd length or
 * non-hex characters.
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

std::string HexStr(const uint8_t* data, size_t size);
std::string HexStr(const std::vector<uint8_t>& data);

} // namespace util
} // namespace algoprobe
