// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command-line values to numeric types. Every function
 requires the whole input to be consumed and returns std::nullopt instead
 of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lansync {
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
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("7890") -> 7890
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Split a comma-separated list ("network,server") skipping empty items
std::vector<std::string> SplitCommaList(const std::string& str);

} // namespace util
} // namespace lansync
