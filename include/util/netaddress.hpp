// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 - ValidateAndNormalizeIP: validates an address string and normalizes
   IPv4-mapped IPv6 to plain IPv4
 - SubnetPrefix: /24 prefix of an IPv4 address, used by the network scan
*/

#include <optional>
#include <string>

namespace lansync {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address():
 * 1. Rejects empty strings, hostnames and malformed addresses
 * 2. Normalizes IPv4-mapped IPv6 addresses (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * /24 prefix of an IPv4 address (first three dot-separated octets)
 *
 * Examples:
 *   "10.0.0.5" -> "10.0.0"
 *   "::1" -> std::nullopt (not IPv4)
 */
std::optional<std::string> SubnetPrefix(const std::string& ipv4_address);

} // namespace util
} // namespace lansync
