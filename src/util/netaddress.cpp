// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address.hpp>

namespace lansync {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

std::optional<std::string> SubnetPrefix(const std::string& ipv4_address) {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address_v4(ipv4_address, ec);
  if (ec) {
    return std::nullopt;
  }

  const std::string canonical = ip.to_string();
  return canonical.substr(0, canonical.rfind('.'));
}

} // namespace util
} // namespace lansync
