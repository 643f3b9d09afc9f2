// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/local_address.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace lansync {
namespace network {

bool IsPrivateIPv4(uint32_t host_order_addr) {
  // 10.0.0.0/8
  if ((host_order_addr & 0xFF000000u) == 0x0A000000u)
    return true;
  // 172.16.0.0/12
  if ((host_order_addr & 0xFFF00000u) == 0xAC100000u)
    return true;
  // 192.168.0.0/16
  if ((host_order_addr & 0xFFFF0000u) == 0xC0A80000u)
    return true;
  return false;
}

bool IsLinkLocalIPv4(uint32_t host_order_addr) {
  return (host_order_addr & 0xFFFF0000u) == 0xA9FE0000u;
}

InterfaceAddressResolver::InterfaceAddressResolver(std::string interface_name)
    : interface_name_(std::move(interface_name)) {}

std::optional<std::string> InterfaceAddressResolver::get_local_address() {
  struct ifaddrs *ifaddr = nullptr;
  if (getifaddrs(&ifaddr) == -1) {
    LOG_SERVICE_ERROR("getifaddrs failed; cannot enumerate network interfaces");
    return std::nullopt;
  }

  std::optional<boost::asio::ip::address_v4> best_private;
  std::optional<boost::asio::ip::address_v4> best_public;
  std::string best_private_ifc;
  std::string best_public_ifc;

  for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
      continue;

    const unsigned flags = ifa->ifa_flags;
    if (!(flags & IFF_UP) || (flags & IFF_LOOPBACK))
      continue;

    std::string ifc_name = ifa->ifa_name ? ifa->ifa_name : "";
    if (!interface_name_.empty() && ifc_name != interface_name_)
      continue;

    auto *sa = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
    const uint32_t addr_host = ntohl(sa->sin_addr.s_addr);
    if (IsLinkLocalIPv4(addr_host))
      continue;

    boost::asio::ip::address_v4 addr(addr_host);
    if (IsPrivateIPv4(addr_host)) {
      if (!best_private) {
        best_private = addr;
        best_private_ifc = ifc_name;
      }
    } else if (!best_public) {
      best_public = addr;
      best_public_ifc = ifc_name;
    }
  }

  freeifaddrs(ifaddr);

  if (best_private) {
    selected_interface_ = best_private_ifc;
    LOG_SERVICE_DEBUG("Local address {} on interface {}", best_private->to_string(),
                      selected_interface_);
    return best_private->to_string();
  }
  if (best_public) {
    selected_interface_ = best_public_ifc;
    LOG_SERVICE_DEBUG("Local address {} on interface {} (not private)",
                      best_public->to_string(), selected_interface_);
    return best_public->to_string();
  }

  if (!interface_name_.empty()) {
    LOG_SERVICE_ERROR("No usable IPv4 address on interface {}", interface_name_);
  }
  return std::nullopt;
}

} // namespace network
} // namespace lansync
