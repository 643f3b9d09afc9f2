// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lansync {
namespace network {

// LocalAddressResolver - supplies this node's own LAN address
// Injected into DiscoveryCoordinator so tests (and --address) can pin it.
class LocalAddressResolver {
public:
  virtual ~LocalAddressResolver() = default;

  // IPv4 address of this node, or std::nullopt if none can be determined
  virtual std::optional<std::string> get_local_address() = 0;
};

/**
 * InterfaceAddressResolver - walks the host's network interfaces (getifaddrs)
 *
 * Selection rules, in order:
 * - only interfaces that are up, not loopback, with an IPv4 address
 * - link-local 169.254.0.0/16 is skipped
 * - a private address (10/8, 172.16/12, 192.168/16) wins over a public one
 * - if interface_name is set, only that interface is considered
 */
class InterfaceAddressResolver : public LocalAddressResolver {
public:
  explicit InterfaceAddressResolver(std::string interface_name = "");

  std::optional<std::string> get_local_address() override;

  // Name of the interface the last successful lookup picked
  const std::string &selected_interface() const { return selected_interface_; }

private:
  std::string interface_name_;
  std::string selected_interface_;
};

// StaticAddressResolver - returns a fixed address (configuration override)
class StaticAddressResolver : public LocalAddressResolver {
public:
  explicit StaticAddressResolver(std::optional<std::string> address)
      : address_(std::move(address)) {}

  std::optional<std::string> get_local_address() override { return address_; }

private:
  std::optional<std::string> address_;
};

// Address classification helpers (host byte order)
bool IsPrivateIPv4(uint32_t host_order_addr);
bool IsLinkLocalIPv4(uint32_t host_order_addr);

} // namespace network
} // namespace lansync
