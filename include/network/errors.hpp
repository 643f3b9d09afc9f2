// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lansync {
namespace network {

// Startup failures that propagate to the process entry point.

// Listening socket could not be bound (port in use, address not local, ...)
class BindError : public std::runtime_error {
public:
  BindError(const std::string &address, uint16_t port, const std::string &reason)
      : std::runtime_error("Unable to bind sync server to " + address + ":" +
                           std::to_string(port) + ": " + reason),
        address_(address), port_(port) {}

  const std::string &address() const { return address_; }
  uint16_t port() const { return port_; }

private:
  std::string address_;
  uint16_t port_;
};

// This node's LAN address could not be determined
class NoAddressError : public std::runtime_error {
public:
  NoAddressError() : std::runtime_error("Unable to fetch IP address of device") {}
};

// Sync client could not reach the elected server
class ConnectError : public std::runtime_error {
public:
  ConnectError(const std::string &address, uint16_t port)
      : std::runtime_error("Unable to connect sync client to " + address + ":" +
                           std::to_string(port)),
        address_(address), port_(port) {}

  const std::string &address() const { return address_; }
  uint16_t port() const { return port_; }

private:
  std::string address_;
  uint16_t port_;
};

} // namespace network
} // namespace lansync
