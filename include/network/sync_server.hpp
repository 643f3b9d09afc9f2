// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/connection_handler.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace lansync {
namespace network {

/**
 * SyncServer - listening side of the sync channel
 *
 * Accepts connections on (address, port) and hands each one to a
 * ConnectionHandler tracked in the connection registry. Accepting runs on
 * the transport's I/O thread. Destroying the server stops listening and
 * closes every accepted connection.
 */
class SyncServer {
public:
  // Bind and start accepting. Throws BindError if (address, port) cannot be
  // bound; there is no retry and no fallback port.
  static std::unique_ptr<SyncServer> start(Transport &transport, const std::string &address,
                                           uint16_t port);

  ~SyncServer();

  SyncServer(const SyncServer &) = delete;
  SyncServer &operator=(const SyncServer &) = delete;

  size_t connection_count() const { return registry_->Size(); }
  const std::string &address() const { return address_; }
  uint16_t port() const { return port_; }

private:
  SyncServer(Transport &transport, std::string address, uint16_t port);

  Transport &transport_;
  std::string address_;
  uint16_t port_;
  std::shared_ptr<ConnectionRegistry> registry_;
  bool listening_{false};
};

} // namespace network
} // namespace lansync
