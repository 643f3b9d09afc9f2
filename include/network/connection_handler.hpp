// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace lansync {
namespace network {

class ConnectionHandler;
using ConnectionHandlerPtr = std::shared_ptr<ConnectionHandler>;

// Server-owned set of accepted connections, keyed by connection id
using ConnectionRegistry = util::ThreadSafeMap<uint64_t, ConnectionHandlerPtr>;

enum class ConnectionState { OPEN, CLOSED };

/**
 * ConnectionHandler - protocol loop for one accepted connection
 *
 * OPEN -> CLOSED, once. While open, an inbound ECHO_REQUEST is answered
 * with ECHO_RESPONSE; any other payload is logged. Remote close, I/O error
 * or close() move the handler to CLOSED, which closes the socket and erases
 * the registry entry.
 */
class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler> {
public:
  static ConnectionHandlerPtr create(TransportConnectionPtr connection,
                                     std::weak_ptr<ConnectionRegistry> registry,
                                     std::string server_address);

  ConnectionHandler(const ConnectionHandler &) = delete;
  ConnectionHandler &operator=(const ConnectionHandler &) = delete;

  // Install callbacks and start reading
  void start();

  void close();

  ConnectionState state() const { return state_; }
  bool is_open() const { return state_ == ConnectionState::OPEN; }
  uint64_t id() const { return id_; }
  std::string remote_address() const;

private:
  ConnectionHandler(TransportConnectionPtr connection,
                    std::weak_ptr<ConnectionRegistry> registry,
                    std::string server_address);

  void on_receive(const std::vector<uint8_t> &data);
  void on_disconnect();

  TransportConnectionPtr connection_;
  std::weak_ptr<ConnectionRegistry> registry_;
  uint64_t id_;
  // "serverIp-clientIp", prefixed to every log line of this connection
  std::string tag_;
  std::atomic<ConnectionState> state_{ConnectionState::OPEN};
};

} // namespace network
} // namespace lansync
