// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lansync {
namespace network {

/**
 * SyncClient - outbound side of the sync channel
 *
 * Holds one connection to a sync server. Inbound data is logged and handed
 * to the optional receive handler. When the server closes the connection
 * the client closes its socket too; there is no reconnection.
 */
class SyncClient : public std::enable_shared_from_this<SyncClient> {
public:
  using MessageHandler = std::function<void(const std::string &)>;

  // Connect and wait for the outcome. Throws ConnectError on failure.
  // Must not be called from the transport's I/O thread.
  static std::shared_ptr<SyncClient>
  connect(Transport &transport, const std::string &address, uint16_t port,
          std::chrono::milliseconds timeout = protocol::CLIENT_CONNECT_TIMEOUT);

  ~SyncClient();

  SyncClient(const SyncClient &) = delete;
  SyncClient &operator=(const SyncClient &) = delete;

  // Queue text for sending; false if the connection is closed
  bool send(const std::string &text);

  // Called on the transport's I/O thread for every inbound chunk
  void set_receive_handler(MessageHandler handler);

  void close();

  bool is_connected() const;
  const std::string &remote_address() const { return address_; }
  uint16_t remote_port() const { return port_; }

private:
  SyncClient(std::string address, uint16_t port);

  void attach(TransportConnectionPtr connection);
  void on_receive(const std::vector<uint8_t> &data);
  void on_disconnect();

  std::string address_;
  uint16_t port_;

  mutable std::mutex mutex_;
  TransportConnectionPtr connection_;
  MessageHandler handler_;
};

} // namespace network
} // namespace lansync
