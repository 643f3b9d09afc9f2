// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lansync {
namespace network {

// Abstract transport interface for network communication
// Allows dependency injection of different implementations:
// - RealTransport: TCP sockets via boost::asio
// - MockTransportConnection: in-memory connection for unit tests (in test/)

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Callback types for transport events
using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one byte stream (TCP socket, in-memory pipe, ...)
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving data (callbacks invoked when data arrives or connection
  // closes)
  virtual void start() = 0;

  // Send data. Returns false only if the connection is already closed at
  // call time; true means the send was accepted, not that it was written.
  // Fatal write errors surface through the disconnect callback.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  // Local close. Does not deliver the disconnect callback.
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;

  // Delivered at most once, when the remote side closes or an I/O error occurs
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - Factory for creating connections
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate outbound connection. The callback fires exactly once with the
  // outcome; a connect that does not complete within `timeout` fails.
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         std::chrono::milliseconds timeout,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections on address:port. The address must be
  // a concrete IP. Returns false and fills `error` (if given) when it is
  // empty or the socket cannot be bound.
  virtual bool listen(const std::string &address, uint16_t port,
                      AcceptCallback accept_callback,
                      std::string *error = nullptr) = 0;

  virtual void stop_listening() = 0;

  // Run transport event loop on background thread(s)
  virtual void run() = 0;

  // Stop transport (stops listening, stops the event loop)
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace lansync
