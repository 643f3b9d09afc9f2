// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

namespace lansync {
namespace network {

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * Wraps boost::asio::ip::tcp::socket. All socket state is touched only on
 * strand_, so each connection's events are handled in arrival order.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  // Create outbound connection (will connect to remote)
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context,
                  const std::string &address, uint16_t port,
                  std::chrono::milliseconds timeout,
                  ConnectCallback callback);

  // Create inbound connection (already connected socket)
  static TransportConnectionPtr
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  // Non-copyable, non-movable (connections are not reusable)
  RealTransportConnection(const RealTransportConnection&) = delete;
  RealTransportConnection& operator=(const RealTransportConnection&) = delete;
  RealTransportConnection(RealTransportConnection&&) = delete;
  RealTransportConnection& operator=(RealTransportConnection&&) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io_context, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port,
                  std::chrono::milliseconds timeout, ConnectCallback callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();

  // Delivers the disconnect callback exactly once (must be called on strand)
  void deliver_disconnect_once();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  std::atomic<bool> writing_{false};

  // Connect timeout and state. The timer is a unique_ptr so close_impl() can
  // destroy it while the io_context is still alive.
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::atomic<bool> connect_done_{false};
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * RealTransport - boost::asio implementation of Transport
 *
 * Owns the io_context and the reactor thread(s). The sync service runs it
 * with a single I/O thread.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(size_t io_threads = 1);
  ~RealTransport() override;

  // Transport interface
  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 ConnectCallback callback) override;

  bool listen(const std::string &address, uint16_t port,
              AcceptCallback accept_callback,
              std::string *error = nullptr) override;

  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // Access to io_context (for timers, etc.)
  boost::asio::io_context &io_context() { return *io_context_; }

  // Bound listening port (0 if not listening); resolves ephemeral port 0
  uint16_t listening_port() const;

  // True when called from one of this transport's I/O threads
  bool running_in_io_thread() const;

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // io_context_ is only destroyed in ~RealTransport(), after the I/O threads
  // are joined, so it outlives every socket, strand and timer bound to it.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};
};

} // namespace network
} // namespace lansync
