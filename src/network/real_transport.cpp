// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <cassert>

namespace lansync {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &address,
    uint16_t port, std::chrono::milliseconds timeout, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  // Defer do_connect onto the strand so shared_from_this() is safe and the
  // object stays alive even if the caller drops the returned pointer.
  boost::asio::post(conn->strand_, [conn, address, port, timeout, callback]() mutable {
    conn->do_connect(address, port, timeout, std::move(callback));
  });
  return conn;
}

TransportConnectionPtr
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }

  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, bool is_inbound)
    : io_context_(io_context), socket_(io_context),
      strand_(io_context.get_executor()),
      is_inbound_(is_inbound),
      id_(next_id_++),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

RealTransportConnection::~RealTransportConnection() {
  // No cleanup or logging here: close() does the work while the shared_ptr
  // is alive, and the logger may already be gone at process exit.
}

void RealTransportConnection::do_connect(const std::string &address,
                                         uint16_t port,
                                         std::chrono::milliseconds timeout,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;
  connect_done_ = false;

  if (timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(timeout);
    connect_timer_->async_wait(boost::asio::bind_executor(
        strand_, [this, self = shared_from_this(), timeout, callback](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          if (connect_done_) return;

          LOG_NET_TRACE("connect timeout to {}:{} after {} ms", remote_addr_, remote_port_,
                        timeout.count());
          connect_done_ = true;
          boost::system::error_code ignored;
          if (resolver_) resolver_->cancel();
          socket_.cancel(ignored);
          socket_.close(ignored);

          if (callback) {
            try {
              callback(false);
            } catch (const std::exception &e) {
              LOG_NET_ERROR("exception in connect callback: {}", e.what());
            }
          }
        }));
  }

  // Resolve address (store resolver_ to allow cancellation)
  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      address, std::to_string(port),
      boost::asio::bind_executor(strand_,
      [this, self = shared_from_this(), callback](const boost::system::error_code &ec,
                 boost::asio::ip::tcp::resolver::results_type results) {
        if (connect_done_) return;
        if (ec) {
          LOG_NET_TRACE("failed to resolve {}: {}", remote_addr_, ec.message());
          connect_done_ = true;
          if (connect_timer_) (void)connect_timer_->cancel();
          if (callback) {
            try {
              callback(false);
            } catch (const std::exception &e) {
              LOG_NET_ERROR("exception in connect callback: {}", e.what());
            }
          }
          return;
        }

        boost::asio::async_connect(
            socket_, results,
            boost::asio::bind_executor(strand_,
            [this, self, callback](const boost::system::error_code &ec,
                                   const boost::asio::ip::tcp::endpoint &) {
              if (connect_done_) return;
              if (ec) {
                LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
                connect_done_ = true;
                if (connect_timer_) (void)connect_timer_->cancel();
                if (callback) {
                  try {
                    callback(false);
                  } catch (const std::exception &e) {
                    LOG_NET_ERROR("exception in connect callback: {}", e.what());
                  }
                }
                return;
              }

              open_ = true;

              boost::system::error_code opt_ec;
              socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

              // Canonicalize remote address/port from the actual socket endpoint
              auto ep = socket_.remote_endpoint(opt_ec);
              if (!opt_ec) {
                remote_addr_ = ep.address().to_string();
                remote_port_ = ep.port();
              }

              LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);
              connect_done_ = true;
              if (connect_timer_) (void)connect_timer_->cancel();
              if (callback) {
                try {
                  callback(true);
                } catch (const std::exception &e) {
                  LOG_NET_ERROR("exception in connect callback: {}", e.what());
                }
              }
            }));
      }));
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_)
    return;

#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  // Fresh buffer per read; a second posted read can never scribble on it
  auto buf = std::make_shared<std::vector<uint8_t>>(protocol::RECV_BUFFER_SIZE);

  socket_.async_read_some(
      boost::asio::buffer(*buf),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), buf](const boost::system::error_code &ec,
                                                 size_t bytes_transferred) {
        // Closed meanwhile: do not reschedule
        if (!open_) {
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (ec) {
          if (ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (bytes_transferred > 0) {
          ReceiveCallback saved_receive_cb = receive_callback_;
          if (saved_receive_cb) {
            LOG_NET_TRACE("tcp received {} bytes from {}:{}", bytes_transferred,
                          remote_addr_, remote_port_);
            std::vector<uint8_t> data(buf->begin(), buf->begin() + bytes_transferred);
            try {
              saved_receive_cb(data);
            } catch (const std::exception &e) {
              LOG_NET_ERROR("exception in receive callback from {}:{}: {}",
                            remote_addr_, remote_port_, e.what());
            }
          }

          // The receive callback may have closed the connection
          if (!open_) {
            return;
          }
        }

        start_read_impl();
      }));
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) return false;
  // Copy before hopping onto the strand; the caller may free `data` as soon
  // as send() returns.
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    // A peer that never reads must not grow our memory without bound
    if (send_queue_bytes_ + payload->size() > protocol::DEFAULT_SEND_QUEUE_SIZE) {
      LOG_NET_WARN("Send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), disconnecting {}:{}",
                   send_queue_bytes_, payload->size(), protocol::DEFAULT_SEND_QUEUE_SIZE,
                   remote_addr_, remote_port_);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_.exchange(true, std::memory_order_acquire)) {
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_)
    return;
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  if (send_queue_.empty()) {
    writing_.store(false, std::memory_order_release);
    return;
  }

  auto data_ptr = send_queue_.front();

  boost::asio::async_write(
      socket_, boost::asio::buffer(*data_ptr),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), data_ptr](const boost::system::error_code &ec,
                                                      size_t) {
        // Closed while the write was in flight; queue already cleared
        if (!open_) {
          return;
        }

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          deliver_disconnect_once();
          close_impl();
          return;
        }

        send_queue_bytes_ -= data_ptr->size();
        send_queue_.pop();

        if (!send_queue_.empty()) {
          do_write_impl();
        } else {
          writing_.store(false, std::memory_order_release);
        }
      }));
}

void RealTransportConnection::deliver_disconnect_once() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering the strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl();
  });
}

void RealTransportConnection::close_impl() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  // A connect still in flight (never opened) is cancelled through the timer
  // and resolver below; its callback will not fire afterwards.
  connect_done_ = true;

  const bool was_open = open_.exchange(false);

  // Move callbacks out before cancelling so a late EOF cannot observe a
  // half-cleared object; they are released at the end of this scope.
  ReceiveCallback saved_receive_cb = std::move(receive_callback_);
  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  receive_callback_ = {};
  disconnect_callback_ = {};

  // Move the socket out and cancel it: pending handlers complete with
  // operation_aborted and see open_ == false.
  {
    boost::asio::ip::tcp::socket socket_to_cancel(std::move(socket_));
    boost::system::error_code cancel_ec;
    socket_to_cancel.cancel(cancel_ec);
    socket_to_cancel.close(cancel_ec);
  }

  // Destroy the timer here, while the io_context is guaranteed alive
  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }

  if (resolver_) {
    resolver_->cancel();
    resolver_.reset();
  }

  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_.store(false, std::memory_order_release);

  if (was_open) {
    LOG_NET_TRACE("closed connection {} to {}:{}", id_, remote_addr_, remote_port_);
  }
}

bool RealTransportConnection::is_open() const { return open_; }

std::string RealTransportConnection::remote_address() const {
  return remote_addr_;
}

uint16_t RealTransportConnection::remote_port() const { return remote_port_; }

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads) {
}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address,
                                              uint16_t port,
                                              std::chrono::milliseconds timeout,
                                              ConnectCallback callback) {
  if (!io_context_) return {};
  return RealTransportConnection::create_outbound(*io_context_, address, port,
                                                  timeout, std::move(callback));
}

bool RealTransport::listen(const std::string &address, uint16_t port,
                           AcceptCallback accept_callback, std::string *error) {
  if (!io_context_) return false;  // io_context already destroyed
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    if (error) *error = "already listening";
    return false;
  }

  if (address.empty()) {
    LOG_NET_ERROR("listen requires a bind address");
    if (error) *error = "no bind address given";
    return false;
  }

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    tcp::endpoint endpoint(boost::asio::ip::make_address(address), port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    // Record the actual bound port (handles ephemeral port 0)
    {
      boost::system::error_code ec;
      auto ep = acceptor_->local_endpoint(ec);
      last_listen_port_ = ec ? 0 : ep.port();
    }

    accept_callback_ = std::move(accept_callback);

    LOG_NET_INFO("listening on {}:{}", address, last_listen_port_ ? last_listen_port_ : port);
    start_accept();
    return true;

  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", address, port, e.what());
    if (error) *error = e.what();
    // Ensure a failed attempt does not leave a half-initialized acceptor_
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    last_listen_port_ = 0;
    return false;
  }
}

void RealTransport::start_accept() {
  if (!acceptor_)
    return;

  // No shared_from_this(): stop_listening()/stop() cancel pending accepts
  // before destruction.
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_DEBUG("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

  std::string remote_addr = "unknown";
  auto remote_ep = socket.remote_endpoint(opt_ec);
  if (!opt_ec) {
    remote_addr = remote_ep.address().to_string() + ":" + std::to_string(remote_ep.port());
  }

  LOG_NET_DEBUG("connection from {} accepted", remote_addr);

  if (!io_context_) {
    return;
  }
  auto conn = RealTransportConnection::create_inbound(*io_context_, std::move(socket));

  // Keep accepting even if the callback throws
  if (accept_callback_) {
    try {
      accept_callback_(conn);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
    }
  }

  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;

  // Release anything the callback captured
  accept_callback_ = {};
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

uint16_t RealTransport::listening_port() const {
  return last_listen_port_;
}

bool RealTransport::running_in_io_thread() const {
  const auto self = std::this_thread::get_id();
  for (const auto &thread : io_threads_) {
    if (thread.get_id() == self) {
      return true;
    }
  }
  return false;
}

void RealTransport::stop() {
  running_.store(false);

  // No logging: called from the destructor, logger may be shut down

  stop_listening();

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  io_threads_.clear();
}

} // namespace network
} // namespace lansync
