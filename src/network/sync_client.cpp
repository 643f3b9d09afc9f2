// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/sync_client.hpp"
#include "network/errors.hpp"
#include "util/logging.hpp"
#include <future>

namespace lansync {
namespace network {

std::shared_ptr<SyncClient> SyncClient::connect(Transport &transport, const std::string &address,
                                                uint16_t port,
                                                std::chrono::milliseconds timeout) {
  LOG_CLIENT_DEBUG("Connecting to {}:{}", address, port);

  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();

  auto connection = transport.connect(address, port, timeout, [promise](bool success) {
    promise->set_value(success);
  });
  if (!connection) {
    LOG_CLIENT_ERROR("Transport refused connection to {}:{}", address, port);
    throw ConnectError(address, port);
  }

  // The transport's own timer bounds the connect; the margin covers a
  // connection closed before its callback could fire
  if (future.wait_for(timeout + std::chrono::seconds(1)) != std::future_status::ready ||
      !future.get()) {
    connection->close();
    LOG_CLIENT_ERROR("Unable to connect to {}:{}", address, port);
    throw ConnectError(address, port);
  }

  std::shared_ptr<SyncClient> client(new SyncClient(address, port));
  client->attach(std::move(connection));
  LOG_CLIENT_INFO("Connected to {}:{}", address, port);
  return client;
}

SyncClient::SyncClient(std::string address, uint16_t port)
    : address_(std::move(address)), port_(port) {}

SyncClient::~SyncClient() {
  TransportConnectionPtr connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection = std::move(connection_);
  }
  if (connection) {
    connection->close();
  }
}

void SyncClient::attach(TransportConnectionPtr connection) {
  std::weak_ptr<SyncClient> weak = shared_from_this();
  connection->set_receive_callback([weak](const std::vector<uint8_t> &data) {
    if (auto self = weak.lock()) {
      self->on_receive(data);
    }
  });
  connection->set_disconnect_callback([weak]() {
    if (auto self = weak.lock()) {
      self->on_disconnect();
    }
  });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = connection;
  }
  connection->start();
}

bool SyncClient::send(const std::string &text) {
  TransportConnectionPtr connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection = connection_;
  }
  if (!connection) {
    return false;
  }
  return connection->send(std::vector<uint8_t>(text.begin(), text.end()));
}

void SyncClient::set_receive_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void SyncClient::on_receive(const std::vector<uint8_t> &data) {
  const std::string text(data.begin(), data.end());
  LOG_CLIENT_DEBUG("Received from {}:{}: {}", address_, port_, text);

  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = handler_;
  }
  if (handler) {
    handler(text);
  }
}

void SyncClient::on_disconnect() {
  LOG_CLIENT_INFO("Server {}:{} closed the connection", address_, port_);
  close();
}

void SyncClient::close() {
  TransportConnectionPtr connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection = std::move(connection_);
    connection_.reset();
  }
  if (connection) {
    connection->close();
    LOG_CLIENT_DEBUG("Connection to {}:{} destroyed", address_, port_);
  }
}

bool SyncClient::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && connection_->is_open();
}

} // namespace network
} // namespace lansync
