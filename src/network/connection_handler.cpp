// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/connection_handler.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace lansync {
namespace network {

ConnectionHandlerPtr ConnectionHandler::create(TransportConnectionPtr connection,
                                               std::weak_ptr<ConnectionRegistry> registry,
                                               std::string server_address) {
  return ConnectionHandlerPtr(
      new ConnectionHandler(std::move(connection), std::move(registry), std::move(server_address)));
}

ConnectionHandler::ConnectionHandler(TransportConnectionPtr connection,
                                     std::weak_ptr<ConnectionRegistry> registry,
                                     std::string server_address)
    : connection_(std::move(connection)), registry_(std::move(registry)),
      id_(connection_->connection_id()),
      tag_(server_address + "-" + connection_->remote_address()) {}

void ConnectionHandler::start() {
  std::weak_ptr<ConnectionHandler> weak = shared_from_this();
  connection_->set_receive_callback([weak](const std::vector<uint8_t> &data) {
    if (auto self = weak.lock()) {
      self->on_receive(data);
    }
  });
  connection_->set_disconnect_callback([weak]() {
    if (auto self = weak.lock()) {
      self->on_disconnect();
    }
  });
  connection_->start();
  LOG_CONN_DEBUG("[{}] connection {} open", tag_, id_);
}

void ConnectionHandler::on_receive(const std::vector<uint8_t> &data) {
  if (!is_open()) return;

  const std::string text(data.begin(), data.end());
  LOG_CONN_DEBUG("[{}] received: {}", tag_, text);

  if (text == protocol::ECHO_REQUEST) {
    const std::vector<uint8_t> reply(protocol::ECHO_RESPONSE.begin(),
                                     protocol::ECHO_RESPONSE.end());
    if (!connection_->send(reply)) {
      LOG_CONN_ERROR("[{}] failed to send echo reply", tag_);
    }
  }
  // Other payloads are reserved for the sync protocol; logging only for now
}

void ConnectionHandler::on_disconnect() {
  LOG_CONN_INFO("[{}] Client left. Closing connection.", tag_);
  close();
}

void ConnectionHandler::close() {
  ConnectionState expected = ConnectionState::OPEN;
  if (!state_.compare_exchange_strong(expected, ConnectionState::CLOSED)) {
    return;
  }

  // The registry may hold the last reference
  auto self = shared_from_this();

  connection_->close();
  if (auto registry = registry_.lock()) {
    registry->Erase(id_);
  }
  LOG_CONN_DEBUG("[{}] connection {} closed", tag_, id_);
}

std::string ConnectionHandler::remote_address() const {
  return connection_->remote_address();
}

} // namespace network
} // namespace lansync
