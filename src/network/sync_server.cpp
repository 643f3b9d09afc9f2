// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/sync_server.hpp"
#include "network/errors.hpp"
#include "util/logging.hpp"

namespace lansync {
namespace network {

std::unique_ptr<SyncServer> SyncServer::start(Transport &transport, const std::string &address,
                                              uint16_t port) {
  std::unique_ptr<SyncServer> server(new SyncServer(transport, address, port));

  // The accept path only sees the registry, never the server object
  std::weak_ptr<ConnectionRegistry> weak_registry = server->registry_;
  auto on_accept = [weak_registry, address](TransportConnectionPtr connection) {
    auto registry = weak_registry.lock();
    if (!registry) {
      connection->close();
      return;
    }
    LOG_SERVER_INFO("Connection from {}:{}", connection->remote_address(),
                    connection->remote_port());
    auto handler = ConnectionHandler::create(connection, weak_registry, address);
    registry->Insert(handler->id(), handler);
    handler->start();
  };

  std::string error;
  if (!transport.listen(address, port, std::move(on_accept), &error)) {
    LOG_SERVER_ERROR("Another instance of server already running on {}:{} ({})", address, port,
                     error);
    throw BindError(address, port, error);
  }
  server->listening_ = true;

  LOG_SERVER_INFO("Sync server started on {}:{}", address, port);
  return server;
}

SyncServer::SyncServer(Transport &transport, std::string address, uint16_t port)
    : transport_(transport), address_(std::move(address)), port_(port),
      registry_(std::make_shared<ConnectionRegistry>()) {}

SyncServer::~SyncServer() {
  if (listening_) {
    transport_.stop_listening();
  }

  // Snapshot first: close() erases from the registry
  for (const auto &[id, handler] : registry_->GetAll()) {
    handler->close();
  }
}

} // namespace network
} // namespace lansync
