// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/discovery_coordinator.hpp"
#include "network/errors.hpp"
#include "network/local_address.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace lansync {
namespace network {

const char *ServiceRoleToString(ServiceRole role) {
  switch (role) {
  case ServiceRole::SERVER_AND_CLIENT:
    return "server+client";
  case ServiceRole::CLIENT:
    return "client";
  }
  return "unknown";
}

DiscoveryCoordinator::DiscoveryCoordinator(RealTransport &transport,
                                           LocalAddressResolver &resolver,
                                           DiscoveryConfig config)
    : transport_(transport), resolver_(resolver), config_(config),
      scanner_(transport, config.scan) {}

DiscoveryCoordinator::~DiscoveryCoordinator() = default;

std::shared_ptr<SyncService> DiscoveryCoordinator::get_service() {
  if (transport_.running_in_io_thread()) {
    throw std::logic_error("DiscoveryCoordinator::get_service called from the I/O thread");
  }

  // Held across discovery: concurrent first callers wait for the one result
  std::lock_guard<std::mutex> lock(mutex_);
  if (service_) {
    return service_;
  }
  discovery_runs_++;
  service_ = create_service();
  has_service_.store(true);
  return service_;
}

std::shared_ptr<SyncService> DiscoveryCoordinator::create_service() {
  auto local_address = resolver_.get_local_address();
  if (!local_address) {
    LOG_SERVICE_ERROR("Unable to fetch IP address of device");
    throw NoAddressError();
  }
  LOG_SERVICE_INFO("Local address: {}", *local_address);

  auto service = std::make_shared<SyncService>();
  service->local_address = *local_address;

  auto peer = scanner_.scan(*local_address, config_.port);
  if (peer) {
    LOG_SERVICE_INFO("Joining sync server at {}:{}", *peer, config_.port);
    service->client = SyncClient::connect(transport_, *peer, config_.port,
                                          config_.client_connect_timeout);
    service->role = ServiceRole::CLIENT;
  } else {
    LOG_SERVICE_INFO("No sync server on the network, hosting one at {}:{}", *local_address,
                     config_.port);
    // If the client cannot connect, the server is released by the unwind
    service->server = SyncServer::start(transport_, *local_address, config_.port);
    service->client = SyncClient::connect(transport_, *local_address, config_.port,
                                          config_.client_connect_timeout);
    service->role = ServiceRole::SERVER_AND_CLIENT;
  }

  LOG_SERVICE_INFO("Sync service ready (role: {})", ServiceRoleToString(service->role));
  return service;
}

} // namespace network
} // namespace lansync
