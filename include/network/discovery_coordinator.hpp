// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/network_scanner.hpp"
#include "network/protocol.hpp"
#include "network/sync_client.hpp"
#include "network/sync_server.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lansync {
namespace network {

class LocalAddressResolver;
class RealTransport;

enum class ServiceRole {
  SERVER_AND_CLIENT, // no peer found: this node hosts the server and joins it
  CLIENT             // joined a server found on the subnet
};

const char *ServiceRoleToString(ServiceRole role);

// Result of discovery. Members are destroyed client first, then server.
struct SyncService {
  std::unique_ptr<SyncServer> server; // null when this node joined a peer
  std::shared_ptr<SyncClient> client;
  ServiceRole role{ServiceRole::CLIENT};
  std::string local_address;
};

struct DiscoveryConfig {
  uint16_t port = protocol::SERVER_PORT;
  ScanConfig scan;
  std::chrono::milliseconds client_connect_timeout = protocol::CLIENT_CONNECT_TIMEOUT;
};

/**
 * DiscoveryCoordinator - one-time discovery and role election
 *
 * get_service() resolves the local address, scans the /24 for a running
 * server and either joins it (CLIENT) or starts a server on the local
 * address and connects to it (SERVER_AND_CLIENT).
 *
 * The first successful result is cached and returned by every later call;
 * concurrent first calls run discovery once. A failed attempt caches
 * nothing and rethrows (NoAddressError, BindError, ConnectError).
 *
 * Blocking; must not be called from the transport's I/O thread. The
 * transport and resolver must outlive the coordinator.
 */
class DiscoveryCoordinator {
public:
  DiscoveryCoordinator(RealTransport &transport, LocalAddressResolver &resolver,
                       DiscoveryConfig config = {});
  ~DiscoveryCoordinator();

  DiscoveryCoordinator(const DiscoveryCoordinator &) = delete;
  DiscoveryCoordinator &operator=(const DiscoveryCoordinator &) = delete;

  std::shared_ptr<SyncService> get_service();

  // Neither accessor waits for a discovery run in progress
  bool has_service() const { return has_service_.load(); }

  // Number of discovery runs started (successful or not)
  size_t discovery_runs() const { return discovery_runs_.load(); }

  const DiscoveryConfig &config() const { return config_; }

private:
  std::shared_ptr<SyncService> create_service();

  RealTransport &transport_;
  LocalAddressResolver &resolver_;
  DiscoveryConfig config_;
  NetworkScanner scanner_;

  // Held across a whole discovery run
  std::mutex mutex_;
  std::shared_ptr<SyncService> service_;
  std::atomic<bool> has_service_{false};
  std::atomic<size_t> discovery_runs_{0};
};

} // namespace network
} // namespace lansync
