// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery_coordinator.hpp"
#include "network/local_address.hpp"
#include "network/network_scanner.hpp"
#include "network/protocol.hpp"
#include "network/real_transport.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>

namespace lansync {
namespace app {

// Application configuration
struct AppConfig {
  // Service port shared by every node
  uint16_t port = protocol::SERVER_PORT;

  // Pin the local address instead of reading it from the interfaces
  std::optional<std::string> bind_address;

  // Only consider this interface when resolving the local address
  std::string interface_name;

  // Subnet sweep (range, concurrency cap, probe timeout)
  network::ScanConfig scan;

  std::chrono::milliseconds client_connect_timeout = protocol::CLIENT_CONNECT_TIMEOUT;

  // Logging
  bool verbose = false;
};

// Application - composition root
// Owns the transport, the address resolver and the discovery coordinator,
// runs discovery on start and handles shutdown signals
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();

  // Runs discovery and role election. Startup failures (NoAddressError,
  // BindError, ConnectError) propagate to the caller.
  bool start();

  void stop();
  void wait_for_shutdown();

  // Valid after a successful start()
  std::shared_ptr<network::SyncService> service() const { return service_; }

  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<network::RealTransport> transport_;
  std::unique_ptr<network::LocalAddressResolver> resolver_;
  std::unique_ptr<network::DiscoveryCoordinator> coordinator_;
  std::shared_ptr<network::SyncService> service_;

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace lansync
