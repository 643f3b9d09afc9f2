// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace lansync {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Banner goes to stdout even when logging to a file
  std::cout << GetStartupBanner(config_.port) << std::flush;

  LOG_INFO("Initializing LanSync...");

  // Single I/O thread: all socket callbacks run on one reactor
  transport_ = std::make_unique<network::RealTransport>(1);
  transport_->run();

  if (config_.bind_address) {
    LOG_INFO("Using configured local address {}", *config_.bind_address);
    resolver_ = std::make_unique<network::StaticAddressResolver>(config_.bind_address);
  } else {
    resolver_ = std::make_unique<network::InterfaceAddressResolver>(config_.interface_name);
  }

  network::DiscoveryConfig discovery_config;
  discovery_config.port = config_.port;
  discovery_config.scan = config_.scan;
  discovery_config.client_connect_timeout = config_.client_connect_timeout;

  try {
    coordinator_ = std::make_unique<network::DiscoveryCoordinator>(*transport_, *resolver_,
                                                                   discovery_config);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid discovery configuration: {}", e.what());
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!coordinator_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting LanSync...");

  setup_signal_handlers();

  service_ = coordinator_->get_service();

  running_ = true;

  LOG_INFO("LanSync started successfully");
  LOG_INFO("Local address: {}", service_->local_address);
  LOG_INFO("Role: {}", network::ServiceRoleToString(service_->role));
  if (service_->server) {
    LOG_INFO("Serving on {}:{}", service_->server->address(), service_->server->port());
  }
  LOG_INFO("Client connected to {}:{}", service_->client->remote_address(),
           service_->client->remote_port());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down LanSync...");

  running_ = false;

  // Stop the reactor first so no callback touches the service below
  if (transport_) {
    transport_->stop();
  }

  service_.reset();
  coordinator_.reset();

  LOG_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    (void)!write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace lansync
