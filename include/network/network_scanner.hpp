// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/address_probe.hpp"
#include "network/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lansync {
namespace network {

class RealTransport;

struct ScanConfig {
  // Host indices probed inside the /24: [first_host, last_host]
  int first_host = protocol::SCAN_FIRST_HOST;
  int last_host = protocol::SCAN_LAST_HOST;
  // Probes in flight at once; 0 launches the whole range immediately
  size_t max_concurrent_probes = protocol::DEFAULT_MAX_CONCURRENT_PROBES;
  std::chrono::milliseconds probe_timeout = protocol::SOCKET_SEARCH_TIMEOUT;
};

/**
 * NetworkScanner - sweeps the local /24 subnet for a running sync server
 *
 * Every host in the configured range is probed concurrently. The scan waits
 * for all probes and then picks the lowest host index that answered, so the
 * result does not depend on which peer replied first.
 */
class NetworkScanner {
public:
  using ScanCallback = std::function<void(std::optional<std::string>)>;

  // Throws std::invalid_argument for a host range outside [0, 255]
  explicit NetworkScanner(RealTransport &transport, ScanConfig config = {});

  // Asynchronous scan. The callback runs once, on the transport's I/O thread
  // (or inline when local_ip is not a usable IPv4 address).
  void scan_async(const std::string &local_ip, uint16_t port, ScanCallback callback) const;

  // Blocking scan. Must not be called from the transport's I/O thread.
  // Returns absent without probing when the transport is not running; the
  // wait is bounded by one probe timeout per wave of in-flight probes.
  std::optional<std::string> scan(const std::string &local_ip, uint16_t port) const;

  const ScanConfig &config() const { return config_; }

private:
  RealTransport &transport_;
  ScanConfig config_;
  AddressProbe probe_;
};

} // namespace network
} // namespace lansync
