// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lansync {
namespace network {

class RealTransport;

// Outcome of one probe. Only VALID contributes an address to a scan.
enum class ProbeStatus {
  VALID,               // peer echoed ECHO_RESPONSE
  UNREACHABLE,         // connect refused, failed or timed out
  TIMED_OUT,           // connected, but no complete reply in time
  UNEXPECTED_RESPONSE, // connected, peer sent something else
  DISCONNECTED         // connected, peer closed before replying
};

const char *ProbeStatusToString(ProbeStatus status);

struct ProbeResult {
  ProbeStatus status{ProbeStatus::UNREACHABLE};
  std::string address;
  uint16_t port{0};
  // Offending payload for UNEXPECTED_RESPONSE, short reason otherwise
  std::string detail;

  bool valid() const { return status == ProbeStatus::VALID; }
};

using ProbeCallback = std::function<void(const ProbeResult &)>;

/**
 * AddressProbe - checks whether a candidate address runs the sync service
 *
 * One probe = connect, send ECHO_REQUEST, wait for ECHO_RESPONSE, close.
 * The whole exchange (connect included) is bounded by the probe timeout.
 * Failures are reported through ProbeResult, never thrown.
 *
 * The transport must outlive every probe started through it.
 */
class AddressProbe {
public:
  explicit AddressProbe(RealTransport &transport,
                        std::chrono::milliseconds timeout = protocol::SOCKET_SEARCH_TIMEOUT);

  // Start a probe. The callback runs exactly once, on the transport's I/O
  // thread, after the probe socket has been closed.
  void probe(const std::string &address, uint16_t port, ProbeCallback callback) const;

  // Blocking variant: the address if it answered correctly, else std::nullopt.
  // Throws std::logic_error when called from the transport's I/O thread.
  std::optional<std::string> probe_sync(const std::string &address, uint16_t port) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  RealTransport &transport_;
  std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace lansync
