// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/network_scanner.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace lansync {
namespace network {

namespace {

// Shared by every probe of one scan; outlives the NetworkScanner call
struct ScanState {
  ScanState(AddressProbe p, std::string pre, uint16_t prt, int first, size_t count,
            size_t cap, NetworkScanner::ScanCallback cb)
      : probe(std::move(p)), prefix(std::move(pre)), port(prt), first_host(first),
        total(count), max_in_flight(cap), valid(count, false), callback(std::move(cb)) {}

  const AddressProbe probe;
  const std::string prefix;
  const uint16_t port;
  const int first_host;
  const size_t total;
  const size_t max_in_flight;

  std::mutex mutex;
  size_t next{0};
  size_t in_flight{0};
  size_t completed{0};
  std::vector<bool> valid;
  NetworkScanner::ScanCallback callback;
};

void LaunchProbes(const std::shared_ptr<ScanState> &state);

void OnProbeDone(const std::shared_ptr<ScanState> &state, size_t index,
                 const ProbeResult &result) {
  bool done = false;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->valid[index] = result.valid();
    state->in_flight--;
    state->completed++;
    done = state->completed == state->total;
  }

  if (!done) {
    LaunchProbes(state);
    return;
  }

  // Positional priority: lowest host index wins
  std::optional<std::string> found;
  for (size_t i = 0; i < state->total; ++i) {
    if (state->valid[i]) {
      found = state->prefix + "." + std::to_string(state->first_host + static_cast<int>(i));
      break;
    }
  }

  if (found) {
    LOG_SERVICE_INFO("Found sync server at {}:{}", *found, state->port);
  } else {
    LOG_SERVICE_INFO("No sync server found on {}.0/24", state->prefix);
  }

  NetworkScanner::ScanCallback callback = std::move(state->callback);
  state->callback = {};
  if (callback) {
    try {
      callback(found);
    } catch (const std::exception &e) {
      LOG_SERVICE_ERROR("exception in scan callback: {}", e.what());
    }
  }
}

void LaunchProbes(const std::shared_ptr<ScanState> &state) {
  std::vector<size_t> batch;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    while (state->next < state->total &&
           (state->max_in_flight == 0 || state->in_flight < state->max_in_flight)) {
      batch.push_back(state->next++);
      state->in_flight++;
    }
  }

  for (size_t index : batch) {
    const std::string address =
        state->prefix + "." + std::to_string(state->first_host + static_cast<int>(index));
    state->probe.probe(address, state->port, [state, index](const ProbeResult &result) {
      OnProbeDone(state, index, result);
    });
  }
}

} // namespace

NetworkScanner::NetworkScanner(RealTransport &transport, ScanConfig config)
    : transport_(transport), config_(config), probe_(transport, config.probe_timeout) {
  if (config_.first_host < 0 || config_.last_host > 255 ||
      config_.first_host > config_.last_host) {
    throw std::invalid_argument("invalid scan range " + std::to_string(config_.first_host) +
                                "-" + std::to_string(config_.last_host));
  }
}

void NetworkScanner::scan_async(const std::string &local_ip, uint16_t port,
                                ScanCallback callback) const {
  auto prefix = util::SubnetPrefix(local_ip);
  if (!prefix) {
    LOG_SERVICE_ERROR("Cannot derive a /24 subnet from '{}'", local_ip);
    if (callback) callback(std::nullopt);
    return;
  }

  const size_t total = static_cast<size_t>(config_.last_host - config_.first_host + 1);
  LOG_SERVICE_INFO("Scanning {}.{}-{} for sync servers on port {}", *prefix,
                   config_.first_host, config_.last_host, port);

  auto state = std::make_shared<ScanState>(probe_, *prefix, port, config_.first_host, total,
                                           config_.max_concurrent_probes, std::move(callback));
  LaunchProbes(state);
}

std::optional<std::string> NetworkScanner::scan(const std::string &local_ip,
                                                uint16_t port) const {
  if (transport_.running_in_io_thread()) {
    throw std::logic_error("NetworkScanner::scan called from the I/O thread");
  }

  auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
  auto future = promise->get_future();
  if (!transport_.is_running()) {
    LOG_SERVICE_ERROR("Cannot scan: transport is not running");
    return std::nullopt;
  }
  scan_async(local_ip, port, [promise](std::optional<std::string> found) {
    promise->set_value(std::move(found));
  });

  // Each wave of probes finishes within one probe timeout
  const int total = config_.last_host - config_.first_host + 1;
  const int cap = config_.max_concurrent_probes;
  const int waves = cap > 0 ? (total + cap - 1) / cap : 1;
  const auto deadline = config_.probe_timeout * waves + std::chrono::seconds(1);

  if (future.wait_for(deadline) != std::future_status::ready) {
    LOG_SERVICE_ERROR("scan did not complete within {} ms (is the transport running?)",
                      std::chrono::duration_cast<std::chrono::milliseconds>(deadline).count());
    return std::nullopt;
  }
  return future.get();
}

} // namespace network
} // namespace lansync
