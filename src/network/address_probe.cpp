// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "network/address_probe.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <boost/asio.hpp>
#include <future>
#include <memory>
#include <stdexcept>

namespace lansync {
namespace network {

const char *ProbeStatusToString(ProbeStatus status) {
  switch (status) {
  case ProbeStatus::VALID:
    return "valid";
  case ProbeStatus::UNREACHABLE:
    return "unreachable";
  case ProbeStatus::TIMED_OUT:
    return "timed out";
  case ProbeStatus::UNEXPECTED_RESPONSE:
    return "unexpected response";
  case ProbeStatus::DISCONNECTED:
    return "disconnected";
  }
  return "unknown";
}

namespace {

// State of one in-flight probe. Every event (connect result, data,
// disconnect, timer) is funneled through strand_, so finish() runs once.
class ProbeAttempt : public std::enable_shared_from_this<ProbeAttempt> {
public:
  ProbeAttempt(RealTransport &transport, std::string address, uint16_t port,
               std::chrono::milliseconds timeout, ProbeCallback callback)
      : transport_(transport), strand_(transport.io_context().get_executor()),
        timer_(transport.io_context()), address_(std::move(address)), port_(port),
        timeout_(timeout), callback_(std::move(callback)) {}

  void start() {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->begin(); });
  }

private:
  void begin() {
    // The pending timer handler keeps the attempt alive until finish()
    timer_.expires_after(timeout_);
    timer_.async_wait(boost::asio::bind_executor(
        strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          self->finish(ProbeStatus::TIMED_OUT,
                       "no reply within " + std::to_string(self->timeout_.count()) + " ms");
        }));

    std::weak_ptr<ProbeAttempt> weak = shared_from_this();
    connection_ = transport_.connect(address_, port_, timeout_, [weak](bool success) {
      if (auto self = weak.lock()) {
        boost::asio::post(self->strand_, [self, success]() { self->on_connected(success); });
      }
    });

    if (!connection_) {
      finish(ProbeStatus::UNREACHABLE, "transport unavailable");
    }
  }

  void on_connected(bool success) {
    if (done_) return;
    if (!success) {
      finish(ProbeStatus::UNREACHABLE, "connect failed");
      return;
    }

    std::weak_ptr<ProbeAttempt> weak = shared_from_this();
    connection_->set_receive_callback([weak](const std::vector<uint8_t> &data) {
      if (auto self = weak.lock()) {
        std::string chunk(data.begin(), data.end());
        boost::asio::post(self->strand_, [self, chunk = std::move(chunk)]() {
          self->on_data(chunk);
        });
      }
    });
    connection_->set_disconnect_callback([weak]() {
      if (auto self = weak.lock()) {
        boost::asio::post(self->strand_, [self]() {
          self->finish(ProbeStatus::DISCONNECTED, "closed by peer");
        });
      }
    });
    connection_->start();

    const std::vector<uint8_t> request(protocol::ECHO_REQUEST.begin(),
                                       protocol::ECHO_REQUEST.end());
    if (!connection_->send(request)) {
      finish(ProbeStatus::DISCONNECTED, "send failed");
    }
  }

  void on_data(const std::string &chunk) {
    if (done_) return;
    received_ += chunk;

    const std::string_view expected = protocol::ECHO_RESPONSE;
    if (received_ == expected) {
      finish(ProbeStatus::VALID, "");
      return;
    }
    // Reply split across reads: keep waiting for the rest
    if (received_.size() < expected.size() &&
        expected.substr(0, received_.size()) == received_) {
      return;
    }

    LOG_SERVICE_WARN("Unexpected response from {}:{}: '{}'", address_, port_, received_);
    finish(ProbeStatus::UNEXPECTED_RESPONSE, received_);
  }

  void finish(ProbeStatus status, std::string detail) {
    if (done_) return;
    done_ = true;

    (void)timer_.cancel();
    if (connection_) {
      connection_->close();
      connection_.reset();
    }

    LOG_SERVICE_DEBUG("probe {}:{} -> {}{}{}", address_, port_, ProbeStatusToString(status),
                      detail.empty() ? "" : ": ", detail);

    ProbeResult result;
    result.status = status;
    result.address = address_;
    result.port = port_;
    result.detail = std::move(detail);

    ProbeCallback callback = std::move(callback_);
    callback_ = {};
    if (callback) {
      try {
        callback(result);
      } catch (const std::exception &e) {
        LOG_SERVICE_ERROR("exception in probe callback for {}:{}: {}", address_, port_, e.what());
      }
    }
  }

  RealTransport &transport_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer timer_;
  std::string address_;
  uint16_t port_;
  std::chrono::milliseconds timeout_;
  ProbeCallback callback_;

  TransportConnectionPtr connection_;
  std::string received_;
  bool done_{false};
};

} // namespace

AddressProbe::AddressProbe(RealTransport &transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout) {}

void AddressProbe::probe(const std::string &address, uint16_t port,
                         ProbeCallback callback) const {
  auto attempt = std::make_shared<ProbeAttempt>(transport_, address, port, timeout_,
                                                std::move(callback));
  attempt->start();
}

std::optional<std::string> AddressProbe::probe_sync(const std::string &address,
                                                    uint16_t port) const {
  if (transport_.running_in_io_thread()) {
    throw std::logic_error("AddressProbe::probe_sync called from the I/O thread");
  }

  auto promise = std::make_shared<std::promise<ProbeResult>>();
  auto future = promise->get_future();
  probe(address, port, [promise](const ProbeResult &result) { promise->set_value(result); });

  // The probe timer bounds the wait unless the reactor is not running
  if (future.wait_for(timeout_ + std::chrono::seconds(1)) != std::future_status::ready) {
    LOG_SERVICE_ERROR("probe {}:{} did not complete (is the transport running?)", address, port);
    return std::nullopt;
  }

  ProbeResult result = future.get();
  if (!result.valid()) {
    return std::nullopt;
  }
  return result.address;
}

} // namespace network
} // namespace lansync
