// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/network_scanner.hpp"
#include "network/real_transport.hpp"
#include "network/sync_server.hpp"
#include "network_test_helpers.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace lansync::network;
using lansync::test::find_free_port;
using lansync::test::to_bytes;

namespace {

// One "LAN host" running a sync server on its own reactor
struct FakeHost {
    FakeHost(const std::string& address, uint16_t port) : transport(1) {
        transport.run();
        server = SyncServer::start(transport, address, port);
    }
    ~FakeHost() {
        server.reset();
        transport.stop();
    }

    RealTransport transport;
    std::unique_ptr<SyncServer> server;
};

ScanConfig small_range(int first = 1, int last = 10) {
    ScanConfig config;
    config.first_host = first;
    config.last_host = last;
    config.probe_timeout = std::chrono::milliseconds(500);
    return config;
}

} // namespace

TEST_CASE("NetworkScanner finds the only responder", "[network][scanner]") {
    const uint16_t port = find_free_port({"127.0.0.7"});
    REQUIRE(port != 0);
    FakeHost host("127.0.0.7", port);

    RealTransport transport(1);
    transport.run();
    NetworkScanner scanner(transport, small_range());

    auto found = scanner.scan("127.0.0.9", port);
    REQUIRE(found.has_value());
    CHECK(*found == "127.0.0.7");
    transport.stop();
}

TEST_CASE("NetworkScanner prefers the lowest host index", "[network][scanner]") {
    const uint16_t port = find_free_port({"127.0.0.3", "127.0.0.8"});
    REQUIRE(port != 0);
    // Start the higher host first: the result must not depend on start order
    FakeHost high("127.0.0.8", port);
    FakeHost low("127.0.0.3", port);

    RealTransport transport(1);
    transport.run();

    SECTION("Unbounded fan-out") {
        NetworkScanner scanner(transport, small_range());
        CHECK(scanner.scan("127.0.0.9", port) == std::optional<std::string>("127.0.0.3"));
    }

    SECTION("At most two probes in flight") {
        ScanConfig config = small_range();
        config.max_concurrent_probes = 2;
        NetworkScanner scanner(transport, config);
        CHECK(scanner.scan("127.0.0.9", port) == std::optional<std::string>("127.0.0.3"));
    }

    transport.stop();
}

TEST_CASE("NetworkScanner returns absent on an empty subnet", "[network][scanner]") {
    const uint16_t port = find_free_port({"127.0.0.1", "127.0.0.5"});
    REQUIRE(port != 0);

    RealTransport transport(1);
    transport.run();
    NetworkScanner scanner(transport, small_range());

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(scanner.scan("127.0.0.5", port).has_value());
    // Every probe is bounded by the probe timeout and they run concurrently
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    transport.stop();
}

TEST_CASE("NetworkScanner ignores hosts speaking another protocol", "[network][scanner]") {
    const uint16_t port = find_free_port({"127.0.0.2", "127.0.0.6"});
    REQUIRE(port != 0);

    // 127.0.0.2 answers with garbage and must not win over 127.0.0.6
    RealTransport other(1);
    std::vector<TransportConnectionPtr> accepted;
    std::mutex m;
    REQUIRE(other.listen("127.0.0.2", port, [&](TransportConnectionPtr c) {
        {
            std::lock_guard<std::mutex> lk(m);
            accepted.push_back(c);
        }
        std::weak_ptr<TransportConnection> weak = c;
        c->set_receive_callback([weak](const std::vector<uint8_t>&) {
            if (auto conn = weak.lock()) conn->send(to_bytes("HTTP/1.1 400 Bad Request\r\n"));
        });
        c->start();
    }));
    other.run();

    FakeHost host("127.0.0.6", port);

    RealTransport transport(1);
    transport.run();
    NetworkScanner scanner(transport, small_range());

    CHECK(scanner.scan("127.0.0.9", port) == std::optional<std::string>("127.0.0.6"));

    transport.stop();
    other.stop();
}

TEST_CASE("NetworkScanner::scan_async reports through the callback", "[network][scanner]") {
    const uint16_t port = find_free_port({"127.0.0.4"});
    REQUIRE(port != 0);
    FakeHost host("127.0.0.4", port);

    RealTransport transport(1);
    transport.run();
    NetworkScanner scanner(transport, small_range(1, 5));

    std::promise<std::optional<std::string>> done;
    scanner.scan_async("127.0.0.1", port, [&done](std::optional<std::string> found) {
        done.set_value(std::move(found));
    });
    auto future = done.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    CHECK(future.get() == std::optional<std::string>("127.0.0.4"));
    transport.stop();
}

TEST_CASE("NetworkScanner rejects unusable input", "[network][scanner]") {
    RealTransport transport(1);
    transport.run();

    SECTION("Local address that is not IPv4") {
        NetworkScanner scanner(transport, small_range());
        CHECK_FALSE(scanner.scan("::1", 7890).has_value());
        CHECK_FALSE(scanner.scan("not-an-ip", 7890).has_value());
        CHECK_FALSE(scanner.scan("", 7890).has_value());
    }

    SECTION("Host range outside the /24") {
        CHECK_THROWS_AS(NetworkScanner(transport, small_range(-1, 10)), std::invalid_argument);
        CHECK_THROWS_AS(NetworkScanner(transport, small_range(0, 256)), std::invalid_argument);
        CHECK_THROWS_AS(NetworkScanner(transport, small_range(10, 9)), std::invalid_argument);
    }

    SECTION("Default range covers .0 through .254") {
        NetworkScanner scanner(transport);
        CHECK(scanner.config().first_host == 0);
        CHECK(scanner.config().last_host == 254);
        CHECK(scanner.config().max_concurrent_probes == 0);
        CHECK(scanner.config().probe_timeout == std::chrono::milliseconds(1000));
    }

    transport.stop();
}

TEST_CASE("NetworkScanner::scan refuses to block the reactor", "[network][scanner]") {
    RealTransport transport(1);
    transport.run();
    NetworkScanner scanner(transport, small_range());

    std::promise<bool> threw;
    boost::asio::post(transport.io_context(), [&] {
        try {
            (void)scanner.scan("127.0.0.1", 7890);
            threw.set_value(false);
        } catch (const std::logic_error&) {
            threw.set_value(true);
        }
    });
    auto future = threw.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(future.get());
    transport.stop();
}

TEST_CASE("NetworkScanner::scan returns promptly when the transport is idle", "[network][scanner]") {
    SECTION("Never started") {
        RealTransport transport(1);
        NetworkScanner scanner(transport, small_range());

        auto result = std::async(std::launch::async, [&] { return scanner.scan("127.0.0.1", 7890); });
        REQUIRE(result.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        CHECK_FALSE(result.get().has_value());
    }

    SECTION("Stopped after running") {
        RealTransport transport(1);
        transport.run();
        transport.stop();
        NetworkScanner scanner(transport, small_range());

        auto result = std::async(std::launch::async, [&] { return scanner.scan("127.0.0.1", 7890); });
        REQUIRE(result.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        CHECK_FALSE(result.get().has_value());
    }
}
