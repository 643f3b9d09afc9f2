// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/discovery_coordinator.hpp"
#include "network/errors.hpp"
#include "network/local_address.hpp"
#include "network/real_transport.hpp"
#include "network_test_helpers.hpp"
#include <atomic>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace lansync;
using namespace lansync::network;
using lansync::test::find_free_port;
using lansync::test::wait_until;

namespace {

DiscoveryConfig test_config(uint16_t port) {
    DiscoveryConfig config;
    config.port = port;
    config.scan.first_host = 1;
    config.scan.last_host = 10;
    config.scan.probe_timeout = std::chrono::milliseconds(500);
    config.client_connect_timeout = std::chrono::seconds(2);
    return config;
}

// Resolver that counts lookups
class CountingResolver : public LocalAddressResolver {
public:
    explicit CountingResolver(std::optional<std::string> address) : address_(std::move(address)) {}

    std::optional<std::string> get_local_address() override {
        calls++;
        return address_;
    }

    std::atomic<int> calls{0};

private:
    std::optional<std::string> address_;
};

// Resolver that holds discovery open until released
class GatedResolver : public LocalAddressResolver {
public:
    explicit GatedResolver(std::optional<std::string> address)
        : address_(std::move(address)), gate_(release_.get_future().share()) {}

    std::optional<std::string> get_local_address() override {
        entered.set_value();
        gate_.wait();
        return address_;
    }

    void release() { release_.set_value(); }

    std::promise<void> entered;

private:
    std::optional<std::string> address_;
    std::promise<void> release_;
    std::shared_future<void> gate_;
};

} // namespace

TEST_CASE("Coordinator self-elects when the subnet is empty", "[network][discovery]") {
    // Scenario: node 127.0.0.5, nobody serving on the port
    const uint16_t port = find_free_port({"127.0.0.5"});
    REQUIRE(port != 0);

    RealTransport transport(1);
    transport.run();
    StaticAddressResolver resolver(std::string("127.0.0.5"));
    DiscoveryCoordinator coordinator(transport, resolver, test_config(port));
    CHECK_FALSE(coordinator.has_service());

    auto service = coordinator.get_service();
    REQUIRE(service);
    CHECK(service->role == ServiceRole::SERVER_AND_CLIENT);
    CHECK(service->local_address == "127.0.0.5");

    REQUIRE(service->server);
    CHECK(service->server->address() == "127.0.0.5");
    CHECK(service->server->port() == port);

    REQUIRE(service->client);
    CHECK(service->client->remote_address() == "127.0.0.5");
    CHECK(service->client->remote_port() == port);
    CHECK(service->client->is_connected());

    // The node's own client is the server's first connection
    CHECK(wait_until([&] { return service->server->connection_count() == 1; }));

    service.reset();
    transport.stop();
}

TEST_CASE("Coordinator joins an existing server", "[network][discovery]") {
    // Scenario: 127.0.0.7 serving, new node 127.0.0.9
    const uint16_t port = find_free_port({"127.0.0.7", "127.0.0.9"});
    REQUIRE(port != 0);

    RealTransport first_transport(1);
    first_transport.run();
    StaticAddressResolver first_resolver(std::string("127.0.0.7"));
    DiscoveryCoordinator first(first_transport, first_resolver, test_config(port));
    auto hosting = first.get_service();
    REQUIRE(hosting->role == ServiceRole::SERVER_AND_CLIENT);

    RealTransport second_transport(1);
    second_transport.run();
    StaticAddressResolver second_resolver(std::string("127.0.0.9"));
    DiscoveryCoordinator second(second_transport, second_resolver, test_config(port));
    auto joined = second.get_service();

    CHECK(joined->role == ServiceRole::CLIENT);
    CHECK_FALSE(joined->server);
    REQUIRE(joined->client);
    CHECK(joined->client->remote_address() == "127.0.0.7");
    CHECK(joined->client->remote_port() == port);
    CHECK(joined->client->is_connected());
    CHECK(joined->local_address == "127.0.0.9");

    // Self client plus the joining node (probe connections come and go)
    CHECK(wait_until([&] { return hosting->server->connection_count() == 2; }));

    joined.reset();
    second_transport.stop();
    hosting.reset();
    first_transport.stop();
}

TEST_CASE("Coordinator creates the service once", "[network][discovery]") {
    const uint16_t port = find_free_port({"127.0.0.5"});
    REQUIRE(port != 0);

    RealTransport transport(1);
    transport.run();
    CountingResolver resolver(std::string("127.0.0.5"));
    DiscoveryCoordinator coordinator(transport, resolver, test_config(port));

    SECTION("Sequential calls") {
        auto a = coordinator.get_service();
        auto b = coordinator.get_service();
        CHECK(a == b);
        CHECK(coordinator.has_service());
        CHECK(coordinator.discovery_runs() == 1);
        CHECK(resolver.calls.load() == 1);
    }

    SECTION("Concurrent first calls") {
        constexpr int kThreads = 4;
        std::vector<std::future<std::shared_ptr<SyncService>>> results;
        for (int i = 0; i < kThreads; ++i) {
            results.push_back(std::async(std::launch::async, [&] { return coordinator.get_service(); }));
        }

        std::set<SyncService*> distinct;
        for (auto& f : results) {
            distinct.insert(f.get().get());
        }
        CHECK(distinct.size() == 1);
        CHECK(coordinator.discovery_runs() == 1);
        CHECK(resolver.calls.load() == 1);
    }

    transport.stop();
}

TEST_CASE("Coordinator reports an unresolvable local address", "[network][discovery]") {
    RealTransport transport(1);
    transport.run();
    CountingResolver resolver(std::nullopt);
    DiscoveryCoordinator coordinator(transport, resolver, test_config(7890));

    CHECK_THROWS_AS(coordinator.get_service(), NoAddressError);
    CHECK_FALSE(coordinator.has_service());

    // Failures are not cached: the next call tries again
    CHECK_THROWS_AS(coordinator.get_service(), NoAddressError);
    CHECK(coordinator.discovery_runs() == 2);
    CHECK(resolver.calls.load() == 2);

    transport.stop();
}

TEST_CASE("Coordinator propagates a bind failure", "[network][discovery]") {
    RealTransport transport(1);
    transport.run();

    DiscoveryConfig config = test_config(7890);
    config.scan.first_host = 1;
    config.scan.last_host = 2;
    config.scan.probe_timeout = std::chrono::milliseconds(200);

    // TEST-NET-1: no peer answers and the address is not ours to bind
    StaticAddressResolver resolver(std::string("192.0.2.1"));
    DiscoveryCoordinator coordinator(transport, resolver, config);

    CHECK_THROWS_AS(coordinator.get_service(), BindError);
    CHECK_FALSE(coordinator.has_service());
    transport.stop();
}

TEST_CASE("Coordinator refuses to run on the reactor thread", "[network][discovery]") {
    RealTransport transport(1);
    transport.run();
    StaticAddressResolver resolver(std::string("127.0.0.5"));
    DiscoveryCoordinator coordinator(transport, resolver, test_config(7890));

    std::promise<bool> threw;
    boost::asio::post(transport.io_context(), [&] {
        try {
            (void)coordinator.get_service();
            threw.set_value(false);
        } catch (const std::logic_error&) {
            threw.set_value(true);
        }
    });
    auto future = threw.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(future.get());
    CHECK(coordinator.discovery_runs() == 0);
    transport.stop();
}

TEST_CASE("ServiceRoleToString names both roles", "[network][discovery]") {
    CHECK(std::string(ServiceRoleToString(ServiceRole::SERVER_AND_CLIENT)) == "server+client");
    CHECK(std::string(ServiceRoleToString(ServiceRole::CLIENT)) == "client");
}

TEST_CASE("Coordinator status is readable during discovery", "[network][discovery]") {
    RealTransport transport(1);
    transport.run();
    GatedResolver resolver(std::nullopt);
    DiscoveryCoordinator coordinator(transport, resolver, test_config(7890));

    auto entered = resolver.entered.get_future();
    auto run = std::async(std::launch::async, [&] {
        try {
            (void)coordinator.get_service();
            return false;
        } catch (const NoAddressError&) {
            return true;
        }
    });
    REQUIRE(entered.wait_for(std::chrono::seconds(2)) == std::future_status::ready);

    // get_service() holds its lock inside the resolver right now
    auto status = std::async(std::launch::async, [&] {
        return std::make_pair(coordinator.has_service(), coordinator.discovery_runs());
    });
    const bool answered = status.wait_for(std::chrono::seconds(1)) == std::future_status::ready;

    resolver.release();
    CHECK(run.get());

    REQUIRE(answered);
    auto [has, runs] = status.get();
    CHECK_FALSE(has);
    CHECK(runs == 1);
    CHECK_FALSE(coordinator.has_service());
    transport.stop();
}
