// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "infra/mock_transport.hpp"
#include "network/connection_handler.hpp"
#include "network/protocol.hpp"
#include <memory>
#include <string>

using namespace lansync;
using namespace lansync::network;

namespace {

struct HandlerFixture {
    HandlerFixture() {
        connection = std::make_shared<MockTransportConnection>();
        connection->set_id(42);
        connection->set_remote_address("10.0.0.9");
        registry = std::make_shared<ConnectionRegistry>();
        handler = ConnectionHandler::create(connection, registry, "10.0.0.5");
        registry->Insert(handler->id(), handler);
        handler->start();
    }

    std::shared_ptr<MockTransportConnection> connection;
    std::shared_ptr<ConnectionRegistry> registry;
    ConnectionHandlerPtr handler;
};

} // namespace

TEST_CASE("ConnectionHandler answers echo requests", "[network][connection]") {
    HandlerFixture f;
    CHECK(f.connection->started());
    CHECK(f.handler->id() == 42);
    CHECK(f.handler->remote_address() == "10.0.0.9");

    f.connection->simulate_receive(std::string(protocol::ECHO_REQUEST));

    auto sent = f.connection->get_sent_messages();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0] == protocol::ECHO_RESPONSE);
    CHECK(f.handler->is_open());

    SECTION("Every request gets its own reply") {
        f.connection->simulate_receive(std::string(protocol::ECHO_REQUEST));
        CHECK(f.connection->sent_message_count() == 2);
    }
}

TEST_CASE("ConnectionHandler only logs other payloads", "[network][connection]") {
    HandlerFixture f;

    f.connection->simulate_receive("sync:payload");
    f.connection->simulate_receive(std::string(protocol::ECHO_RESPONSE));
    // Request with trailing bytes is not a request
    f.connection->simulate_receive(std::string(protocol::ECHO_REQUEST) + "\n");

    CHECK(f.connection->sent_message_count() == 0);
    CHECK(f.handler->is_open());
    CHECK(f.registry->Size() == 1);
}

TEST_CASE("ConnectionHandler closes once on remote disconnect", "[network][connection]") {
    HandlerFixture f;
    REQUIRE(f.registry->Size() == 1);
    REQUIRE(f.registry->GetAll().front().first == 42);

    std::weak_ptr<ConnectionHandler> weak = f.handler;
    f.handler.reset();  // the registry now holds the only reference

    f.connection->simulate_disconnect();

    CHECK(f.registry->Size() == 0);
    CHECK(f.connection->close_calls() == 1);
    CHECK(weak.expired());

    // Late events after close are ignored
    f.connection->simulate_disconnect();
    f.connection->simulate_receive(std::string(protocol::ECHO_REQUEST));
    CHECK(f.connection->close_calls() == 1);
    CHECK(f.connection->sent_message_count() == 0);
}

TEST_CASE("ConnectionHandler::close is idempotent", "[network][connection]") {
    HandlerFixture f;

    f.handler->close();
    CHECK(f.handler->state() == ConnectionState::CLOSED);
    CHECK_FALSE(f.connection->is_open());
    CHECK(f.registry->Size() == 0);

    f.handler->close();
    CHECK(f.connection->close_calls() == 1);

    // No reply once closed
    f.connection->simulate_receive(std::string(protocol::ECHO_REQUEST));
    CHECK(f.connection->sent_message_count() == 0);
}

TEST_CASE("ConnectionHandler outlives its registry", "[network][connection]") {
    HandlerFixture f;

    f.registry.reset();  // server gone; fixture handler still alive
    f.handler->close();
    CHECK(f.handler->state() == ConnectionState::CLOSED);
    CHECK(f.connection->close_calls() == 1);
}

TEST_CASE("Registry returns to zero after every connection closes", "[network][connection]") {
    auto registry = std::make_shared<ConnectionRegistry>();
    std::vector<std::shared_ptr<MockTransportConnection>> connections;

    for (uint64_t id = 1; id <= 5; ++id) {
        auto connection = std::make_shared<MockTransportConnection>();
        connection->set_id(id);
        auto handler = ConnectionHandler::create(connection, registry, "10.0.0.5");
        registry->Insert(handler->id(), handler);
        handler->start();
        connections.push_back(connection);
    }
    REQUIRE(registry->Size() == 5);

    connections[2]->simulate_disconnect();
    CHECK(registry->Size() == 4);
    for (const auto& [id, handler] : registry->GetAll()) {
        CHECK(id != 3);
    }

    for (auto& connection : connections) {
        connection->simulate_disconnect();
    }
    CHECK(registry->Size() == 0);
}
