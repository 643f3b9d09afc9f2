// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license
// Test logging initialization

#include "util/logging.hpp"
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <cstdlib>
#include <string>

namespace {

// Console logging for the whole test run. Level comes from
// LANSYNC_TEST_LOGLEVEL (default: off, so real-socket tests stay quiet).
class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        const char* env = std::getenv("LANSYNC_TEST_LOGLEVEL");
        const std::string level = env ? env : "off";
        lansync::util::LogManager::Initialize(level, false, "");

        if (level == "trace") {
            lansync::util::LogManager::SetComponentLevel("network", "trace");
            lansync::util::LogManager::SetComponentLevel("service", "trace");
        }
    }

    void testRunEnded(Catch::TestRunStats const&) override {
        lansync::util::LogManager::Shutdown();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
