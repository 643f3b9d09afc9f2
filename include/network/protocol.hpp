// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lansync {
namespace protocol {

// Well-known service port shared by every node on the LAN
constexpr uint16_t SERVER_PORT = 7890;

// Liveness exchange: raw bytes, no framing or terminator
constexpr std::string_view ECHO_REQUEST = "lansync:echo:req";
constexpr std::string_view ECHO_RESPONSE = "lansync:echo:res";

// A probe that cannot connect and complete the echo exchange within this
// window treats the address as "no server here"
constexpr std::chrono::milliseconds SOCKET_SEARCH_TIMEOUT{1000};

// Outbound connect timeout for the long-lived sync client
constexpr std::chrono::milliseconds CLIENT_CONNECT_TIMEOUT{std::chrono::seconds(10)};

// Scan range inside the /24 subnet: host indices [FIRST, LAST]
// .0 is probed too; .255 (broadcast) is not
constexpr int SCAN_FIRST_HOST = 0;
constexpr int SCAN_LAST_HOST = 254;

// 0 = launch every probe at once
constexpr size_t DEFAULT_MAX_CONCURRENT_PROBES = 0;

// Per-connection receive buffer and send queue cap
constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 1 * 1024 * 1024; // 1 MB

} // namespace protocol
} // namespace lansync
