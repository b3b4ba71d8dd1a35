/*
===============================================================================
 Channel Client Test Harness
===============================================================================

Purpose:
--------
Shared setup for the chat, direct-message and generation client tests.

Design:
-------
- Clients run on MockWebSocket and ManualClock
- Tokens come from an in-memory store the test can change between attempts
- open() drives a client to Open in one call; ws() reaches the live transport

===============================================================================
*/
#pragma once

#include <string>
#include <chrono>

#include "cardwire/client/channel.hpp"
#include "cardwire/client/credentials.hpp"
#include "common/mock_websocket.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"


namespace cardwire::client::test {
namespace harness {

using MockWS = cardwire::core::transport::test::MockWebSocket;
using Clock  = cardwire::test::ManualClock;

inline constexpr const char* BASE_URL = "http://localhost:8000/api";
inline constexpr const char* TOKEN    = "tok-123";

// Resets the mock transport and the clock
inline void reset_environment() {
    MockWS::reset();
    Clock::reset();
}

inline ChannelConfig channel_config() {
    ChannelConfig cfg;
    cfg.base_url = BASE_URL;
    return cfg;
}

// Connects `client` and polls until the mock transport reports Open
template <class Client>
inline void open(Client& client) {
    auto pending = client.connect();
    client.poll();
    TEST_CHECK(pending.is_resolved());
    TEST_CHECK(client.is_connected());
}

template <class Client>
inline void advance(Client& client, std::chrono::milliseconds d) {
    Clock::advance(d);
    client.poll();
}

// Live transport of the most recent attempt
inline MockWS& ws() {
    TEST_CHECK(MockWS::last() != nullptr);
    return *MockWS::last();
}

// Delivers one inbound frame and polls
template <class Client>
inline void deliver(Client& client, std::string frame) {
    ws().emit_message(std::move(frame));
    client.poll();
}

// Frames sent so far, keepalives excluded
inline std::size_t sent_count() {
    std::size_t n = 0;
    for (const auto& f : MockWS::sent()) {
        if (f != R"({"action":"ping"})") {
            ++n;
        }
    }
    return n;
}

inline const std::string& last_sent() {
    TEST_CHECK(!MockWS::sent().empty());
    return MockWS::sent().back();
}

} // namespace harness
} // namespace cardwire::client::test
