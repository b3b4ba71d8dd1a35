/*
================================================================================
cardwire Connection Configuration
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <string>


namespace cardwire::core::transport::connection {

// Capacity of the signal ring buffer (number of signals)
inline constexpr std::size_t SIGNAL_RING_CAPACITY = 64;

// Capacity of the transport event ring (messages + control events)
inline constexpr std::size_t EVENT_RING_CAPACITY = 1024;

inline constexpr int                       DEFAULT_MAX_ATTEMPTS       = 5;
inline constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY         {1000};
inline constexpr std::chrono::milliseconds DEFAULT_KEEPALIVE_INTERVAL {30000};
inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT    {10000};

struct Config {
    // Reconnection policy
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds base_delay = DEFAULT_BASE_DELAY;

    // Keepalive (zero disables it)
    std::chrono::milliseconds keepalive_interval = DEFAULT_KEEPALIVE_INTERVAL;
    std::string keepalive_payload = R"({"action":"ping"})";

    // Upper bound for a single attempt to reach Open
    std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT;
};

} // namespace cardwire::core::transport::connection
