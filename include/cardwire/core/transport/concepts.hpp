#pragma once

#include <string>
#include <string_view>
#include <concepts>
#include <chrono>

#include "cardwire/core/transport/error.hpp"
#include "cardwire/core/transport/parse_url.hpp"
#include "cardwire/core/transport/websocket/events.hpp"

namespace cardwire::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the Connection layer.
//
// The WebSocket implementation:
//
//   • Represents exactly one physical connection attempt
//   • connect() only starts the handshake; the outcome is reported later as
//     an Open event, or as Error + Close events
//   • Never throws on network faults
//   • Pushes events into an internal SPSC ring drained via poll_event()
//   • close() is idempotent and synchronous: once it returns, no producer
//     thread touches the instance any more
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        std::string_view msg,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Event polling
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Any clock with the std::chrono static now() interface.
// Production code uses std::chrono::steady_clock; tests inject a manual clock.
//
// -----------------------------------------------------------------------------

template<class C>
concept ClockConcept =
    requires {
        typename C::duration;
        typename C::time_point;
        { C::now() } -> std::same_as<typename C::time_point>;
    };

} // namespace cardwire::core::transport
