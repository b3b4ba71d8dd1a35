#pragma once

/*
===============================================================================
 cardwire::core::transport::websocket::Event
===============================================================================

Event type emitted by a WebSocket transport implementation and delivered to
the owning Connection through a single ordered SPSC ring.

Control-plane facts (Open / Error / Close) and data-plane messages share the
ring so the Connection observes them in exactly the order the transport
produced them: every message received before a close is delivered before
that close.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------

WebSocket:
    - May run an internal IO thread (production) or none (mock)
    - Pushes Event objects into the ring

Connection:
    - Runs on a single-threaded poll loop
    - Drains events via poll_event()
    - Drives state machine transitions

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

• Open and Close are delivered at most once per transport instance.
• Error, when present, precedes the Close it explains.
• Events of a destroyed transport are never delivered.

===============================================================================
*/

#include <cstdint>
#include <string>
#include <utility>

#include "cardwire/core/transport/error.hpp"

namespace cardwire::core::transport::websocket {

enum class EventType : std::uint8_t {
    None    = 0,
    Open    = 1,
    Message = 2,
    Error   = 3,
    Close   = 4,
};

struct Event {
    EventType type{EventType::None};
    transport::Error error{transport::Error::None};   // valid if type == Error
    std::uint16_t close_code{close_code::None};        // valid if type == Close
    std::string payload;                               // valid if type == Message

    static Event make_open() noexcept {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) noexcept {
        Event ev;
        ev.type = EventType::Message;
        ev.payload = std::move(text);
        return ev;
    }

    static Event make_error(transport::Error e) noexcept {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }

    static Event make_close(std::uint16_t code = close_code::None) noexcept {
        Event ev;
        ev.type = EventType::Close;
        ev.close_code = code;
        return ev;
    }
};

} // namespace cardwire::core::transport::websocket
