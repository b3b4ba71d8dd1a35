/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents **externally observable, edge-triggered facts**
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven

The Connection does NOT expose its retry bookkeeping or transport internals.
Details of the last failure are available through last_error() and
disconnect_reason() at the time the signal is observed.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  A WebSocket connection has been established. Resets the retry counter.

ConnectionLost
  An open connection went away without the caller asking for it.
  Followed by RetryScheduled or Disconnected.

ConnectFailed
  A connection attempt failed before reaching Open.
  Followed by RetryScheduled or Disconnected.

RetryScheduled
  A reconnect timer has been armed (see retry_attempt() / retry_delay()).

Disconnected
  Terminal: no further automatic retries will happen. Never emitted for a
  caller-initiated close().

===============================================================================
*/


#pragma once

#include <cstdint>
#include <string_view>


namespace cardwire::core::transport::connection {


enum class Signal : uint8_t {
    None,
    Connected,
    ConnectionLost,
    ConnectFailed,
    RetryScheduled,
    Disconnected,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:            return "None";
        case Signal::Connected:       return "Connected";
        case Signal::ConnectionLost:  return "ConnectionLost";
        case Signal::ConnectFailed:   return "ConnectFailed";
        case Signal::RetryScheduled:  return "RetryScheduled";
        case Signal::Disconnected:    return "Disconnected";
        default:                      return "Unknown";
    }
}

} // namespace cardwire::core::transport::connection
