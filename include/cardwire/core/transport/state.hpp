#pragma once

#include <cstdint>
#include <string_view>


namespace cardwire::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
// WaitingReconnect is the reconnect phase of Connecting: a retry timer is
// armed and no transport exists.
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Open,
    Closing,
    WaitingReconnect
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:        return "Disconnected";
        case State::Connecting:          return "Connecting";
        case State::Open:                return "Open";
        case State::Closing:             return "Closing";
        case State::WaitingReconnect:    return "WaitingReconnect";
        default:                         return "Unknown";
    }
}


// ===============================================================
// FSM EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportOpened,
    TransportFailed,      // attempt failed before open (error, refusal or timeout)
    TransportClosed,      // an open transport went away

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:      return "OpenRequested";
        case Event::CloseRequested:     return "CloseRequested";
        case Event::TransportOpened:    return "TransportOpened";
        case Event::TransportFailed:    return "TransportFailed";
        case Event::TransportClosed:    return "TransportClosed";
        case Event::RetryTimerExpired:  return "RetryTimerExpired";
        default:                        return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by user
    NormalClose,       // peer closed with code 1000
    TransportError,    // socket / IO error or abnormal close
    Refused,           // non-retryable failure (credential, close code 4xxx)
    RetriesExhausted   // reconnect attempt ceiling reached
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:             return "None";
        case DisconnectReason::LocalClose:       return "LocalClose";
        case DisconnectReason::NormalClose:      return "NormalClose";
        case DisconnectReason::TransportError:   return "TransportError";
        case DisconnectReason::Refused:          return "Refused";
        case DisconnectReason::RetriesExhausted: return "RetriesExhausted";
        default:                                 return "Unknown";
    }
}

} // namespace cardwire::core::transport
