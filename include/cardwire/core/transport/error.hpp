#pragma once

#include <cstdint>
#include <string_view>

namespace cardwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Beast, Asio, OpenSSL) and from raw WebSocket
close codes.

It is intentionally:
- small
- stable
- policy-free

Retry decisions are taken by the Connection (see is_retryable()).
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,         // Malformed or unsupported URL (scheme, host, port)
    InvalidState,       // Operation not allowed in current connection state
    Cancelled,          // Aborted by a local lifecycle decision (disconnect)
    MissingCredential,  // Credential provider returned no token

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,      // Closed intentionally by the local endpoint
    RemoteClosed,       // Remote endpoint closed the connection (non-normal code)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,            // Connect deadline or stalled network
    ConnectionFailed,   // DNS, TCP connect, routing
    HandshakeFailed,    // TLS or WebSocket upgrade failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,      // Invalid frame or protocol violation

    // --- Server refusals (application close codes) --------------------------
    InvalidResource,    // 4000: malformed resource id
    Unauthorized,       // 4001: credential rejected
    AccessDenied,       // 4003: no access to the resource

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure,   // Unclassified transport failure
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::MissingCredential: return "MissingCredential";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::InvalidResource:   return "InvalidResource";
    case Error::Unauthorized:      return "Unauthorized";
    case Error::AccessDenied:      return "AccessDenied";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// WebSocket close codes
// -----------------------------------------------------------------------------
namespace close_code {
    inline constexpr std::uint16_t None             = 0;     // no close frame observed
    inline constexpr std::uint16_t Normal           = 1000;
    inline constexpr std::uint16_t GoingAway        = 1001;
    inline constexpr std::uint16_t ProtocolError    = 1002;
    inline constexpr std::uint16_t Abnormal         = 1006;
    inline constexpr std::uint16_t InvalidResource  = 4000;
    inline constexpr std::uint16_t Unauthorized     = 4001;
    inline constexpr std::uint16_t AccessDenied     = 4003;
} // namespace close_code

// Classify a close code received from the server.
// Normal closure maps to None: the peer ended the session on purpose.
[[nodiscard]]
inline constexpr Error from_close_code(std::uint16_t code) noexcept {
    switch (code) {
    case close_code::Normal:          return Error::None;
    case close_code::ProtocolError:   return Error::ProtocolError;
    case close_code::InvalidResource: return Error::InvalidResource;
    case close_code::Unauthorized:    return Error::Unauthorized;
    case close_code::AccessDenied:    return Error::AccessDenied;
    case close_code::None:
    case close_code::Abnormal:        return Error::ConnectionFailed;
    default:                          return Error::RemoteClosed;
    }
}

// Determines whether an error represents a transient, external failure that
// should trigger automatic reconnection. Caller misuse, server refusals and
// intentional shutdowns are never retried.
[[nodiscard]]
inline constexpr bool is_retryable(Error error) noexcept {
    switch (error) {
    case Error::RemoteClosed:
    case Error::Timeout:
    case Error::ConnectionFailed:
    case Error::HandshakeFailed:
    case Error::TransportFailure:
        return true;

    case Error::None:
    case Error::InvalidUrl:
    case Error::InvalidState:
    case Error::Cancelled:
    case Error::MissingCredential:
    case Error::LocalShutdown:
    case Error::ProtocolError:
    case Error::InvalidResource:
    case Error::Unauthorized:
    case Error::AccessDenied:
    default:
        return false;
    }
}

} // namespace transport
} // namespace cardwire::core
