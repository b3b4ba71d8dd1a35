#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <chrono>
#include <memory>
#include <utility>
#include <cstdint>

#include "cardwire/core/transport/concepts.hpp"
#include "cardwire/core/transport/parse_url.hpp"
#include "cardwire/core/transport/state.hpp"
#include "cardwire/core/transport/connection/config.hpp"
#include "cardwire/core/transport/connection/deferred.hpp"
#include "cardwire/core/transport/connection/keepalive.hpp"
#include "cardwire/core/transport/connection/reconnect_policy.hpp"
#include "cardwire/core/transport/connection/signal.hpp"
#include "cardwire/core/transport/websocket/events.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace cardwire::core::transport {

/*
===============================================================================
 cardwire::core::transport::Connection
===============================================================================

Generic reconnecting connection, parameterized by a WebSocket transport
conforming to transport::WebSocketConcept and by a clock conforming to
transport::ClockConcept.

A Connection represents a *logical* connection whose identity remains stable
across transient transport failures and automatic reconnections. It knows
nothing about message schemas: it moves text frames and reports facts.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Own exactly one transport instance at a time (connect, replace, close)
- Apply the reconnection policy to unexpected closes and failed attempts
- Bound every connection attempt with a connect timeout
- Send the keepalive payload at a fixed interval while Open
- Deliver inbound text frames, in arrival order, to the message handler
- Expose only observable consequences via edge-triggered signals

-------------------------------------------------------------------------------
 Reconnection Semantics
-------------------------------------------------------------------------------
- Retries apply to retryable failures only (see transport::is_retryable()).
  Caller close(), a normal (1000) close and server refusals never retry.
- delay(attempt) = base_delay * (attempt + 1), attempt < max_attempts
- The attempt counter resets on every successful open
- When the ceiling is reached a terminal Disconnected signal is emitted and
  the connection stays down until open() is called again
- close() cancels the retry timer and the keepalive timer

-------------------------------------------------------------------------------
 Transport Replacement
-------------------------------------------------------------------------------
Every attempt creates a fresh transport. The previous instance is closed and
destroyed first, together with its undelivered events, so a stale close can
never be observed by the new attempt.

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
- open(url) or open(resolver) returns a Deferred settled by poll()
- Drive all progress by calling poll() regularly from one thread
- Drain signals with poll_signal() after each poll()
- The resolver is invoked on every attempt, so credentials embedded in the
  URL are re-read for each reconnect

===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class Connection {
public:
    using clock_type     = Clock;
    using time_point     = typename Clock::time_point;
    using MessageHandler = std::function<void(std::string_view)>;
    // Produces the URL for the next attempt, or the reason it cannot
    using UrlResolver    = std::function<Error(std::string&)>;

public:
    explicit Connection(connection::Config cfg = {})
        : cfg_(std::move(cfg))
        , policy_(cfg_.max_attempts, cfg_.base_delay)
        , keepalive_(cfg_.keepalive_interval)
    {
    }

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Connection lifecycle
    [[nodiscard]]
    inline connection::Deferred open(const std::string& url) {
        return open([url](std::string& out) {
            out = url;
            return Error::None;
        });
    }

    [[nodiscard]]
    inline connection::Deferred open(UrlResolver resolver) {
        switch (get_state_()) {
        case State::Connecting:
            CW_DEBUG("[CONN] open() while connecting: joining the in-flight attempt.");
            return pending_;
        case State::Open:
            CW_DEBUG("[CONN] open() while already open. Ignoring.");
            return connection::Deferred::resolved();
        case State::Closing:
            CW_WARN("[CONN] open() called while closing. Ignoring.");
            return connection::Deferred::rejected(Error::InvalidState);
        case State::Disconnected:
        case State::WaitingReconnect:
            break;
        }
        resolver_ = std::move(resolver);
        // An explicit open starts a fresh retry cycle
        policy_.reset();
        disconnect_reason_ = DisconnectReason::None;
        last_error_ = Error::None;
        pending_ = connection::Deferred::pending();
        connection::Deferred result = pending_;
        transition_(Event::OpenRequested);
        start_attempt_();
        return result;
    }

    // Manual disconnect - unconditional shutdown, cancels pending retries
    // and the keepalive timer. Idempotent.
    inline void close() noexcept {
        const auto state = get_state_();
        if (state == State::Disconnected || state == State::Closing) {
            return;
        }
        transition_(Event::CloseRequested);
    }

    // Sending. Frames are handed to the transport in call order.
    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (get_state_() != State::Open || !ws_) {
            CW_DEBUG("[CONN] send() called while not open (state: " << to_string(get_state_()) << "). Dropped.");
            return false;
        }
        if (!ws_->send(text)) {
            CW_WARN("[CONN] Transport rejected outbound frame (size " << text.size() << ")");
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // Event loop
    inline void poll() {
        // === Drain transport events (ordered) ===
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            switch (ev.type) {
            case websocket::EventType::Open:
                if (get_state_() == State::Connecting) {
                    transition_(Event::TransportOpened);
                }
                break;

            case websocket::EventType::Message:
                on_transport_message_(ev.payload);
                break;

            case websocket::EventType::Error:
                on_transport_error_(ev.error);
                break;

            case websocket::EventType::Close:
                on_transport_closed_(ev.close_code);
                break;

            case websocket::EventType::None:
            default:
                break;
            }
        }

        const auto now = Clock::now();

        // === Connect timeout ===
        if (get_state_() == State::Connecting && ws_ && now >= connect_deadline_) {
            CW_WARN("[CONN] Connection attempt timed out after " << cfg_.connect_timeout.count() << " ms");
            fail_attempt_(Error::Timeout);
        }

        // === Reconnection ===
        if (get_state_() == State::WaitingReconnect && now >= next_retry_) {
            // The previous attempt's deferred is already settled; callers that
            // join this attempt through open() wait on a fresh one
            pending_ = connection::Deferred::pending();
            transition_(Event::RetryTimerExpired);
            start_attempt_();
        }

        // === Keepalive ===
        if (get_state_() == State::Open && keepalive_.due(now)) {
            CW_TRACE("[CONN] Sending keepalive");
            if (send(cfg_.keepalive_payload)) {
                ++keepalives_sent_;
            }
        }
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    inline void on_message(MessageHandler handler) {
        on_message_ = std::move(handler);
    }

    // Accessors
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool is_open() const noexcept { return state_ == State::Open; }

    // Returns an observable concept (not a state enum)
    [[nodiscard]]
    inline bool is_active() const noexcept {
        return state_ != State::Disconnected;
    }

    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline DisconnectReason disconnect_reason() const noexcept { return disconnect_reason_; }
    [[nodiscard]] inline std::uint16_t last_close_code() const noexcept { return last_close_code_; }

    [[nodiscard]] inline int retry_attempts() const noexcept { return policy_.attempts(); }
    [[nodiscard]] inline std::chrono::milliseconds last_retry_delay() const noexcept { return last_retry_delay_; }
    [[nodiscard]] inline time_point next_retry() const noexcept { return next_retry_; }

    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_; }
    [[nodiscard]] inline std::uint64_t keepalives_sent() const noexcept { return keepalives_sent_; }
    [[nodiscard]] inline bool keepalive_armed() const noexcept { return keepalive_.armed(); }
    [[nodiscard]] inline bool retry_armed() const noexcept { return state_ == State::WaitingReconnect; }

    [[nodiscard]] inline const connection::Config& config() const noexcept { return cfg_; }

#ifdef CW_UNIT_TEST
public:
    // Current transport instance (nullptr when none exists)
    WS* ws() noexcept {
        return ws_.get();
    }
#endif // CW_UNIT_TEST

private:
    connection::Config cfg_;
    UrlResolver resolver_;
    MessageHandler on_message_;

    std::unique_ptr<WS> ws_;                        // Transport instance (owned by Connection)
    std::string endpoint_label_;                    // host + path without query, for logging

    // Transport epoch (incremented on each successful open)
    std::uint64_t epoch_{0};

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};
    std::uint64_t keepalives_sent_{0};

    // Error tracking for reconnection logic
    Error last_error_{Error::None};
    Error transport_error_{Error::None};            // Error event preceding the current close
    std::uint16_t last_close_code_{close_code::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};

    // State machine
    State state_{State::Disconnected};
    connection::Deferred pending_;
    connection::ReconnectPolicy policy_;
    connection::Keepalive<time_point> keepalive_;
    time_point connect_deadline_{};
    time_point next_retry_{};
    std::chrono::milliseconds last_retry_delay_{0};

    lcr::lockfree::spsc_ring<connection::Signal, connection::SIGNAL_RING_CAPACITY> signals_;

    // Signals are informational: when nobody drains them the oldest is dropped
    inline void emit_(connection::Signal sig) noexcept {
        CW_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        connection::Signal dropped;
        (void)signals_.pop(dropped);
        CW_WARN("[CONN] Signal ring full, dropped '" << to_string(dropped) << "'");
        (void)signals_.push(sig);
    }

private:
    inline State get_state_() const noexcept {
        return state_;
    }

    inline void set_state_(State new_state) noexcept {
        CW_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        const State state = get_state_();

        CW_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportOpened:
                set_state_(State::Open);
                policy_.reset();
                last_error_ = Error::None;
                disconnect_reason_ = DisconnectReason::None;
                keepalive_.arm(Clock::now());
                ++epoch_;
                CW_INFO("[CONN] Connected to " << endpoint_label_);
                emit_(connection::Signal::Connected);
                pending_.resolve();
                break;

            case Event::TransportFailed:
                emit_(connection::Signal::ConnectFailed);
                pending_.reject(error);
                resolve_failure_(error);
                break;

            case Event::CloseRequested:
                set_state_(State::Closing);
                disconnect_reason_ = DisconnectReason::LocalClose;
                destroy_transport_();
                set_state_(State::Disconnected);
                pending_.reject(Error::Cancelled);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Open:
            switch (event) {
            case Event::TransportClosed:
                keepalive_.disarm();
                emit_(connection::Signal::ConnectionLost);
                resolve_failure_(error);
                break;

            case Event::CloseRequested:
                CW_DEBUG("[CONN] Disconnecting from " << endpoint_label_);
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Closing);
                keepalive_.disarm();
                destroy_transport_();
                set_state_(State::Disconnected);
                CW_INFO("[CONN] Disconnected from " << endpoint_label_);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Closing:
            // close() completes synchronously; nothing can arrive here
            break;

        // ================================================================
        case State::WaitingReconnect:
            switch (event) {
            case Event::RetryTimerExpired:
            case Event::OpenRequested:
                // An explicit open() overrides the pending retry
                set_state_(State::Connecting);
                break;

            case Event::CloseRequested:
                CW_DEBUG("[CONN] Pending reconnection cancelled");
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;
        }
    }

    // Decide what follows a failed attempt or a lost connection
    inline void resolve_failure_(Error error) noexcept {
        last_error_ = error;
        if (error == Error::None) {
            disconnect_reason_ = DisconnectReason::NormalClose;
            set_state_(State::Disconnected);
            CW_INFO("[CONN] Connection closed normally by peer: " << endpoint_label_);
            emit_(connection::Signal::Disconnected);
            return;
        }
        if (policy_.allows(error)) {
            disconnect_reason_ = DisconnectReason::TransportError;
            schedule_next_retry_();
            return;
        }
        if (!is_retryable(error)) {
            disconnect_reason_ = DisconnectReason::Refused;
            CW_WARN("[CONN] Not retrying after '" << to_string(error) << "'");
        }
        else {
            disconnect_reason_ = DisconnectReason::RetriesExhausted;
            CW_WARN("[CONN] Giving up after " << policy_.attempts() << " reconnection attempts");
        }
        set_state_(State::Disconnected);
        emit_(connection::Signal::Disconnected);
    }

    inline void schedule_next_retry_() noexcept {
        last_retry_delay_ = policy_.schedule();
        next_retry_ = Clock::now() + last_retry_delay_;
        set_state_(State::WaitingReconnect);
        CW_INFO("[CONN] Reconnection attempt " << policy_.attempts() << "/" << policy_.max_attempts()
                << " in " << last_retry_delay_.count() << " ms");
        emit_(connection::Signal::RetryScheduled);
    }

    inline void start_attempt_() {
        std::string url;
        Error err = resolver_ ? resolver_(url) : Error::InvalidUrl;
        ParsedUrl parsed;
        if (err == Error::None) {
            err = parse_url(url, parsed);
        }
        if (err != Error::None) {
            CW_ERROR("[CONN] Cannot start connection attempt (" << to_string(err) << ")");
            fail_attempt_(err);
            return;
        }
        endpoint_label_ = parsed.host + ":" + parsed.port + parsed.path.substr(0, parsed.path.find('?'));
        CW_DEBUG("[CONN] Connecting to " << endpoint_label_);
        create_transport_();
        err = ws_->connect(parsed);
        if (err != Error::None) {
            CW_ERROR("[CONN] Connection failed (" << to_string(err) << ")");
            fail_attempt_(err);
            return;
        }
        connect_deadline_ = Clock::now() + cfg_.connect_timeout;
    }

    inline void fail_attempt_(Error error) {
        destroy_transport_();
        transition_(Event::TransportFailed, error);
    }

    inline void create_transport_() {
        // Tear down the previous transport (and its undelivered events) first
        destroy_transport_();
        transport_error_ = Error::None;
        last_close_code_ = close_code::None;
        ws_ = std::make_unique<WS>();
    }

    inline void destroy_transport_() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
    }

    inline void on_transport_message_(std::string_view payload) {
        if (get_state_() != State::Open) {
            CW_DEBUG("[CONN] Dropping frame received outside Open state");
            return;
        }
        ++rx_messages_;
        if (on_message_) {
            on_message_(payload);
        }
    }

    inline void on_transport_error_(Error error) noexcept {
        CW_WARN("[CONN] Transport error: " << to_string(error));
        transport_error_ = error;
    }

    inline void on_transport_closed_(std::uint16_t code) {
        last_close_code_ = code;
        // Application close codes and normal closure are authoritative;
        // otherwise prefer the error reported by the transport.
        Error error = from_close_code(code);
        if (code != close_code::Normal && !(code >= 4000 && code < 5000) && transport_error_ != Error::None) {
            error = transport_error_;
        }
        CW_INFO("[CONN] Transport closed (code " << code << ", " << to_string(error) << ")");
        const State state = get_state_();
        if (state == State::Connecting) {
            fail_attempt_(error == Error::None ? Error::ConnectionFailed : error);
        }
        else if (state == State::Open) {
            destroy_transport_();
            transition_(Event::TransportClosed, error);
        }
    }
};

} // namespace cardwire::core::transport
