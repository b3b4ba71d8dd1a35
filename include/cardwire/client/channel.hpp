#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <utility>
#include <exception>
#include <functional>

#include "cardwire/client/credentials.hpp"
#include "cardwire/core/transport/concepts.hpp"
#include "cardwire/core/transport/connection.hpp"
#include "cardwire/core/transport/connection/signal.hpp"
#include "cardwire/core/protocol/dispatcher.hpp"
#include "cardwire/core/protocol/parser/common.hpp"
#include "cardwire/core/protocol/schema/common.hpp"
#include "cardwire/core/protocol/schema/system/ping.hpp"
#include "lcr/log/logger.hpp"


namespace cardwire::client {

namespace transport = cardwire::core::transport;
namespace protocol  = cardwire::core::protocol;

// -----------------------------------------------------------------------------
// ChannelConfig
// -----------------------------------------------------------------------------
struct ChannelConfig {
    // Server origin: http(s)://host[/api] or ws(s)://host
    std::string base_url;
    transport::connection::Config connection{};
};

/*
===============================================================================
 client::Channel
===============================================================================

Reconnecting, typed-dispatch channel bound to one resource and one credential
provider. Feature clients (chat, direct messages, generation stream) derive
from it and add their typed send helpers and subscriptions.

Composition:
  transport::Connection  - socket lifecycle, retries, keepalive, connect timeout
  protocol::Dispatcher   - inbound routing by "type"
  credentials::Provider  - token read on every connection attempt

Callbacks (all invoked from poll(), never from connect()/disconnect()):
  on_connected()                      the socket reached Open
  on_error(Error)                     an attempt failed or an open socket was lost
  on_reconnecting(attempt, delay)     a retry has been scheduled
  on_disconnected(reason, error)      terminal: no more automatic retries

A caller-initiated disconnect() does not fire on_disconnected.

Exceptions thrown by callbacks are logged and contained; poll() never throws
because of user code.
===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class Channel {
public:
    using connection_type = transport::Connection<WS, Clock>;
    using dispatcher_type = protocol::Dispatcher<Clock>;
    using Deferred        = transport::connection::Deferred;
    using Handler         = typename dispatcher_type::Handler;
    using Unsubscribe     = typename dispatcher_type::Unsubscribe;

    using ConnectedCallback    = std::function<void()>;
    using DisconnectedCallback = std::function<void(transport::DisconnectReason, transport::Error)>;
    using ErrorCallback        = std::function<void(transport::Error)>;
    using ReconnectingCallback = std::function<void(int attempt, std::chrono::milliseconds delay)>;
    using ServerErrorCallback  = std::function<void(const protocol::schema::ErrorNotice&)>;

public:
    Channel(std::string tag, ChannelConfig cfg, credentials::Provider creds)
        : tag_(std::move(tag))
        , cfg_(normalize_(std::move(cfg)))
        , creds_(std::move(creds))
        , connection_(cfg_.connection)
    {
        connection_.on_message([this](std::string_view raw) {
            (void)dispatcher_.dispatch(raw);
        });
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Idempotent. Cancels the connect deferred, the retry timer and the keepalive.
    // With the Beast transport this waits up to 2 s for the peer's close reply.
    inline void disconnect() noexcept {
        notify_("local-close", on_local_close_);
        if (connection_.state() == transport::State::Disconnected) {
            CW_DEBUG(tag_ << " disconnect() while already disconnected. Ignoring.");
            return;
        }
        CW_INFO(tag_ << " Disconnecting");
        connection_.close();
    }

    // Drives the connection, delivers inbound frames, fires callbacks
    inline void poll() {
        connection_.poll();
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }
    }

    // Raw subscription to any inbound "type"
    [[nodiscard]]
    inline Unsubscribe on(std::string type, Handler handler) {
        return dispatcher_.on(std::move(type), std::move(handler));
    }

    // Application-level {"type":"error"} frames
    [[nodiscard]]
    inline Unsubscribe on_server_error(ServerErrorCallback cb) {
        return dispatcher_.template on_parsed<protocol::schema::ErrorNotice>(
            "error", &protocol::parser::error_notice::parse, std::move(cb));
    }

    inline void on_connected(ConnectedCallback cb) { on_connected_ = std::move(cb); }
    inline void on_disconnected(DisconnectedCallback cb) { on_disconnected_ = std::move(cb); }
    inline void on_error(ErrorCallback cb) { on_error_ = std::move(cb); }
    inline void on_reconnecting(ReconnectingCallback cb) { on_reconnecting_ = std::move(cb); }

    // Accessors
    [[nodiscard]] inline bool is_connected() const noexcept { return connection_.is_open(); }
    [[nodiscard]] inline transport::State state() const noexcept { return connection_.state(); }
    [[nodiscard]] inline const ChannelConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] inline const std::string& tag() const noexcept { return tag_; }

    [[nodiscard]] inline connection_type& connection() noexcept { return connection_; }
    [[nodiscard]] inline const connection_type& connection() const noexcept { return connection_; }
    [[nodiscard]] inline dispatcher_type& dispatcher() noexcept { return dispatcher_; }
    [[nodiscard]] inline const dispatcher_type& dispatcher() const noexcept { return dispatcher_; }

protected:
    using UrlBuilder = std::function<std::string(const std::string& token)>;

    // Opens the connection; `build` turns the current token into the full URL
    [[nodiscard]]
    inline Deferred open_(UrlBuilder build) {
        return connection_.open([this, build = std::move(build)](std::string& url) -> transport::Error {
            if (!creds_.valid()) {
                CW_ERROR(tag_ << " No credential provider configured");
                return transport::Error::MissingCredential;
            }
            const auto token = creds_.get();
            if (!token.has() || token.value().empty()) {
                CW_WARN(tag_ << " No auth token available, not connecting");
                return transport::Error::MissingCredential;
            }
            url = build(token.value());
            return transport::Error::None;
        });
    }

    // Sends a fully built frame. False (no-op) unless Open.
    [[nodiscard]]
    inline bool send_(std::string_view json) {
        if (!connection_.is_open()) {
            CW_DEBUG(tag_ << " Not connected, frame not sent");
            return false;
        }
        return connection_.send(json);
    }

    // Invoked before on_error when an open socket goes away unexpectedly
    std::function<void()> on_link_lost_;
    // Invoked on every disconnect() call, before the connection is closed
    std::function<void()> on_local_close_;

    template <class Fn, class... Args>
    inline void notify_(const char* what, const Fn& fn, Args&&... args) {
        if (!fn) {
            return;
        }
        try {
            fn(std::forward<Args>(args)...);
        }
        catch (const std::exception& e) {
            CW_ERROR(tag_ << " " << what << " callback threw: " << e.what());
        }
        catch (...) {
            CW_ERROR(tag_ << " " << what << " callback threw a non-standard exception");
        }
    }

private:
    std::string tag_;
    ChannelConfig cfg_;
    credentials::Provider creds_;
    dispatcher_type dispatcher_;
    connection_type connection_;

    ConnectedCallback on_connected_;
    DisconnectedCallback on_disconnected_;
    ErrorCallback on_error_;
    ReconnectingCallback on_reconnecting_;

    static inline ChannelConfig normalize_(ChannelConfig cfg) {
        if (cfg.connection.keepalive_payload.empty()) {
            cfg.connection.keepalive_payload = protocol::schema::system::Ping::to_json();
        }
        return cfg;
    }

    inline void handle_signal_(transport::connection::Signal sig) {
        using transport::connection::Signal;
        switch (sig) {
        case Signal::Connected:
            CW_INFO(tag_ << " Connected");
            notify_("on_connected", on_connected_);
            break;

        case Signal::ConnectionLost:
            CW_WARN(tag_ << " Connection lost (" << transport::to_string(connection_.last_error()) << ")");
            notify_("link-lost", on_link_lost_);
            if (connection_.last_error() != transport::Error::None) {
                notify_("on_error", on_error_, connection_.last_error());
            }
            break;

        case Signal::ConnectFailed:
            CW_WARN(tag_ << " Connection attempt failed (" << transport::to_string(connection_.last_error()) << ")");
            notify_("on_error", on_error_, connection_.last_error());
            break;

        case Signal::RetryScheduled:
            notify_("on_reconnecting", on_reconnecting_, connection_.retry_attempts(), connection_.last_retry_delay());
            break;

        case Signal::Disconnected:
            CW_WARN(tag_ << " Disconnected (" << transport::to_string(connection_.disconnect_reason()) << ")");
            notify_("on_disconnected", on_disconnected_, connection_.disconnect_reason(), connection_.last_error());
            break;

        case Signal::None:
        default:
            break;
        }
    }
};

} // namespace cardwire::client
