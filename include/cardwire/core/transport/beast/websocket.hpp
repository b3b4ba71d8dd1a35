#pragma once

#include <string>
#include <string_view>
#include <thread>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "cardwire/core/transport/concepts.hpp"
#include "cardwire/core/transport/error.hpp"
#include "cardwire/core/transport/parse_url.hpp"
#include "cardwire/core/transport/connection/config.hpp"
#include "cardwire/core/transport/websocket/events.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast implementation)
================================================================================

This header implements the cardwire WebSocket transport on top of Boost.Beast,
following a strict separation between *transport mechanics* and *connection
policy*.

Design highlights:
  • Single-connection transport primitive: no retries, no reconnection logic
  • connect() resolves, connects, negotiates TLS (wss) and upgrades
    asynchronously on a private IO thread, then returns immediately
  • Every outcome is reported as an event in one ordered SPSC ring:
    Open, Message, Error, Close
  • Writes are queued on the strand and leave in call order
  • close() is idempotent and synchronous: it attempts a normal (1000) close
    handshake, bounded by CLOSE_TIMEOUT, then stops and joins the IO thread.
    This is the only call that can hold the caller's thread: up to
    CLOSE_TIMEOUT (2 s) when the peer never answers the close frame.

Retry policy, keepalive and timeouts of the logical connection live in
transport::Connection.
================================================================================
*/

namespace cardwire::core::transport::beast {

namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
namespace bst   = boost::beast;
namespace ws    = boost::beast::websocket;
namespace http  = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using EventRing = lcr::lockfree::spsc_ring<websocket::Event, connection::EVENT_RING_CAPACITY>;

namespace detail {

// Translate a Beast / Asio failure into a transport::Error
[[nodiscard]]
inline Error classify(const bst::error_code& ec) noexcept {
    if (ec == bst::error::timeout) {
        return Error::Timeout;
    }
    if (ec == net::error::eof || ec == net::error::connection_reset ||
        ec == net::error::connection_aborted || ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;
    }
    if (ec == net::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    return Error::TransportFailure;
}

// -----------------------------------------------------------------------------
// Session<Stream>
// -----------------------------------------------------------------------------
//
// One physical connection driven entirely on the strand. Stream is either
// ws::stream<bst::tcp_stream> (ws://) or ws::stream<bst::ssl_stream<...>> (wss://).
//
// -----------------------------------------------------------------------------
template <class Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    template <class Executor, class... Args>
    Session(EventRing& ring, std::atomic<bool>& stopping, Executor&& ex, Args&&... args)
        : ring_(ring)
        , stopping_(stopping)
        , resolver_(ex)
        , ws_(std::forward<Executor>(ex), std::forward<Args>(args)...)
    {
    }

    void run(const ParsedUrl& url) {
        url_ = url;
        resolver_.async_resolve(url_.host, url_.port,
            bst::bind_front_handler(&Session::on_resolve_, this->shared_from_this()));
    }

    // Posted by the owner; runs on the strand
    void write(std::string msg) {
        queue_.push_back(std::move(msg));
        if (queue_.size() == 1 && open_) {
            do_write_();
        }
    }

    // Posted by the owner; runs on the strand
    void shutdown() {
        if (!open_) {
            bst::get_lowest_layer(ws_).cancel();
            resolver_.cancel();
            return;
        }
        open_ = false;
        ws_.async_close(ws::close_code::normal,
            [self = this->shared_from_this()](bst::error_code) {
                bst::error_code ignored;
                bst::get_lowest_layer(self->ws_).socket().close(ignored);
            });
    }

private:
    EventRing& ring_;
    std::atomic<bool>& stopping_;
    tcp::resolver resolver_;
    Stream ws_;
    ParsedUrl url_;
    bst::flat_buffer buffer_;
    http::response<http::string_body> upgrade_response_;
    std::deque<std::string> queue_;
    bool open_{false};
    bool closed_reported_{false};

    // Producer side of the event ring. Waits for room instead of dropping:
    // control events must never be lost.
    void push_(websocket::Event&& ev) {
        while (!ring_.push(std::move(ev))) {
            if (stopping_.load(std::memory_order_acquire)) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }

    void fail_(Error error, std::uint16_t code) {
        if (stopping_.load(std::memory_order_acquire) || closed_reported_) {
            return;
        }
        closed_reported_ = true;
        open_ = false;
        push_(websocket::Event::make_error(error));
        push_(websocket::Event::make_close(code));
    }

    void on_resolve_(bst::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            CW_WARN("[WS] Resolve failed for '" << url_.host << "': " << ec.message());
            return fail_(Error::ConnectionFailed, close_code::Abnormal);
        }
        bst::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        bst::get_lowest_layer(ws_).async_connect(results,
            bst::bind_front_handler(&Session::on_connect_, this->shared_from_this()));
    }

    void on_connect_(bst::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            CW_WARN("[WS] TCP connect failed: " << ec.message());
            return fail_(ec == bst::error::timeout ? Error::Timeout : Error::ConnectionFailed, close_code::Abnormal);
        }
        if constexpr (is_tls_()) {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
                CW_ERROR("[WS] Failed to set SNI host name");
                return fail_(Error::HandshakeFailed, close_code::Abnormal);
            }
            ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
            ws_.next_layer().async_handshake(ssl::stream_base::client,
                bst::bind_front_handler(&Session::on_tls_handshake_, this->shared_from_this()));
        }
        else {
            start_upgrade_();
        }
    }

    void on_tls_handshake_(bst::error_code ec) {
        if (ec) {
            CW_WARN("[WS] TLS handshake failed: " << ec.message());
            return fail_(Error::HandshakeFailed, close_code::Abnormal);
        }
        start_upgrade_();
    }

    void start_upgrade_() {
        // The websocket stream manages its own timeouts from here on
        bst::get_lowest_layer(ws_).expires_never();
        ws_.set_option(ws::stream_base::timeout::suggested(bst::role_type::client));
        ws_.set_option(ws::stream_base::decorator([](ws::request_type& req) {
            req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " cardwire");
        }));
        const bool default_port = (url_.secure && url_.port == "443") || (!url_.secure && url_.port == "80");
        const std::string host = default_port ? url_.host : url_.host + ":" + url_.port;
        ws_.async_handshake(upgrade_response_, host, url_.path,
            bst::bind_front_handler(&Session::on_upgrade_, this->shared_from_this()));
    }

    void on_upgrade_(bst::error_code ec) {
        if (ec) {
            const auto status = upgrade_response_.result();
            CW_WARN("[WS] WebSocket upgrade failed: " << ec.message() << " (HTTP " << upgrade_response_.result_int() << ")");
            if (status == http::status::unauthorized) {
                return fail_(Error::Unauthorized, close_code::Unauthorized);
            }
            if (status == http::status::forbidden) {
                return fail_(Error::AccessDenied, close_code::AccessDenied);
            }
            return fail_(Error::HandshakeFailed, close_code::Abnormal);
        }
        ws_.text(true);
        open_ = true;
        push_(websocket::Event::make_open());
        if (!queue_.empty()) {
            do_write_();
        }
        do_read_();
    }

    void do_read_() {
        ws_.async_read(buffer_,
            bst::bind_front_handler(&Session::on_read_, this->shared_from_this()));
    }

    void on_read_(bst::error_code ec, std::size_t) {
        if (ec) {
            if (ec == ws::error::closed) {
                const auto code = static_cast<std::uint16_t>(ws_.reason().code);
                CW_DEBUG("[WS] Close frame received (code " << code << ")");
                if (!stopping_.load(std::memory_order_acquire) && !closed_reported_) {
                    closed_reported_ = true;
                    open_ = false;
                    push_(websocket::Event::make_close(code));
                }
                return;
            }
            return fail_(classify(ec), close_code::Abnormal);
        }
        push_(websocket::Event::make_message(bst::buffers_to_string(buffer_.data())));
        buffer_.consume(buffer_.size());
        do_read_();
    }

    void do_write_() {
        ws_.async_write(net::buffer(queue_.front()),
            bst::bind_front_handler(&Session::on_write_, this->shared_from_this()));
    }

    void on_write_(bst::error_code ec, std::size_t) {
        if (ec) {
            CW_WARN("[WS] Write failed: " << ec.message());
            queue_.clear();
            // The pending read reports the close
            return;
        }
        queue_.pop_front();
        if (!queue_.empty() && open_) {
            do_write_();
        }
    }

    static constexpr bool is_tls_() noexcept {
        return !std::is_same_v<Stream, ws::stream<bst::tcp_stream>>;
    }
};

using PlainSession = Session<ws::stream<bst::tcp_stream>>;
using TlsSession   = Session<ws::stream<bst::ssl_stream<bst::tcp_stream>>>;

} // namespace detail


class WebSocket {
    static constexpr auto CLOSE_TIMEOUT = std::chrono::milliseconds(2000);

public:
    WebSocket()
        : ssl_ctx_(ssl::context::tls_client)
        , strand_(net::make_strand(ioc_))
    {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    ~WebSocket() {
        close();
    }

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    inline Error connect(const ParsedUrl& url) noexcept {
        if (started_) {
            CW_ERROR("[WS] connect() called twice on the same transport");
            return Error::InvalidState;
        }
        try {
            if (url.secure) {
                tls_ = std::make_shared<detail::TlsSession>(ring_, stopping_, strand_, ssl_ctx_);
                tls_->run(url);
            }
            else {
                plain_ = std::make_shared<detail::PlainSession>(ring_, stopping_, strand_);
                plain_->run(url);
            }
            started_ = true;
            io_thread_ = std::thread([this] {
                ioc_.run();
                io_finished_.store(true, std::memory_order_release);
            });
        }
        catch (const std::exception& e) {
            CW_ERROR("[WS] Failed to start transport: " << e.what());
            return Error::TransportFailure;
        }
        return Error::None;
    }

    // Accepted for delivery; failures surface as Error/Close events
    [[nodiscard]]
    inline bool send(std::string_view msg) noexcept {
        if (!started_ || stopping_.load(std::memory_order_acquire)) {
            return false;
        }
        try {
            CW_TRACE("[WS] Sending message (size " << msg.size() << ")");
            net::post(strand_, [this, text = std::string(msg)]() mutable {
                if (tls_)   tls_->write(std::move(text));
                if (plain_) plain_->write(std::move(text));
            });
        }
        catch (const std::exception& e) {
            CW_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
        return true;
    }

    // Blocks for at most CLOSE_TIMEOUT plus the IO thread join
    inline void close() noexcept {
        if (!started_ || stopping_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        CW_TRACE("[WS] Closing WebSocket ...");
        try {
            net::post(strand_, [this] {
                if (tls_)   tls_->shutdown();
                if (plain_) plain_->shutdown();
            });
        }
        catch (const std::exception& e) {
            CW_WARN("[WS] Graceful close not scheduled: " << e.what());
        }
        const auto deadline = std::chrono::steady_clock::now() + CLOSE_TIMEOUT;
        while (!io_finished_.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ioc_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        tls_.reset();
        plain_.reset();
        CW_TRACE("[WS] WebSocket closed.");
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return ring_.pop(out);
    }

private:
    net::io_context ioc_;
    ssl::context ssl_ctx_;
    net::strand<net::io_context::executor_type> strand_;
    EventRing ring_;

    std::shared_ptr<detail::PlainSession> plain_;
    std::shared_ptr<detail::TlsSession>   tls_;

    std::thread io_thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> io_finished_{false};
    bool started_{false};
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace cardwire::core::transport::beast
