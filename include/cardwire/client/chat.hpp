#pragma once

#include <string>
#include <utility>
#include <functional>

#include "cardwire/client/channel.hpp"
#include "cardwire/client/endpoint.hpp"
#include "cardwire/core/protocol/parser/chat.hpp"
#include "cardwire/core/protocol/schema/chat/inbound.hpp"
#include "cardwire/core/protocol/schema/chat/request.hpp"
#include "lcr/optional.hpp"


namespace cardwire::client {

/*
===============================================================================
 client::ChatClient
===============================================================================

Project chat channel: /api/ws/chat/{project_id}?token={token}

Sends are fire-and-forget and only happen while Open (false otherwise; there
is no client-side queue). Frames leave in call order.

Inbound new_message events may repeat across reconnects: consumers should
deduplicate by message id.
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class ChatClient : public Channel<WS, Clock> {
    using Base = Channel<WS, Clock>;

public:
    using Deferred    = typename Base::Deferred;
    using Unsubscribe = typename Base::Unsubscribe;

    ChatClient(ChannelConfig cfg, credentials::Provider creds, std::string project_id)
        : Base("[CHAT]", std::move(cfg), std::move(creds))
        , project_id_(std::move(project_id))
    {
    }

    // Resolves on open, rejects on the first failure of the attempt.
    // Retries continue in the background after a rejection.
    [[nodiscard]]
    inline Deferred connect() {
        return this->open_([this](const std::string& token) {
            return endpoint::chat_url(this->config().base_url, project_id_, token);
        });
    }

    // ---------------------------------------------------------------------
    // Outbound
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline bool send_message(std::string content, lcr::optional<std::string> reply_to_id = {}) {
        protocol::schema::chat::SendMessage req{std::move(content), std::move(reply_to_id)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool send_typing(bool is_typing) {
        return this->send_(protocol::schema::chat::SetTyping{is_typing}.to_json());
    }

    [[nodiscard]]
    inline bool edit_message(std::string message_id, std::string content) {
        protocol::schema::chat::EditMessage req{std::move(message_id), std::move(content)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool delete_message(std::string message_id) {
        protocol::schema::chat::DeleteMessage req{std::move(message_id)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool mark_read() {
        return this->send_(protocol::schema::chat::MarkRead{}.to_json());
    }

    // ---------------------------------------------------------------------
    // Typed subscriptions
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline Unsubscribe on_new_message(std::function<void(const protocol::schema::chat::Message&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::chat::NewMessage>(
            "new_message", &protocol::parser::chat::new_message::parse,
            [cb = std::move(cb)](const protocol::schema::chat::NewMessage& m) { cb(m.message); });
    }

    [[nodiscard]]
    inline Unsubscribe on_typing(std::function<void(const protocol::schema::chat::Typing&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::chat::Typing>(
            "typing", &protocol::parser::chat::typing::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_message_edited(std::function<void(const protocol::schema::chat::MessageEdited&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::chat::MessageEdited>(
            "message_edited", &protocol::parser::chat::message_edited::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_message_deleted(std::function<void(const protocol::schema::chat::MessageDeleted&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::chat::MessageDeleted>(
            "message_deleted", &protocol::parser::chat::message_deleted::parse, std::move(cb));
    }

    // user_joined and user_left (Presence::joined tells them apart)
    [[nodiscard]]
    inline Unsubscribe on_presence(std::function<void(const protocol::schema::chat::Presence&)> cb) {
        using protocol::schema::chat::Presence;
        auto joined = this->dispatcher().template on_parsed<Presence>("user_joined",
            [](const simdjson::dom::element& root, Presence& out) {
                return protocol::parser::chat::presence::parse(root, true, out);
            }, cb);
        auto left = this->dispatcher().template on_parsed<Presence>("user_left",
            [](const simdjson::dom::element& root, Presence& out) {
                return protocol::parser::chat::presence::parse(root, false, out);
            }, std::move(cb));
        return [joined = std::move(joined), left = std::move(left)]() {
            joined();
            left();
        };
    }

    [[nodiscard]]
    inline Unsubscribe on_read_receipt(std::function<void(const protocol::schema::chat::ReadReceipt&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::chat::ReadReceipt>(
            "read_receipt", &protocol::parser::chat::read_receipt::parse, std::move(cb));
    }

    [[nodiscard]]
    inline const std::string& project_id() const noexcept { return project_id_; }

private:
    std::string project_id_;
};

} // namespace cardwire::client
