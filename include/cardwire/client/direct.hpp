#pragma once

#include <string>
#include <utility>
#include <functional>

#include "cardwire/client/channel.hpp"
#include "cardwire/client/endpoint.hpp"
#include "cardwire/core/protocol/parser/direct.hpp"
#include "cardwire/core/protocol/schema/direct/inbound.hpp"
#include "cardwire/core/protocol/schema/direct/request.hpp"
#include "lcr/optional.hpp"


namespace cardwire::client {

/*
===============================================================================
 client::DirectClient
===============================================================================

Direct-message channel: /api/ws/dm?token={token}

One socket serves every conversation of the authenticated user, so each
outbound request names its conversation_id and inbound events carry one.
Same send semantics as ChatClient: no queueing, call order preserved.
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class DirectClient : public Channel<WS, Clock> {
    using Base = Channel<WS, Clock>;
    using Message = protocol::schema::direct::Message;

public:
    using Deferred    = typename Base::Deferred;
    using Unsubscribe = typename Base::Unsubscribe;

    DirectClient(ChannelConfig cfg, credentials::Provider creds)
        : Base("[DM]", std::move(cfg), std::move(creds))
    {
    }

    [[nodiscard]]
    inline Deferred connect() {
        return this->open_([this](const std::string& token) {
            return endpoint::dm_url(this->config().base_url, token);
        });
    }

    // ---------------------------------------------------------------------
    // Outbound
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline bool send_message(std::string conversation_id, std::string content, lcr::optional<std::string> reply_to_id = {}) {
        protocol::schema::direct::SendMessage req{std::move(conversation_id), std::move(content), std::move(reply_to_id)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool send_typing(std::string conversation_id, bool is_typing) {
        protocol::schema::direct::SetTyping req{std::move(conversation_id), is_typing};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool edit_message(std::string conversation_id, std::string message_id, std::string content) {
        protocol::schema::direct::EditMessage req{std::move(conversation_id), std::move(message_id), std::move(content)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool delete_message(std::string conversation_id, std::string message_id, bool for_me = false) {
        protocol::schema::direct::DeleteMessage req{std::move(conversation_id), std::move(message_id), for_me};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool forward_message(std::string conversation_id, std::string source_message_id) {
        protocol::schema::direct::ForwardMessage req{std::move(conversation_id), std::move(source_message_id)};
        return this->send_(req.to_json());
    }

    [[nodiscard]]
    inline bool mark_read(std::string conversation_id) {
        protocol::schema::direct::MarkRead req{std::move(conversation_id)};
        return this->send_(req.to_json());
    }

    // ---------------------------------------------------------------------
    // Typed subscriptions
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline Unsubscribe on_new_message(std::function<void(const Message&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::NewMessage>(
            "new_message", &protocol::parser::direct::new_message::parse,
            [cb = std::move(cb)](const protocol::schema::direct::NewMessage& m) { cb(m.message); });
    }

    [[nodiscard]]
    inline Unsubscribe on_typing(std::function<void(const protocol::schema::direct::Typing&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::Typing>(
            "typing", &protocol::parser::direct::typing::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_message_edited(std::function<void(const protocol::schema::direct::MessageEdited&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::MessageEdited>(
            "message_edited", &protocol::parser::direct::message_edited::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_message_deleted(std::function<void(const protocol::schema::direct::MessageDeleted&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::MessageDeleted>(
            "message_deleted", &protocol::parser::direct::message_deleted::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_message_hidden(std::function<void(const protocol::schema::direct::MessageHidden&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::MessageHidden>(
            "message_hidden_for_user", &protocol::parser::direct::message_hidden::parse, std::move(cb));
    }

    [[nodiscard]]
    inline Unsubscribe on_read_receipt(std::function<void(const protocol::schema::direct::ReadReceipt&)> cb) {
        return this->dispatcher().template on_parsed<protocol::schema::direct::ReadReceipt>(
            "read_receipt", &protocol::parser::direct::read_receipt::parse, std::move(cb));
    }
};

} // namespace cardwire::client
