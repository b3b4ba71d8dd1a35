#pragma once

#include "cardwire/core/protocol/parser/common.hpp"
#include "cardwire/core/protocol/parser/helpers.hpp"
#include "cardwire/core/protocol/schema/direct/inbound.hpp"

#include "simdjson.h"


namespace cardwire::core::protocol::parser::direct {

namespace schema = cardwire::core::protocol::schema::direct;

namespace detail {

// message_id + conversation_id, shared by deleted / hidden notifications
template <class T>
[[nodiscard]]
inline Result parse_message_ref(const simdjson::dom::element& root, const char* type, T& out) {
    Result r;
    if ((r = helper::parse_id_required(root, "message_id", out.message_id)) != Result::Parsed) {
        return reject(type, "message_id", r);
    }
    if ((r = helper::parse_id_required(root, "conversation_id", out.conversation_id)) != Result::Parsed) {
        return reject(type, "conversation_id", r);
    }
    return Result::Parsed;
}

inline Result parse_optional_text(const simdjson::dom::element& obj, const char* key, const char* type, std::string& out) {
    lcr::optional<std::string> tmp;
    auto r = helper::parse_string_optional(obj, key, tmp);
    if (r != Result::Parsed) {
        return reject(type, key, r);
    }
    out = tmp.value_or("");
    return Result::Parsed;
}

} // namespace detail

struct new_message {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::NewMessage& out) {
        out = schema::NewMessage{};
        simdjson::dom::element msg;
        auto r = helper::parse_object_required(root, "message", msg);
        if (r != Result::Parsed) {
            return reject("new_message", "message", r);
        }
        auto& m = out.message;
        if ((r = helper::parse_id_required(msg, "id", m.id)) != Result::Parsed) {
            return reject("new_message", "message.id", r);
        }
        if ((r = helper::parse_id_required(msg, "conversation_id", m.conversation_id)) != Result::Parsed) {
            return reject("new_message", "message.conversation_id", r);
        }
        if ((r = helper::parse_string_required(msg, "sender_id", m.sender_id)) != Result::Parsed) {
            return reject("new_message", "message.sender_id", r);
        }
        if ((r = helper::parse_string_required(msg, "content", m.content)) != Result::Parsed) {
            return reject("new_message", "message.content", r);
        }
        if ((r = detail::parse_optional_text(msg, "sender_name", "new_message", m.sender_name)) != Result::Parsed) {
            return r;
        }
        if ((r = detail::parse_optional_text(msg, "created_at", "new_message", m.created_at)) != Result::Parsed) {
            return r;
        }
        if ((r = helper::parse_string_optional(msg, "reply_to_id", m.reply_to_id)) != Result::Parsed) {
            return reject("new_message", "message.reply_to_id", r);
        }
        if ((r = helper::parse_string_optional(msg, "forwarded_from_user_id", m.forwarded_from_user_id)) != Result::Parsed) {
            return reject("new_message", "message.forwarded_from_user_id", r);
        }
        if ((r = helper::parse_string_optional(msg, "forwarded_from_name", m.forwarded_from_name)) != Result::Parsed) {
            return reject("new_message", "message.forwarded_from_name", r);
        }
        lcr::optional<bool> is_read;
        if ((r = helper::parse_bool_optional(msg, "is_read", is_read)) != Result::Parsed) {
            return reject("new_message", "message.is_read", r);
        }
        m.is_read = is_read.value_or(false);
        return Result::Parsed;
    }
};

struct typing {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Typing& out) {
        out = schema::Typing{};
        Result r;
        if ((r = helper::parse_id_required(root, "conversation_id", out.conversation_id)) != Result::Parsed) {
            return reject("typing", "conversation_id", r);
        }
        if ((r = helper::parse_string_required(root, "user_id", out.user_id)) != Result::Parsed) {
            return reject("typing", "user_id", r);
        }
        if ((r = helper::parse_bool_required(root, "is_typing", out.is_typing)) != Result::Parsed) {
            return reject("typing", "is_typing", r);
        }
        return detail::parse_optional_text(root, "user_name", "typing", out.user_name);
    }
};

struct message_edited {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::MessageEdited& out) {
        out = schema::MessageEdited{};
        Result r;
        if ((r = helper::parse_id_required(root, "message_id", out.message_id)) != Result::Parsed) {
            return reject("message_edited", "message_id", r);
        }
        if ((r = helper::parse_id_required(root, "conversation_id", out.conversation_id)) != Result::Parsed) {
            return reject("message_edited", "conversation_id", r);
        }
        if ((r = helper::parse_string_required(root, "content", out.content)) != Result::Parsed) {
            return reject("message_edited", "content", r);
        }
        return detail::parse_optional_text(root, "edited_at", "message_edited", out.edited_at);
    }
};

struct message_deleted {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::MessageDeleted& out) {
        out = schema::MessageDeleted{};
        return detail::parse_message_ref(root, "message_deleted", out);
    }
};

struct message_hidden {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::MessageHidden& out) {
        out = schema::MessageHidden{};
        return detail::parse_message_ref(root, "message_hidden_for_user", out);
    }
};

struct read_receipt {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ReadReceipt& out) {
        out = schema::ReadReceipt{};
        Result r;
        if ((r = helper::parse_id_required(root, "conversation_id", out.conversation_id)) != Result::Parsed) {
            return reject("read_receipt", "conversation_id", r);
        }
        if ((r = helper::parse_string_required(root, "user_id", out.user_id)) != Result::Parsed) {
            return reject("read_receipt", "user_id", r);
        }
        return detail::parse_optional_text(root, "read_at", "read_receipt", out.read_at);
    }
};

} // namespace cardwire::core::protocol::parser::direct
