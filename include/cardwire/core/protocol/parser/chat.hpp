#pragma once

#include "cardwire/core/protocol/parser/common.hpp"
#include "cardwire/core/protocol/parser/helpers.hpp"
#include "cardwire/core/protocol/schema/chat/inbound.hpp"

#include "simdjson.h"


namespace cardwire::core::protocol::parser::chat {

namespace schema = cardwire::core::protocol::schema::chat;

// {"type":"new_message","message":{...}}
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
        if ((r = helper::parse_string_required(msg, "project_id", m.project_id)) != Result::Parsed) {
            return reject("new_message", "message.project_id", r);
        }
        if ((r = helper::parse_string_required(msg, "content", m.content)) != Result::Parsed) {
            return reject("new_message", "message.content", r);
        }
        if ((r = helper::parse_string_optional(msg, "author_id", m.author_id)) != Result::Parsed) {
            return reject("new_message", "message.author_id", r);
        }
        if ((r = helper::parse_string_optional(msg, "author_name", m.author_name)) != Result::Parsed) {
            return reject("new_message", "message.author_name", r);
        }
        if ((r = helper::parse_string_optional(msg, "author_avatar", m.author_avatar)) != Result::Parsed) {
            return reject("new_message", "message.author_avatar", r);
        }
        if ((r = helper::parse_string_optional(msg, "reply_to_id", m.reply_to_id)) != Result::Parsed) {
            return reject("new_message", "message.reply_to_id", r);
        }
        lcr::optional<std::string> message_type;
        if ((r = helper::parse_string_optional(msg, "message_type", message_type)) != Result::Parsed) {
            return reject("new_message", "message.message_type", r);
        }
        m.message_type = message_type.value_or("text");
        lcr::optional<std::string> created_at;
        if ((r = helper::parse_string_optional(msg, "created_at", created_at)) != Result::Parsed) {
            return reject("new_message", "message.created_at", r);
        }
        m.created_at = created_at.value_or("");
        return Result::Parsed;
    }
};

struct typing {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Typing& out) {
        out = schema::Typing{};
        Result r;
        if ((r = helper::parse_string_required(root, "user_id", out.user_id)) != Result::Parsed) {
            return reject("typing", "user_id", r);
        }
        if ((r = helper::parse_bool_required(root, "is_typing", out.is_typing)) != Result::Parsed) {
            return reject("typing", "is_typing", r);
        }
        lcr::optional<std::string> name;
        if ((r = helper::parse_string_optional(root, "user_name", name)) != Result::Parsed) {
            return reject("typing", "user_name", r);
        }
        out.user_name = name.value_or("");
        return Result::Parsed;
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
        if ((r = helper::parse_string_required(root, "new_content", out.new_content)) != Result::Parsed) {
            return reject("message_edited", "new_content", r);
        }
        lcr::optional<std::string> edited_at;
        if ((r = helper::parse_string_optional(root, "edited_at", edited_at)) != Result::Parsed) {
            return reject("message_edited", "edited_at", r);
        }
        out.edited_at = edited_at.value_or("");
        return Result::Parsed;
    }
};

struct message_deleted {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::MessageDeleted& out) {
        out = schema::MessageDeleted{};
        auto r = helper::parse_id_required(root, "message_id", out.message_id);
        if (r != Result::Parsed) {
            return reject("message_deleted", "message_id", r);
        }
        return Result::Parsed;
    }
};

// user_joined / user_left share one layout
struct presence {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, bool joined, schema::Presence& out) {
        out = schema::Presence{};
        out.joined = joined;
        const char* type = joined ? "user_joined" : "user_left";
        Result r;
        if ((r = helper::parse_string_required(root, "user_id", out.user_id)) != Result::Parsed) {
            return reject(type, "user_id", r);
        }
        lcr::optional<std::string> name;
        if ((r = helper::parse_string_optional(root, "user_name", name)) != Result::Parsed) {
            return reject(type, "user_name", r);
        }
        out.user_name = name.value_or("");
        if ((r = helper::parse_string_list_optional(root, "online_users", out.online_users)) != Result::Parsed) {
            return reject(type, "online_users", r);
        }
        return Result::Parsed;
    }
};

struct read_receipt {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ReadReceipt& out) {
        out = schema::ReadReceipt{};
        Result r;
        if ((r = helper::parse_string_required(root, "user_id", out.user_id)) != Result::Parsed) {
            return reject("read_receipt", "user_id", r);
        }
        lcr::optional<std::string> project_id;
        if ((r = helper::parse_string_optional(root, "project_id", project_id)) != Result::Parsed) {
            return reject("read_receipt", "project_id", r);
        }
        out.project_id = project_id.value_or("");
        lcr::optional<std::string> read_at;
        if ((r = helper::parse_string_optional(root, "read_at", read_at)) != Result::Parsed) {
            return reject("read_receipt", "read_at", r);
        }
        out.read_at = read_at.value_or("");
        return Result::Parsed;
    }
};

} // namespace cardwire::core::protocol::parser::chat
