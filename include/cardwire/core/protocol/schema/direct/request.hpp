#pragma once

#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace cardwire::core::protocol::schema::direct {

// Direct-message frames always name the conversation they act on.
// Field order: action, conversation_id, then request fields.
namespace detail {

inline std::string begin_frame(const char* action, const std::string& conversation_id) {
    std::string out;
    out.reserve(96);
    out += "{";
    lcr::json::append_field(out, "action", action);
    out += ',';
    lcr::json::append_field(out, "conversation_id", conversation_id);
    return out;
}

} // namespace detail

struct SendMessage {
    std::string conversation_id;
    std::string content;
    lcr::optional<std::string> reply_to_id{};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("send_message", conversation_id);
        out += ',';
        lcr::json::append_field(out, "content", content);
        if (reply_to_id.has()) {
            out += ',';
            lcr::json::append_field(out, "reply_to_id", reply_to_id.value());
        }
        out += '}';
        return out;
    }
};

struct SetTyping {
    std::string conversation_id;
    bool is_typing{false};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("typing", conversation_id);
        out += ',';
        lcr::json::append_field(out, "is_typing", is_typing);
        out += '}';
        return out;
    }
};

struct EditMessage {
    std::string conversation_id;
    std::string message_id;
    std::string content;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("edit_message", conversation_id);
        out += ',';
        lcr::json::append_field(out, "message_id", message_id);
        out += ',';
        lcr::json::append_field(out, "content", content);
        out += '}';
        return out;
    }
};

// for_me: hide the message for the caller only instead of deleting it for both sides
struct DeleteMessage {
    std::string conversation_id;
    std::string message_id;
    bool for_me{false};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("delete_message", conversation_id);
        out += ',';
        lcr::json::append_field(out, "message_id", message_id);
        out += ',';
        lcr::json::append_field(out, "for_me", for_me);
        out += '}';
        return out;
    }
};

// Copies an existing message into `conversation_id`
struct ForwardMessage {
    std::string conversation_id;
    std::string source_message_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("forward_message", conversation_id);
        out += ',';
        lcr::json::append_field(out, "source_message_id", source_message_id);
        out += '}';
        return out;
    }
};

struct MarkRead {
    std::string conversation_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = detail::begin_frame("mark_read", conversation_id);
        out += '}';
        return out;
    }
};

} // namespace cardwire::core::protocol::schema::direct
