#pragma once

#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

/*
================================================================================
Project chat: outbound requests
================================================================================

Every frame is a JSON object discriminated by "action". Strings are escaped
with lcr::json; absent optional fields are omitted.

  {"action":"send_message","content":"...","reply_to_id":"..."}
  {"action":"typing","is_typing":true}
  {"action":"edit_message","message_id":"...","content":"..."}
  {"action":"delete_message","message_id":"..."}
  {"action":"mark_read"}
================================================================================
*/

namespace cardwire::core::protocol::schema::chat {

struct SendMessage {
    std::string content;
    lcr::optional<std::string> reply_to_id{};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(48 + content.size());
        out += R"({"action":"send_message",)";
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
    bool is_typing{false};

    [[nodiscard]]
    inline std::string to_json() const {
        return is_typing ? R"({"action":"typing","is_typing":true})"
                         : R"({"action":"typing","is_typing":false})";
    }
};

struct EditMessage {
    std::string message_id;
    std::string content;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(64 + message_id.size() + content.size());
        out += R"({"action":"edit_message",)";
        lcr::json::append_field(out, "message_id", message_id);
        out += ',';
        lcr::json::append_field(out, "content", content);
        out += '}';
        return out;
    }
};

struct DeleteMessage {
    std::string message_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = R"({"action":"delete_message",)";
        lcr::json::append_field(out, "message_id", message_id);
        out += '}';
        return out;
    }
};

struct MarkRead {
    [[nodiscard]]
    inline std::string to_json() const {
        return R"({"action":"mark_read"})";
    }
};

} // namespace cardwire::core::protocol::schema::chat
