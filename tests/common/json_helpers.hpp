#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lcr/json.hpp"

// ----------------------------------------------------------------------------
// Inbound server frames used by the client tests
// ----------------------------------------------------------------------------

namespace json::frame {

inline std::string json_string(std::string_view s) {
    std::string out;
    lcr::json::append_string(out, s);
    return out;
}

inline std::string pong() {
    return R"({"type":"pong"})";
}

inline std::string error(std::string_view message) {
    return R"({"type":"error","message":)" + json_string(message) + "}";
}

inline std::string error(std::string_view message, std::string_view code) {
    return R"({"type":"error","message":)" + json_string(message) + R"(,"code":)" + json_string(code) + "}";
}

// -----------------------------------------------------------------------------
// Project chat
// -----------------------------------------------------------------------------
namespace chat {

inline std::string new_message(std::string_view id, std::string_view content, std::string_view author_name = "Alice") {
    return R"({"type":"new_message","message":{"id":)" + json_string(id) +
           R"(,"project_id":"p1","author_id":"u1","author_name":)" + json_string(author_name) +
           R"(,"author_avatar":null,"content":)" + json_string(content) +
           R"(,"message_type":"text","reply_to_id":null,"created_at":"2024-05-01T10:00:00Z"}})";
}

inline std::string typing(std::string_view user_id, bool is_typing) {
    return R"({"type":"typing","user_id":)" + json_string(user_id) +
           R"(,"user_name":"Bob","is_typing":)" + (is_typing ? "true" : "false") + "}";
}

inline std::string message_edited(std::string_view id, std::string_view new_content) {
    return R"({"type":"message_edited","message_id":)" + json_string(id) +
           R"(,"new_content":)" + json_string(new_content) + R"(,"edited_at":"2024-05-01T10:05:00Z"})";
}

inline std::string message_deleted(std::string_view id) {
    return R"({"type":"message_deleted","message_id":)" + json_string(id) + "}";
}

inline std::string user_joined(std::string_view user_id) {
    return R"({"type":"user_joined","user_id":)" + json_string(user_id) +
           R"(,"user_name":"Carol","online_users":["u1",)" + json_string(user_id) + "]}";
}

inline std::string user_left(std::string_view user_id) {
    return R"({"type":"user_left","user_id":)" + json_string(user_id) + R"(,"online_users":["u1"]})";
}

} // namespace chat

// -----------------------------------------------------------------------------
// Direct messages
// -----------------------------------------------------------------------------
namespace direct {

inline std::string new_message(std::string_view id, std::string_view conversation_id, std::string_view content) {
    return R"({"type":"new_message","message":{"id":)" + json_string(id) +
           R"(,"conversation_id":)" + json_string(conversation_id) +
           R"(,"sender_id":"u2","sender_name":"Bob","content":)" + json_string(content) +
           R"(,"reply_to_id":null,"is_read":false,"created_at":"2024-05-01T10:00:00Z"}})";
}

inline std::string forwarded_message(std::string_view id, std::string_view conversation_id, std::string_view content) {
    return R"({"type":"new_message","message":{"id":)" + json_string(id) +
           R"(,"conversation_id":)" + json_string(conversation_id) +
           R"(,"sender_id":"u2","sender_name":"Bob","content":)" + json_string(content) +
           R"(,"forwarded_from_user_id":"u9","forwarded_from_name":"Dave","is_read":true,"created_at":"2024-05-01T10:00:00Z"}})";
}

inline std::string message_edited(std::string_view id, std::string_view conversation_id, std::string_view content) {
    return R"({"type":"message_edited","message_id":)" + json_string(id) +
           R"(,"conversation_id":)" + json_string(conversation_id) +
           R"(,"content":)" + json_string(content) + "}";
}

inline std::string message_deleted(std::string_view id, std::string_view conversation_id) {
    return R"({"type":"message_deleted","message_id":)" + json_string(id) +
           R"(,"conversation_id":)" + json_string(conversation_id) + "}";
}

inline std::string message_hidden(std::string_view id, std::string_view conversation_id) {
    return R"({"type":"message_hidden_for_user","message_id":)" + json_string(id) +
           R"(,"conversation_id":)" + json_string(conversation_id) + "}";
}

inline std::string read_receipt(std::string_view conversation_id, std::string_view user_id) {
    return R"({"type":"read_receipt","conversation_id":)" + json_string(conversation_id) +
           R"(,"user_id":)" + json_string(user_id) + R"(,"read_at":"2024-05-01T10:10:00Z"})";
}

} // namespace direct

// -----------------------------------------------------------------------------
// Generation stream
// -----------------------------------------------------------------------------
namespace stream {

inline std::string start() {
    return R"({"type":"start","message":"Generating bio..."})";
}

inline std::string chunk(std::string_view content) {
    return R"({"type":"chunk","content":)" + json_string(content) + "}";
}

inline std::string complete(std::string_view full_bio) {
    return R"({"type":"complete","full_bio":)" + json_string(full_bio) + "}";
}

inline std::string tags_update(const std::vector<std::string>& names) {
    std::string out = R"({"type":"tags_update","tags":[)";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += R"({"name":)" + json_string(names[i]) + R"(,"category":"skill","confidence":0.9,"reason":"mentioned"})";
    }
    out += "]}";
    return out;
}

} // namespace stream

} // namespace json::frame
