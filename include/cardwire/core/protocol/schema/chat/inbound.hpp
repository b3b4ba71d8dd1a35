#pragma once

#include <string>
#include <vector>
#include <ostream>

#include "lcr/optional.hpp"


namespace cardwire::core::protocol::schema::chat {

// ===============================================
// PROJECT CHAT MESSAGE
// ===============================================
struct Message {
    std::string id;
    std::string project_id;
    lcr::optional<std::string> author_id;
    lcr::optional<std::string> author_name;
    lcr::optional<std::string> author_avatar;
    std::string content;
    std::string message_type{"text"};
    lcr::optional<std::string> reply_to_id;
    std::string created_at;                      // ISO-8601, passed through verbatim

    inline void dump(std::ostream& os) const {
        os << "[CHAT MESSAGE] { id=" << id
           << ", project_id=" << project_id
           << ", author=" << author_name.value_or(author_id.value_or("?"))
           << ", type=" << message_type
           << ", content=\"" << content << "\"";
        if (reply_to_id.has()) {
            os << ", reply_to=" << reply_to_id.value();
        }
        os << ", created_at=" << created_at << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Message& m) {
    m.dump(os);
    return os;
}

// {"type":"new_message","message":{...}}
struct NewMessage {
    Message message;
};

// {"type":"typing",...}
struct Typing {
    std::string user_id;
    std::string user_name;
    bool is_typing{false};
};

// {"type":"message_edited",...}
struct MessageEdited {
    std::string message_id;
    std::string new_content;
    std::string edited_at;
};

// {"type":"message_deleted",...}
struct MessageDeleted {
    std::string message_id;
};

// {"type":"user_joined"|"user_left",...}
struct Presence {
    bool joined{false};
    std::string user_id;
    std::string user_name;
    std::vector<std::string> online_users;
};

// {"type":"read_receipt",...}
struct ReadReceipt {
    std::string user_id;
    std::string project_id;
    std::string read_at;
};

} // namespace cardwire::core::protocol::schema::chat
