#pragma once

#include <string>
#include <ostream>

#include "lcr/optional.hpp"


namespace cardwire::core::protocol::schema::direct {

// ===============================================
// DIRECT MESSAGE
// ===============================================
struct Message {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    std::string sender_name;
    std::string content;
    lcr::optional<std::string> reply_to_id;
    lcr::optional<std::string> forwarded_from_user_id;
    lcr::optional<std::string> forwarded_from_name;
    bool is_read{false};
    std::string created_at;

    [[nodiscard]]
    inline bool is_forwarded() const noexcept {
        return forwarded_from_user_id.has();
    }

    inline void dump(std::ostream& os) const {
        os << "[DM] { id=" << id
           << ", conversation_id=" << conversation_id
           << ", sender=" << sender_name
           << ", content=\"" << content << "\"";
        if (forwarded_from_name.has()) {
            os << ", forwarded_from=" << forwarded_from_name.value();
        }
        os << ", read=" << (is_read ? "yes" : "no") << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Message& m) {
    m.dump(os);
    return os;
}

struct NewMessage {
    Message message;
};

struct Typing {
    std::string conversation_id;
    std::string user_id;
    std::string user_name;
    bool is_typing{false};
};

// The DM server names the edited text `content` (chat uses `new_content`)
struct MessageEdited {
    std::string message_id;
    std::string conversation_id;
    std::string content;
    std::string edited_at;
};

struct MessageDeleted {
    std::string message_id;
    std::string conversation_id;
};

// Sent only to the user who deleted a message "for me"
struct MessageHidden {
    std::string message_id;
    std::string conversation_id;
};

struct ReadReceipt {
    std::string conversation_id;
    std::string user_id;
    std::string read_at;
};

} // namespace cardwire::core::protocol::schema::direct
