#pragma once

#include <string>
#include <vector>
#include <ostream>

#include "lcr/optional.hpp"


namespace cardwire::core::protocol::schema::stream {

// {"type":"start","message":"..."}: a generation session began server-side
struct Start {
    lcr::optional<std::string> message;
};

// {"type":"chunk","content":"..."}
struct Chunk {
    std::string content;
};

// {"type":"complete","full_bio":"..."}
struct Complete {
    std::string full_bio;
};

// ===============================================
// TAG SUGGESTION
// ===============================================
struct Tag {
    std::string name;
    std::string category;
    double confidence{0.0};      // 0..1
    std::string reason;

    inline void dump(std::ostream& os) const {
        os << name << " (" << category << ", " << confidence << ")";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Tag& t) {
    t.dump(os);
    return os;
}

// {"type":"tags_update","tags":[...]}
struct TagsUpdate {
    std::vector<Tag> tags;
};

} // namespace cardwire::core::protocol::schema::stream
