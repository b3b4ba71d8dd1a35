#pragma once

#include <string>


namespace cardwire::core::protocol::schema::system {

// Application keepalive, answered by {"type":"pong"}
struct Ping {
    [[nodiscard]]
    static inline std::string to_json() {
        return R"({"action":"ping"})";
    }
};

} // namespace cardwire::core::protocol::schema::system
