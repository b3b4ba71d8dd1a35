#pragma once

#include <string>
#include <ostream>

#include "lcr/optional.hpp"


namespace cardwire::core::protocol::schema {

// Inbound tag shared by every channel
inline constexpr const char* TYPE_KEY = "type";

// ===============================================
// ERROR NOTICE
// Application-level error reported by the server
// ({"type":"error","message":...,"code":...})
// ===============================================
struct ErrorNotice {
    std::string message;
    lcr::optional<std::string> code;   // machine-readable reason, e.g. "rate_limit"

    inline void dump(std::ostream& os) const {
        os << "[ERROR] { message=\"" << message << "\"";
        if (code.has()) {
            os << ", code=" << code.value();
        }
        os << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const ErrorNotice& n) {
    n.dump(os);
    return os;
}

} // namespace cardwire::core::protocol::schema
