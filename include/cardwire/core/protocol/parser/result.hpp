#pragma once

#include <cstdint>
#include <string_view>


namespace cardwire::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    // ---- Parsing domain (0–7) ----
    Ignored        = 0,            // Unknown or intercepted message type
    InvalidJson    = 1,            // Not valid JSON
    InvalidSchema  = 2,            // Missing required field, type mismatch, missing "type" tag
    InvalidValue   = 3,            // Field present but semantically invalid (e.g. empty id)
    Parsed         = 4,            // Parsed successfully

    // ---- Delivery domain (8–15) ----
    Delivered      = 8,            // Parsed and handed to at least one handler
    Unhandled      = 9             // Parsed, but no handler is registered for the type
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        case Result::Delivered:      return "Delivered";
        case Result::Unhandled:      return "Unhandled";
        default:                     return "unknown";
    }
}

} // namespace cardwire::core::protocol::parser
