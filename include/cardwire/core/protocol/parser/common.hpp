#pragma once

#include <string_view>

#include "cardwire/core/protocol/parser/helpers.hpp"
#include "cardwire/core/protocol/schema/common.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace cardwire::core::protocol::parser {

// Reads the "type" discriminant of an inbound frame
[[nodiscard]]
inline Result parse_type_required(const simdjson::dom::element& root, std::string_view& out) noexcept {
    if (helper::require_object(root) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto r = helper::parse_string_required(root, schema::TYPE_KEY, out);
    if (r != Result::Parsed) {
        return r;
    }
    return out.empty() ? Result::InvalidValue : Result::Parsed;
}

// {"type":"error","message":"...","code":"..."}
struct error_notice {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ErrorNotice& out) {
        out = schema::ErrorNotice{};
        // A missing message is tolerated: the frame still reports a failure
        lcr::optional<std::string> message;
        if (helper::parse_string_optional(root, "message", message) != Result::Parsed) {
            CW_WARN("[PARSER] error: field 'message' is not a string");
            return Result::InvalidSchema;
        }
        out.message = message.value_or("Unknown error");
        if (helper::parse_string_optional(root, "code", out.code) != Result::Parsed) {
            CW_WARN("[PARSER] error: field 'code' is not a string");
            return Result::InvalidSchema;
        }
        return Result::Parsed;
    }
};

// Logs a schema failure for `type` and passes the result through
inline Result reject(std::string_view type, std::string_view field, Result r) {
    CW_WARN("[PARSER] " << type << ": invalid field '" << field << "' (" << to_string(r) << ")");
    return r;
}

} // namespace cardwire::core::protocol::parser
