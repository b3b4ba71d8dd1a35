#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "cardwire/core/protocol/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the channel parsers to extract primitive values from
simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structure (object presence, type correctness)
  • Parse primitive field types (bool, integer, double, string)
  • Provide strict optional-field semantics

Optional fields:
  • Absent and JSON null are both reported as "not present"
  • Present with the wrong type is InvalidSchema

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace cardwire::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return root.is_object() ? Result::Parsed : Result::InvalidSchema;
}

// Looks up `key`; false when the parent is not an object or the key is absent
[[nodiscard]]
inline bool find_field(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!parent.is_object()) {
        return false;
    }
    return !parent[key].get(out);
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!find_field(parent, key, out)) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

// ------------------------------------------------------------
// ARRAY FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(parent, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!find_field(parent, key, field) || field.is_null()) {
        return Result::Parsed; // optional, not present
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}


// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(obj, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(obj, key, field)) {
        return Result::InvalidSchema;
    }
    // Accept any JSON number
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// String view into the parser's buffer: valid until the next parse
[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(obj, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) {
    std::string_view sv;
    auto r = parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    out.assign(sv);
    return Result::Parsed;
}

// Identifiers: present, string, non-empty
[[nodiscard]]
inline Result parse_id_required(const simdjson::dom::element& obj, const char* key, std::string& out) {
    auto r = parse_string_required(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    return out.empty() ? Result::InvalidValue : Result::Parsed;
}


// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) {
    // Always reset output
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!find_field(obj, key, field) || field.is_null()) {
        return Result::Parsed; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!find_field(obj, key, field) || field.is_null()) {
        return Result::Parsed;
    }
    bool tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!find_field(obj, key, field) || field.is_null()) {
        return Result::Parsed;
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

// Array of strings; absent or null yields an empty list
[[nodiscard]]
inline Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out) {
    out.clear();
    simdjson::dom::array arr;
    bool present = false;
    auto r = parse_array_optional(obj, key, arr, present);
    if (r != Result::Parsed || !present) {
        return r;
    }
    for (auto v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            return Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    return Result::Parsed;
}

} // namespace cardwire::core::protocol::parser::helper
