#pragma once

#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Appends `s` to `out` as the body of a JSON string literal (no quotes).
// Escapes quote, backslash and every control character below 0x20.
// Bytes >= 0x80 are copied verbatim (UTF-8 passes through).
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    for (const char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += HEX[(c >> 4) & 0x0F];
                    out += HEX[c & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    append_escaped(out, s);
    return out;
}

// Appends a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    append_escaped(out, s);
    out += '"';
}

// Appends `"key":"value"` (no leading comma)
inline void append_field(std::string& out, std::string_view key, std::string_view value) {
    append_string(out, key);
    out += ':';
    append_string(out, value);
}

// Literals must not decay to the bool overload
inline void append_field(std::string& out, std::string_view key, const char* value) {
    append_field(out, key, std::string_view(value));
}

inline void append_field(std::string& out, std::string_view key, const std::string& value) {
    append_field(out, key, std::string_view(value));
}

inline void append_field(std::string& out, std::string_view key, bool value) {
    append_string(out, key);
    out += value ? ":true" : ":false";
}

} // namespace json
} // namespace lcr
