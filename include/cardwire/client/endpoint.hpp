#pragma once

#include <string>
#include <string_view>


namespace cardwire::client::endpoint {

// Percent-encodes everything except RFC 3986 unreserved characters
[[nodiscard]]
inline std::string percent_encode(std::string_view in) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        const auto u = static_cast<unsigned char>(c);
        const bool unreserved =
            (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') ||
            u == '-' || u == '_' || u == '.' || u == '~';
        if (unreserved) {
            out += c;
        }
        else {
            out += '%';
            out += HEX[u >> 4];
            out += HEX[u & 0x0F];
        }
    }
    return out;
}

// Normalizes a server base URL to a WebSocket origin:
//   http://host/api/  ->  ws://host
//   https://host      ->  wss://host
//   wss://host/       ->  wss://host
[[nodiscard]]
inline std::string to_ws_origin(std::string_view base) {
    std::string out;
    if (base.substr(0, 8) == "https://") {
        out = "wss://";
        base.remove_prefix(8);
    }
    else if (base.substr(0, 7) == "http://") {
        out = "ws://";
        base.remove_prefix(7);
    }
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    constexpr std::string_view API = "/api";
    if (base.size() >= API.size() && base.substr(base.size() - API.size()) == API) {
        base.remove_suffix(API.size());
    }
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    out += base;
    return out;
}

// {origin}/api/ws/chat/{project}?token={t}
[[nodiscard]]
inline std::string chat_url(std::string_view base, std::string_view project_id, std::string_view token) {
    return to_ws_origin(base) + "/api/ws/chat/" + percent_encode(project_id) + "?token=" + percent_encode(token);
}

// {origin}/api/ws/dm?token={t}
[[nodiscard]]
inline std::string dm_url(std::string_view base, std::string_view token) {
    return to_ws_origin(base) + "/api/ws/dm?token=" + percent_encode(token);
}

// {origin}/api/ws/cards/{card}?token={t}&owner_id={owner}
[[nodiscard]]
inline std::string card_url(std::string_view base, std::string_view card_id, std::string_view token, std::string_view owner_id) {
    return to_ws_origin(base) + "/api/ws/cards/" + percent_encode(card_id) +
           "?token=" + percent_encode(token) + "&owner_id=" + percent_encode(owner_id);
}

} // namespace cardwire::client::endpoint
