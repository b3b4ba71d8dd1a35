#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "cardwire/core/transport/error.hpp"


namespace cardwire::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;     // path + query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    // Accepts the URLs produced by client::Endpoint and rejects malformed
    // inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://cards.example.com/api/ws/dm?token=abc
    //   ws://localhost:8000/api/ws/chat/42?token=abc
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port] (ends at the path or the query)
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Path (default "/" if missing, keep query)
        if (end == std::string_view::npos) {
            out.path = "/";
        }
        else if (url[end] == '?') {
            out.path = "/" + std::string(url.substr(end));
        }
        else {
            out.path = std::string(url.substr(end));
        }

        // Host / port checks -------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        for (char c : out.path) {
            if (c == ' ' || c == '#') {
                return Error::InvalidUrl;
            }
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace cardwire::core::transport
