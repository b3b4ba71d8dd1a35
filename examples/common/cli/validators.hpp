#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace cardwire::examples::cli {

// -------------------------------------------------------------
// Server base URL validator
// -------------------------------------------------------------
inline auto base_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (const char* scheme : {"http://", "https://", "ws://", "wss://"}) {
            if (value.rfind(scheme, 0) == 0 && value.size() > std::string(scheme).size()) {
                return {};
            }
        }
        return "URL must start with http://, https://, ws:// or wss://";
    },
    "Server base URL validator"
);

// -------------------------------------------------------------
// Resource id validator (project, card, owner)
// -------------------------------------------------------------
inline auto id_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "Identifier must not be empty";
        }
        for (const char c : value) {
            if (c == ' ' || c == '/' || c == '?' || c == '#') {
                return "Identifier must not contain spaces, '/', '?' or '#'";
            }
        }
        return {};
    },
    "Resource identifier validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"});

} // namespace cardwire::examples::cli
