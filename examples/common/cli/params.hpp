#pragma once

#include <string>
#include <ostream>
#include <iostream>
#include <cstdlib>
#include <chrono>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "cardwire/client/channel.hpp"
#include "cardwire/client/generation.hpp"
#include "lcr/log/logger.hpp"

namespace cardwire::examples::cli {

enum class Command {
    Chat,
    Direct,
    Generate
};

struct Params {
    Command command{Command::Chat};

    // Shared
    std::string base_url  = "http://localhost:8000/api";
    std::string token;
    std::string log_level = "info";
    int max_attempts      = 5;
    int base_delay_ms     = 1000;
    int keepalive_ms      = 30000;

    // chat
    std::string project_id;
    // dm
    std::string conversation_id;
    // generate
    std::string card_id;
    std::string owner_id;
    std::string initial_content;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Base URL     : " << base_url << "\n"
           << "  Attempts     : " << max_attempts << " (base delay " << base_delay_ms << " ms)\n"
           << "  Keepalive    : " << keepalive_ms << " ms\n";
        switch (command) {
        case Command::Chat:
            os << "  Project      : " << project_id << "\n";
            break;
        case Command::Direct:
            os << "  Conversation : " << (conversation_id.empty() ? "(none)" : conversation_id) << "\n";
            break;
        case Command::Generate:
            os << "  Card         : " << card_id << " (owner " << owner_id << ")\n";
            break;
        }
        os << "  Log Level    : " << log_level << "\n";
    }

    [[nodiscard]]
    inline client::ChannelConfig channel_config() const {
        client::ChannelConfig cfg;
        cfg.base_url = base_url;
        cfg.connection.max_attempts = max_attempts;
        cfg.connection.base_delay = std::chrono::milliseconds{base_delay_ms};
        cfg.connection.keepalive_interval = std::chrono::milliseconds{keepalive_ms};
        return cfg;
    }

    [[nodiscard]]
    inline client::GenerationConfig generation_config() const {
        client::GenerationConfig cfg;
        cfg.base_url = base_url;
        cfg.connection.max_attempts = max_attempts;
        cfg.connection.base_delay = std::chrono::milliseconds{base_delay_ms};
        cfg.connection.keepalive_interval = std::chrono::milliseconds{keepalive_ms};
        return cfg;
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv) {
    CLI::App app{"cardwire - real-time channel client\n"
        "Connects to the chat, direct-message or generation stream of a card server,\n"
        "prints inbound events and sends one frame per stdin line.\n"};
    app.require_subcommand(1);

    Params params{};

    app.add_option("--url", params.base_url, "Server base URL (http(s)://host/api)")->check(base_url_validator)->default_val(params.base_url);
    app.add_option("-t,--token", params.token, "Auth token")->required()->envname("CARDWIRE_TOKEN");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--max-attempts", params.max_attempts, "Reconnect attempts before giving up")->check(CLI::Range(0, 100));
    app.add_option("--base-delay", params.base_delay_ms, "Reconnect base delay in ms (delay = base * attempt)")->check(CLI::Range(0, 600000));
    app.add_option("--keepalive", params.keepalive_ms, "Keepalive interval in ms (0 disables)")->check(CLI::Range(0, 3600000))->default_val(params.keepalive_ms);

    auto* chat = app.add_subcommand("chat", "Project chat: each stdin line is sent as a message");
    chat->add_option("project", params.project_id, "Project id")->required()->check(id_validator);

    auto* dm = app.add_subcommand("dm", "Direct messages: each stdin line is sent to the conversation");
    dm->add_option("-c,--conversation", params.conversation_id, "Conversation to send to (receive-only if omitted)")->check(id_validator);

    auto* gen = app.add_subcommand("generate", "Generation stream: stdin lines edit the content, '/gen' starts a generation");
    gen->add_option("card", params.card_id, "Card id")->required()->check(id_validator);
    gen->add_option("-o,--owner", params.owner_id, "Card owner id")->required()->check(id_validator);
    gen->add_option("--content", params.initial_content, "Initial content");

    app.footer(
        "Runs until interrupted.\n"
        "Press Ctrl+C to disconnect and exit cleanly."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    if (chat->parsed()) {
        params.command = Command::Chat;
    }
    else if (dm->parsed()) {
        params.command = Command::Direct;
    }
    else {
        params.command = Command::Generate;
        // The generation stream retries less and slower
        if (app.get_option("--max-attempts")->count() == 0) {
            params.max_attempts = 3;
        }
        if (app.get_option("--base-delay")->count() == 0) {
            params.base_delay_ms = 2000;
        }
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace cardwire::examples::cli
