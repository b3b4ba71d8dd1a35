#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "cardwire.hpp"
#include "common/cli/params.hpp"
#include "common/loop/stdin_lines.hpp"

using namespace cardwire;
namespace cs = cardwire::core::protocol::schema;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Lifecycle output shared by every channel
// -----------------------------------------------------------------------------
template <class Client>
void attach_lifecycle(Client& client) {
    client.on_connected([] {
        std::cout << "[cardwire] Connected" << std::endl;
    });
    client.on_error([](core::transport::Error e) {
        std::cout << "[cardwire] Error: " << core::transport::to_string(e) << std::endl;
    });
    client.on_reconnecting([](int attempt, std::chrono::milliseconds delay) {
        std::cout << "[cardwire] Reconnecting (attempt " << attempt << ") in " << delay.count() << " ms" << std::endl;
    });
    client.on_disconnected([](core::transport::DisconnectReason reason, core::transport::Error e) {
        std::cout << "[cardwire] Disconnected: " << core::transport::to_string(reason)
                  << " (" << core::transport::to_string(e) << ")" << std::endl;
        running.store(false);
    });
}

// Polls `client` and feeds stdin lines to `on_line` until interrupted
template <class Client, class OnLine>
void run_loop(Client& client, OnLine&& on_line) {
    examples::loop::StdinLines lines;
    std::string line;
    int idle_spins = 0;
    while (running.load()) {
        bool did_work = false;
        client.poll();
        while (lines.pop(line)) {
            if (!line.empty()) {
                on_line(line);
            }
            did_work = true;
        }
        examples::loop::manage_idle_spins(did_work, idle_spins);
    }
    client.disconnect();
}

// -----------------------------------------------------------------------------
// chat
// -----------------------------------------------------------------------------
int run_chat(const examples::cli::Params& params) {
    Chat chat(params.channel_config(), client::credentials::fixed(params.token), params.project_id);
    attach_lifecycle(chat);

    std::vector<Chat::Unsubscribe> subs;
    subs.push_back(chat.on_new_message([](const cs::chat::Message& m) {
        std::cout << " -> " << m << std::endl;
    }));
    subs.push_back(chat.on_typing([](const cs::chat::Typing& t) {
        std::cout << " -> " << t.user_name << (t.is_typing ? " is typing..." : " stopped typing") << std::endl;
    }));
    subs.push_back(chat.on_message_edited([](const cs::chat::MessageEdited& e) {
        std::cout << " -> [EDITED] " << e.message_id << ": " << e.new_content << std::endl;
    }));
    subs.push_back(chat.on_message_deleted([](const cs::chat::MessageDeleted& d) {
        std::cout << " -> [DELETED] " << d.message_id << std::endl;
    }));
    subs.push_back(chat.on_presence([](const cs::chat::Presence& p) {
        std::cout << " -> " << p.user_id << (p.joined ? " joined" : " left")
                  << " (" << p.online_users.size() << " online)" << std::endl;
    }));
    subs.push_back(chat.on_server_error([](const cs::ErrorNotice& n) {
        std::cout << " -> " << n << std::endl;
    }));

    (void)chat.connect();

    run_loop(chat, [&](const std::string& line) {
        if (line == "/read") {
            (void)chat.mark_read();
        }
        else if (line == "/typing") {
            (void)chat.send_typing(true);
        }
        else if (!chat.send_message(line)) {
            std::cout << "[cardwire] Not connected, message dropped" << std::endl;
        }
    });
    return 0;
}

// -----------------------------------------------------------------------------
// dm
// -----------------------------------------------------------------------------
int run_direct(const examples::cli::Params& params) {
    Direct dm(params.channel_config(), client::credentials::fixed(params.token));
    attach_lifecycle(dm);

    std::vector<Direct::Unsubscribe> subs;
    subs.push_back(dm.on_new_message([](const cs::direct::Message& m) {
        std::cout << " -> " << m << std::endl;
    }));
    subs.push_back(dm.on_typing([](const cs::direct::Typing& t) {
        std::cout << " -> [" << t.conversation_id << "] " << t.user_name
                  << (t.is_typing ? " is typing..." : " stopped typing") << std::endl;
    }));
    subs.push_back(dm.on_message_edited([](const cs::direct::MessageEdited& e) {
        std::cout << " -> [EDITED] " << e.message_id << ": " << e.content << std::endl;
    }));
    subs.push_back(dm.on_message_deleted([](const cs::direct::MessageDeleted& d) {
        std::cout << " -> [DELETED] " << d.message_id << std::endl;
    }));
    subs.push_back(dm.on_message_hidden([](const cs::direct::MessageHidden& h) {
        std::cout << " -> [HIDDEN] " << h.message_id << std::endl;
    }));
    subs.push_back(dm.on_read_receipt([](const cs::direct::ReadReceipt& r) {
        std::cout << " -> [READ] " << r.conversation_id << " by " << r.user_id << std::endl;
    }));

    (void)dm.connect();

    run_loop(dm, [&](const std::string& line) {
        if (params.conversation_id.empty()) {
            std::cout << "[cardwire] No conversation selected (--conversation)" << std::endl;
            return;
        }
        if (line == "/read") {
            (void)dm.mark_read(params.conversation_id);
        }
        else if (!dm.send_message(params.conversation_id, line)) {
            std::cout << "[cardwire] Not connected, message dropped" << std::endl;
        }
    });
    return 0;
}

// -----------------------------------------------------------------------------
// generate
// -----------------------------------------------------------------------------
int run_generate(const examples::cli::Params& params) {
    Generation gen(params.generation_config(), client::credentials::fixed(params.token));
    attach_lifecycle(gen);

    gen.on_stream([](const std::string& buffer) {
        std::cout << "\r -> " << buffer << std::flush;
    });
    gen.on_finished([](client::StreamPhase phase) {
        std::cout << "\n[cardwire] Generation " << (phase == client::StreamPhase::Committed ? "committed" : "rolled back") << std::endl;
    });
    gen.on_content([](const std::string& content) {
        std::cout << "[cardwire] Content: " << content << std::endl;
    });
    gen.on_tags_loading([](bool loading) {
        if (loading) {
            std::cout << "[cardwire] Requesting tags..." << std::endl;
        }
    });
    gen.on_tags([](const std::vector<cs::stream::Tag>& tags) {
        std::cout << " -> Tags:";
        for (const auto& t : tags) {
            std::cout << " " << t;
        }
        std::cout << std::endl;
    });

    gen.set_content(params.initial_content);
    (void)gen.connect(params.card_id, params.owner_id);

    run_loop(gen, [&](const std::string& line) {
        if (line == "/gen") {
            const auto result = gen.generate();
            if (result != client::GenerateResult::Started) {
                std::cout << "[cardwire] Generation not started: " << client::to_string(result) << std::endl;
            }
        }
        else if (line == "/cancel") {
            if (!gen.cancel()) {
                std::cout << "[cardwire] Nothing to cancel" << std::endl;
            }
        }
        else if (line == "/tags") {
            (void)gen.suggest_tags(gen.content());
        }
        else if (!gen.edit(line)) {
            std::cout << "[cardwire] Edit rejected" << std::endl;
        }
    });
    return 0;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv);
    params.dump("=== cardwire ===", std::cout);

    lcr::log::Logger::instance().enable_color(true);
    std::signal(SIGINT, on_signal);

    switch (params.command) {
    case examples::cli::Command::Chat:
        return run_chat(params);
    case examples::cli::Command::Direct:
        return run_direct(params);
    case examples::cli::Command::Generate:
        return run_generate(params);
    }
    return 1;
}
