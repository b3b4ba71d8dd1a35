/*
===============================================================================
 client::ChatClient - Unit Tests
===============================================================================

Scope:
------
Project chat channel over MockWebSocket and ManualClock: URL and credential
handling, outbound frames, typed subscriptions and lifecycle callbacks.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

C1. connect() targets /api/ws/chat/{project}?token={token}
C2. Sends produce the documented frames; nothing is sent unless Open
C3. Typed subscriptions, unsubscribe, presence
C4. pong and unknown types never reach subscribers
C5. Missing token: no transport, MissingCredential, no retry
C6. Token re-read on every reconnect attempt
C7. Lifecycle callbacks across a drop and a reconnect
C8. disconnect() is idempotent, silent and sends nothing
C9. Server error frames and throwing subscribers

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

#include "cardwire/client/chat.hpp"
#include "common/harness/channel.hpp"
#include "common/json_helpers.hpp"

using namespace cardwire::client;
using namespace cardwire::client::test;
using namespace std::chrono_literals;
using cardwire::core::transport::Error;
using cardwire::core::transport::State;
using cardwire::core::transport::DisconnectReason;
namespace chat_schema = cardwire::core::protocol::schema::chat;

using ChatUnderTest = ChatClient<harness::MockWS, harness::Clock>;


void test_connect_url() {
    std::cout << "[TEST] Group C1: chat URL\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    harness::open(chat);
    TEST_CHECK(harness::MockWS::last_url().host == "localhost");
    TEST_CHECK(harness::MockWS::last_url().port == "8000");
    TEST_CHECK(harness::MockWS::last_url().path == "/api/ws/chat/p-1?token=tok-123");
    TEST_CHECK(chat.project_id() == "p-1");

    std::cout << "[TEST] OK\n";
}

void test_outbound_frames() {
    std::cout << "[TEST] Group C2: outbound frames\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    // Not connected: refused locally, nothing reaches a transport
    TEST_CHECK(!chat.send_message("early"));
    TEST_CHECK(!chat.mark_read());
    TEST_CHECK(harness::MockWS::sent().empty());

    harness::open(chat);

    TEST_CHECK(chat.send_message("hello"));
    TEST_CHECK(chat.send_message("re", std::string("m-1")));
    TEST_CHECK(chat.send_typing(true));
    TEST_CHECK(chat.edit_message("m-1", "edited"));
    TEST_CHECK(chat.delete_message("m-1"));
    TEST_CHECK(chat.mark_read());

    const auto& sent = harness::MockWS::sent();
    TEST_CHECK(sent.size() == 6);
    TEST_CHECK(sent[0] == R"({"action":"send_message","content":"hello"})");
    TEST_CHECK(sent[1] == R"({"action":"send_message","content":"re","reply_to_id":"m-1"})");
    TEST_CHECK(sent[2] == R"({"action":"typing","is_typing":true})");
    TEST_CHECK(sent[3] == R"({"action":"edit_message","message_id":"m-1","content":"edited"})");
    TEST_CHECK(sent[4] == R"({"action":"delete_message","message_id":"m-1"})");
    TEST_CHECK(sent[5] == R"({"action":"mark_read"})");

    std::cout << "[TEST] OK\n";
}

void test_subscriptions() {
    std::cout << "[TEST] Group C3: typed subscriptions\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");
    harness::open(chat);

    std::vector<std::string> messages;
    std::vector<std::string> edits;
    std::vector<std::string> deletes;
    std::vector<std::string> presence;
    int typing = 0;

    auto u_msg = chat.on_new_message([&](const chat_schema::Message& m) { messages.push_back(m.id + ":" + m.content); });
    auto u_edit = chat.on_message_edited([&](const chat_schema::MessageEdited& e) { edits.push_back(e.new_content); });
    auto u_del = chat.on_message_deleted([&](const chat_schema::MessageDeleted& d) { deletes.push_back(d.message_id); });
    auto u_typing = chat.on_typing([&](const chat_schema::Typing& t) { typing += t.is_typing ? 1 : 0; });
    auto u_presence = chat.on_presence([&](const chat_schema::Presence& p) {
        presence.push_back((p.joined ? "+" : "-") + p.user_id);
    });

    harness::deliver(chat, json::frame::chat::new_message("m-1", "hi"));
    harness::deliver(chat, json::frame::chat::message_edited("m-1", "hi!"));
    harness::deliver(chat, json::frame::chat::message_deleted("m-1"));
    harness::deliver(chat, json::frame::chat::typing("u2", true));
    harness::deliver(chat, json::frame::chat::user_joined("u3"));
    harness::deliver(chat, json::frame::chat::user_left("u3"));

    TEST_CHECK(messages.size() == 1);
    TEST_CHECK(messages[0] == "m-1:hi");
    TEST_CHECK(edits.size() == 1 && edits[0] == "hi!");
    TEST_CHECK(deletes.size() == 1 && deletes[0] == "m-1");
    TEST_CHECK(typing == 1);
    TEST_CHECK(presence.size() == 2);
    TEST_CHECK(presence[0] == "+u3");
    TEST_CHECK(presence[1] == "-u3");

    // Frames failing validation are not delivered
    harness::deliver(chat, R"({"type":"new_message","message":{"id":"m-2"}})");
    TEST_CHECK(messages.size() == 1);

    u_msg();
    u_presence();
    harness::deliver(chat, json::frame::chat::new_message("m-3", "after"));
    harness::deliver(chat, json::frame::chat::user_joined("u4"));
    TEST_CHECK(messages.size() == 1);
    TEST_CHECK(presence.size() == 2);

    std::cout << "[TEST] OK\n";
}

void test_pong_and_unknown() {
    std::cout << "[TEST] Group C4: pong and unknown types are not delivered\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");
    harness::open(chat);

    int pongs = 0;
    int any = 0;
    auto u_pong = chat.on("pong", [&](const cardwire::core::protocol::Frame&) { ++pongs; });
    auto u_msg = chat.on_new_message([&](const chat_schema::Message&) { ++any; });

    harness::deliver(chat, json::frame::pong());
    harness::deliver(chat, R"({"type":"reaction_added","emoji":"+1"})");
    harness::deliver(chat, "garbage");

    TEST_CHECK(pongs == 0);
    TEST_CHECK(any == 0);
    TEST_CHECK(chat.dispatcher().pongs_received() == 1);
    TEST_CHECK(chat.dispatcher().unhandled_frames() == 1);
    TEST_CHECK(chat.dispatcher().dropped_frames() == 1);
    TEST_CHECK(chat.is_connected());

    std::cout << "[TEST] OK\n";
}

void test_missing_token() {
    std::cout << "[TEST] Group C5: missing token\n";

    harness::reset_environment();
    credentials::MemoryStorage store;
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    std::vector<Error> errors;
    int disconnected = 0;
    DisconnectReason reason = DisconnectReason::None;
    chat.on_error([&](Error e) { errors.push_back(e); });
    chat.on_disconnected([&](DisconnectReason r, Error) { ++disconnected; reason = r; });

    auto pending = chat.connect();
    TEST_CHECK(pending.is_rejected());
    TEST_CHECK(pending.error() == Error::MissingCredential);
    TEST_CHECK(harness::MockWS::constructed() == 0);

    harness::advance(chat, 10000ms);
    TEST_CHECK(errors.size() == 1);
    TEST_CHECK(errors[0] == Error::MissingCredential);
    TEST_CHECK(disconnected == 1);
    TEST_CHECK(reason == DisconnectReason::Refused);
    TEST_CHECK(harness::MockWS::connect_calls() == 0);

    // An empty token counts as missing
    store.set("");
    auto again = chat.connect();
    TEST_CHECK(again.is_rejected());
    TEST_CHECK(again.error() == Error::MissingCredential);

    std::cout << "[TEST] OK\n";
}

void test_token_reread() {
    std::cout << "[TEST] Group C6: token re-read on reconnect\n";

    harness::reset_environment();
    credentials::MemoryStorage store("t1");
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");
    harness::open(chat);
    TEST_CHECK(harness::MockWS::last_url().path == "/api/ws/chat/p-1?token=t1");

    store.set("t2");
    harness::ws().emit_drop();
    chat.poll();
    TEST_CHECK(chat.state() == State::WaitingReconnect);

    harness::advance(chat, 1000ms);
    TEST_CHECK(harness::MockWS::last_url().path == "/api/ws/chat/p-1?token=t2");

    std::cout << "[TEST] OK\n";
}

void test_lifecycle_callbacks() {
    std::cout << "[TEST] Group C7: lifecycle callbacks\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    int connected = 0;
    int disconnected = 0;
    std::vector<Error> errors;
    std::vector<std::pair<int, std::chrono::milliseconds>> retries;
    chat.on_connected([&] { ++connected; });
    chat.on_disconnected([&](DisconnectReason, Error) { ++disconnected; });
    chat.on_error([&](Error e) { errors.push_back(e); });
    chat.on_reconnecting([&](int attempt, std::chrono::milliseconds delay) { retries.emplace_back(attempt, delay); });

    harness::open(chat);
    TEST_CHECK(connected == 1);

    harness::ws().emit_drop(Error::ConnectionFailed);
    chat.poll();
    TEST_CHECK(errors.size() == 1);
    TEST_CHECK(errors[0] == Error::ConnectionFailed);
    TEST_CHECK(retries.size() == 1);
    TEST_CHECK(retries[0].first == 1);
    TEST_CHECK(retries[0].second == 1000ms);
    TEST_CHECK(!chat.is_connected());

    harness::advance(chat, 1000ms);
    chat.poll();
    TEST_CHECK(connected == 2);
    TEST_CHECK(chat.is_connected());

    // Server refusal ends the session
    harness::ws().emit_close(cardwire::core::transport::close_code::AccessDenied);
    chat.poll();
    TEST_CHECK(disconnected == 1);
    TEST_CHECK(errors.back() == Error::AccessDenied);
    TEST_CHECK(retries.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_disconnect_idempotent() {
    std::cout << "[TEST] Group C8: disconnect is idempotent\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    int disconnected = 0;
    chat.on_disconnected([&](DisconnectReason, Error) { ++disconnected; });

    // Before any connect
    chat.disconnect();

    harness::open(chat);
    chat.disconnect();
    chat.disconnect();
    harness::advance(chat, 60000ms);

    TEST_CHECK(chat.state() == State::Disconnected);
    TEST_CHECK(disconnected == 0);
    TEST_CHECK(harness::MockWS::sent().empty());
    TEST_CHECK(harness::MockWS::close_calls() == 1);
    TEST_CHECK(!chat.send_message("after"));

    // A new connect works after a disconnect
    harness::open(chat);
    TEST_CHECK(harness::MockWS::constructed() == 2);

    std::cout << "[TEST] OK\n";
}

void test_server_errors_and_throwing_subscribers() {
    std::cout << "[TEST] Group C9: server errors and throwing subscribers\n";

    harness::reset_environment();
    credentials::MemoryStorage store(harness::TOKEN);
    ChatUnderTest chat(harness::channel_config(), store.provider(), "p-1");

    chat.on_connected([] { throw std::runtime_error("observer failure"); });
    harness::open(chat);

    std::vector<std::string> codes;
    auto u_err = chat.on_server_error([&](const cardwire::core::protocol::schema::ErrorNotice& n) {
        codes.push_back(n.code.value_or("-"));
    });
    int delivered = 0;
    auto u1 = chat.on_new_message([](const chat_schema::Message&) { throw std::runtime_error("subscriber failure"); });
    auto u2 = chat.on_new_message([&](const chat_schema::Message&) { ++delivered; });

    harness::deliver(chat, json::frame::error("Slow down", "rate_limit"));
    harness::deliver(chat, json::frame::error("Content is required"));
    harness::deliver(chat, json::frame::chat::new_message("m-1", "hi"));

    TEST_CHECK(codes.size() == 2);
    TEST_CHECK(codes[0] == "rate_limit");
    TEST_CHECK(codes[1] == "-");
    TEST_CHECK(delivered == 1);
    TEST_CHECK(chat.dispatcher().handler_failures() == 1);
    TEST_CHECK(chat.is_connected());

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_connect_url();
    test_outbound_frames();
    test_subscriptions();
    test_pong_and_unknown();
    test_missing_token();
    test_token_reread();
    test_lifecycle_callbacks();
    test_disconnect_idempotent();
    test_server_errors_and_throwing_subscribers();

    std::cout << "\n[CHAT CLIENT TESTS PASSED]\n";
    return 0;
}
