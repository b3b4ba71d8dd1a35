/*
===============================================================================
 protocol::Dispatcher - Unit Tests
===============================================================================

Scope:
------
Routing of inbound text frames by their "type" tag.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

D1. Frames reach every handler of their type, in registration order
D2. pong is intercepted and never delivered
D3. Unknown types, invalid JSON and missing tags are dropped
D4. Unsubscribe is idempotent, safe inside a handler and after destruction
D5. A throwing handler does not stop the others
D6. Typed subscriptions skip frames failing validation

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include "cardwire/core/protocol/dispatcher.hpp"
#include "cardwire/core/protocol/parser/chat.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace cardwire::core::protocol;
using cardwire::test::ManualClock;
using namespace std::chrono_literals;

using DispatcherUnderTest = Dispatcher<ManualClock>;


void test_routing_by_type() {
    std::cout << "[TEST] Group D1: routing by type\n";

    DispatcherUnderTest d;
    std::vector<std::string> log;

    auto u1 = d.on("typing", [&](const Frame& f) { log.push_back("a:" + std::string(f.type)); });
    auto u2 = d.on("typing", [&](const Frame&)   { log.push_back("b"); });
    auto u3 = d.on("new_message", [&](const Frame&) { log.push_back("m"); });

    TEST_CHECK(d.dispatch(R"({"type":"typing","user_id":"u1","is_typing":true})") == parser::Result::Delivered);
    TEST_CHECK(log.size() == 2);
    TEST_CHECK(log[0] == "a:typing");
    TEST_CHECK(log[1] == "b");

    TEST_CHECK(d.handler_count("typing") == 2);
    TEST_CHECK(d.frames_received() == 1);

    std::cout << "[TEST] OK\n";
}

void test_pong_intercepted() {
    std::cout << "[TEST] Group D2: pong is never delivered\n";

    ManualClock::reset();
    DispatcherUnderTest d;
    int delivered = 0;
    auto u = d.on("pong", [&](const Frame&) { ++delivered; });

    ManualClock::advance(5000ms);
    TEST_CHECK(d.dispatch(R"({"type":"pong"})") == parser::Result::Ignored);
    TEST_CHECK(delivered == 0);
    TEST_CHECK(d.pongs_received() == 1);
    TEST_CHECK(d.last_pong() == ManualClock::time_point{5000ms});

    std::cout << "[TEST] OK\n";
}

void test_dropped_frames() {
    std::cout << "[TEST] Group D3: unknown, invalid and untagged frames are dropped\n";

    DispatcherUnderTest d;
    int delivered = 0;
    auto u = d.on("typing", [&](const Frame&) { ++delivered; });

    TEST_CHECK(d.dispatch(R"({"type":"mystery","x":1})") == parser::Result::Unhandled);
    TEST_CHECK(d.dispatch("not json") == parser::Result::InvalidJson);
    TEST_CHECK(d.dispatch(R"({"user_id":"u1"})") == parser::Result::InvalidSchema);
    TEST_CHECK(d.dispatch(R"({"type":42})") == parser::Result::InvalidSchema);
    TEST_CHECK(d.dispatch(R"({"type":""})") == parser::Result::InvalidValue);
    TEST_CHECK(d.dispatch(R"(["typing"])") == parser::Result::InvalidSchema);

    TEST_CHECK(delivered == 0);
    TEST_CHECK(d.unhandled_frames() == 1);
    TEST_CHECK(d.dropped_frames() == 5);
    TEST_CHECK(d.frames_received() == 6);

    std::cout << "[TEST] OK\n";
}

void test_unsubscribe() {
    std::cout << "[TEST] Group D4: unsubscribe semantics\n";

    const std::string frame = R"({"type":"typing","user_id":"u1","is_typing":false})";

    {
        DispatcherUnderTest d;
        int a = 0;
        int b = 0;
        auto ua = d.on("typing", [&](const Frame&) { ++a; });
        auto ub = d.on("typing", [&](const Frame&) { ++b; });

        ua();
        ua();
        (void)d.dispatch(frame);
        TEST_CHECK(a == 0);
        TEST_CHECK(b == 1);

        ub();
        TEST_CHECK(d.handler_count("typing") == 0);
        TEST_CHECK(d.dispatch(frame) == parser::Result::Unhandled);
    }

    {
        // Removing itself and a later handler mid-dispatch: the frame still
        // reaches the snapshot, the next frame does not
        DispatcherUnderTest d;
        int self_calls = 0;
        int other_calls = 0;
        DispatcherUnderTest::Unsubscribe self;
        DispatcherUnderTest::Unsubscribe other;
        self = d.on("typing", [&](const Frame&) {
            ++self_calls;
            self();
            other();
        });
        other = d.on("typing", [&](const Frame&) { ++other_calls; });

        (void)d.dispatch(frame);
        (void)d.dispatch(frame);
        TEST_CHECK(self_calls == 1);
        TEST_CHECK(other_calls == 1);
    }

    {
        DispatcherUnderTest::Unsubscribe dangling;
        {
            auto d = std::make_unique<DispatcherUnderTest>();
            dangling = d->on("typing", [](const Frame&) {});
        }
        dangling();
    }

    std::cout << "[TEST] OK\n";
}

void test_handler_isolation() {
    std::cout << "[TEST] Group D5: a throwing handler is contained\n";

    DispatcherUnderTest d;
    int after = 0;
    auto u1 = d.on("typing", [](const Frame&) { throw std::runtime_error("handler failure"); });
    auto u2 = d.on("typing", [](const Frame&) { throw 7; });
    auto u3 = d.on("typing", [&](const Frame&) { ++after; });

    TEST_CHECK(d.dispatch(R"({"type":"typing","user_id":"u1","is_typing":true})") == parser::Result::Delivered);
    TEST_CHECK(after == 1);
    TEST_CHECK(d.handler_failures() == 2);

    std::cout << "[TEST] OK\n";
}

void test_typed_subscription() {
    std::cout << "[TEST] Group D6: typed subscriptions validate first\n";

    namespace cs = cardwire::core::protocol::schema::chat;
    DispatcherUnderTest d;
    std::vector<std::string> deleted;
    auto u = d.on_parsed<cs::MessageDeleted>("message_deleted", &parser::chat::message_deleted::parse,
        [&](const cs::MessageDeleted& m) { deleted.push_back(m.message_id); });

    (void)d.dispatch(R"({"type":"message_deleted","message_id":"m-1"})");
    (void)d.dispatch(R"({"type":"message_deleted","message_id":""})");
    (void)d.dispatch(R"({"type":"message_deleted"})");

    TEST_CHECK(deleted.size() == 1);
    TEST_CHECK(deleted[0] == "m-1");
    TEST_CHECK(d.schema_failures() == 2);

    d.clear();
    (void)d.dispatch(R"({"type":"message_deleted","message_id":"m-2"})");
    TEST_CHECK(deleted.size() == 1);
    u();

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_routing_by_type();
    test_pong_intercepted();
    test_dropped_frames();
    test_unsubscribe();
    test_handler_isolation();
    test_typed_subscription();

    std::cout << "\n[DISPATCHER TESTS PASSED]\n";
    return 0;
}
