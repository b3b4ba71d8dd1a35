/*
===============================================================================
 client::StreamAccumulator & client::Debouncer - Unit Tests
===============================================================================

Scope:
------
Commit / rollback bookkeeping of one generation session, and the trailing-edge
timer behind debounced tag requests.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

S1. Chunks concatenate in order; commit yields the final text
S2. Rollback yields the snapshot byte-for-byte
S3. Appends outside Streaming are ignored; restart clears the buffer
S4. Sessions are numbered; reset returns to Idle
T1. Debouncer fires once, delay after the last touch
T2. cancel() disarms

===============================================================================
*/

#include <iostream>
#include <string>
#include <chrono>

#include "cardwire/client/stream_accumulator.hpp"
#include "cardwire/client/debouncer.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace cardwire::client;
using cardwire::test::ManualClock;
using namespace std::chrono_literals;


void test_commit() {
    std::cout << "[TEST] Group S1: chunks then commit\n";

    StreamAccumulator acc;
    TEST_CHECK(acc.phase() == StreamPhase::Idle);

    acc.begin("draft");
    TEST_CHECK(acc.streaming());
    TEST_CHECK(acc.append("Hello"));
    TEST_CHECK(acc.append(" world"));
    TEST_CHECK(acc.buffer() == "Hello world");

    const std::string& final_text = acc.commit("Hello world!");
    TEST_CHECK(final_text == "Hello world!");
    TEST_CHECK(acc.phase() == StreamPhase::Committed);
    TEST_CHECK(!acc.streaming());

    std::cout << "[TEST] OK\n";
}

void test_rollback() {
    std::cout << "[TEST] Group S2: rollback restores the snapshot\n";

    const std::string original = "Old bio\twith \"quotes\" and caf\xC3\xA9\n";

    StreamAccumulator acc;
    acc.begin(original);
    TEST_CHECK(acc.append("partial"));

    const std::string& restored = acc.rollback();
    TEST_CHECK(restored == original);
    TEST_CHECK(restored.size() == original.size());
    TEST_CHECK(acc.phase() == StreamPhase::RolledBack);
    TEST_CHECK(acc.buffer().empty());

    std::cout << "[TEST] OK\n";
}

void test_append_outside_session() {
    std::cout << "[TEST] Group S3: appends need an active session\n";

    StreamAccumulator acc;
    TEST_CHECK(!acc.append("stray"));
    TEST_CHECK(acc.buffer().empty());

    acc.begin("x");
    TEST_CHECK(acc.append("abc"));
    acc.restart();
    TEST_CHECK(acc.buffer().empty());
    TEST_CHECK(acc.append("def"));

    (void)acc.commit("def");
    TEST_CHECK(!acc.append("late"));
    TEST_CHECK(acc.buffer() == "def");

    // restart outside Streaming keeps the committed text
    acc.restart();
    TEST_CHECK(acc.buffer() == "def");

    std::cout << "[TEST] OK\n";
}

void test_sessions() {
    std::cout << "[TEST] Group S4: session numbering and reset\n";

    StreamAccumulator acc;
    TEST_CHECK(acc.session() == 0);
    TEST_CHECK(acc.begin("a") == 1);
    (void)acc.rollback();
    TEST_CHECK(acc.begin("b") == 2);
    TEST_CHECK(acc.snapshot() == "b");

    acc.reset();
    TEST_CHECK(acc.phase() == StreamPhase::Idle);
    TEST_CHECK(acc.snapshot().empty());
    TEST_CHECK(acc.session() == 2);

    TEST_CHECK(to_string(StreamPhase::RolledBack) == "RolledBack");

    std::cout << "[TEST] OK\n";
}

void test_debounce_coalesces() {
    std::cout << "[TEST] Group T1: debouncer fires once after the last touch\n";

    ManualClock::reset();
    Debouncer<ManualClock::time_point> d(1500ms);
    TEST_CHECK(!d.armed());
    TEST_CHECK(!d.due(ManualClock::now()));

    d.touch(ManualClock::now());
    ManualClock::advance(1000ms);
    d.touch(ManualClock::now());
    ManualClock::advance(1000ms);
    d.touch(ManualClock::now());

    ManualClock::advance(1499ms);
    TEST_CHECK(!d.due(ManualClock::now()));

    ManualClock::advance(1ms);
    TEST_CHECK(d.due(ManualClock::now()));
    TEST_CHECK(!d.due(ManualClock::now()));
    TEST_CHECK(!d.armed());

    std::cout << "[TEST] OK\n";
}

void test_debounce_cancel() {
    std::cout << "[TEST] Group T2: cancel disarms\n";

    ManualClock::reset();
    Debouncer<ManualClock::time_point> d(500ms);
    d.touch(ManualClock::now());
    TEST_CHECK(d.deadline() == ManualClock::time_point{500ms});
    d.cancel();
    ManualClock::advance(10000ms);
    TEST_CHECK(!d.due(ManualClock::now()));

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_commit();
    test_rollback();
    test_append_outside_session();
    test_sessions();
    test_debounce_coalesces();
    test_debounce_cancel();

    std::cout << "\n[STREAM ACCUMULATOR / DEBOUNCER TESTS PASSED]\n";
    return 0;
}
