/*
===============================================================================
 transport::parse_url & error classification - Unit Tests
===============================================================================

Scope:
------
URL decomposition for the WebSocket transports and the mapping of close codes
to transport errors that drives the retry decision.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

U1. ws:// and wss:// default ports, explicit ports, path + query kept
U2. Malformed URLs are rejected
E1. Close codes map to semantic errors
E2. Only transient failures are retryable

===============================================================================
*/

#include <iostream>

#include "cardwire/core/transport/parse_url.hpp"
#include "cardwire/core/transport/error.hpp"
#include "common/test_check.hpp"

using namespace cardwire::core::transport;


void test_parse_valid_urls() {
    std::cout << "[TEST] Group U1: valid ws / wss URLs\n";

    ParsedUrl u;
    TEST_CHECK(parse_url("wss://cards.example.com/api/ws/dm?token=abc", u) == Error::None);
    TEST_CHECK(u.secure);
    TEST_CHECK(u.host == "cards.example.com");
    TEST_CHECK(u.port == "443");
    TEST_CHECK(u.path == "/api/ws/dm?token=abc");

    TEST_CHECK(parse_url("ws://localhost:8000/api/ws/chat/p1?token=t", u) == Error::None);
    TEST_CHECK(!u.secure);
    TEST_CHECK(u.host == "localhost");
    TEST_CHECK(u.port == "8000");
    TEST_CHECK(u.path == "/api/ws/chat/p1?token=t");

    TEST_CHECK(parse_url("ws://localhost", u) == Error::None);
    TEST_CHECK(u.port == "80");
    TEST_CHECK(u.path == "/");

    // Query directly after the host
    TEST_CHECK(parse_url("ws://localhost?token=x", u) == Error::None);
    TEST_CHECK(u.path == "/?token=x");

    std::cout << "[TEST] OK\n";
}

void test_parse_invalid_urls() {
    std::cout << "[TEST] Group U2: malformed URLs are rejected\n";

    ParsedUrl u;
    TEST_CHECK(parse_url("", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("http://localhost/api", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://:8000/x", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:abc/x", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:0/x", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:70000/x", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host/a b", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host/a#frag", u) == Error::InvalidUrl);

    std::cout << "[TEST] OK\n";
}

void test_close_code_mapping() {
    std::cout << "[TEST] Group E1: close codes map to errors\n";

    TEST_CHECK(from_close_code(close_code::Normal) == Error::None);
    TEST_CHECK(from_close_code(close_code::Abnormal) == Error::ConnectionFailed);
    TEST_CHECK(from_close_code(close_code::None) == Error::ConnectionFailed);
    TEST_CHECK(from_close_code(close_code::ProtocolError) == Error::ProtocolError);
    TEST_CHECK(from_close_code(close_code::GoingAway) == Error::RemoteClosed);
    TEST_CHECK(from_close_code(close_code::InvalidResource) == Error::InvalidResource);
    TEST_CHECK(from_close_code(close_code::Unauthorized) == Error::Unauthorized);
    TEST_CHECK(from_close_code(close_code::AccessDenied) == Error::AccessDenied);
    TEST_CHECK(from_close_code(1011) == Error::RemoteClosed);

    std::cout << "[TEST] OK\n";
}

void test_retryable_errors() {
    std::cout << "[TEST] Group E2: only transient failures are retryable\n";

    TEST_CHECK(is_retryable(Error::ConnectionFailed));
    TEST_CHECK(is_retryable(Error::Timeout));
    TEST_CHECK(is_retryable(Error::HandshakeFailed));
    TEST_CHECK(is_retryable(Error::RemoteClosed));
    TEST_CHECK(is_retryable(Error::TransportFailure));

    TEST_CHECK(!is_retryable(Error::None));
    TEST_CHECK(!is_retryable(Error::Unauthorized));
    TEST_CHECK(!is_retryable(Error::AccessDenied));
    TEST_CHECK(!is_retryable(Error::InvalidResource));
    TEST_CHECK(!is_retryable(Error::MissingCredential));
    TEST_CHECK(!is_retryable(Error::InvalidUrl));
    TEST_CHECK(!is_retryable(Error::Cancelled));

    TEST_CHECK(to_string(Error::AccessDenied) == "AccessDenied");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_parse_valid_urls();
    test_parse_invalid_urls();
    test_close_code_mapping();
    test_retryable_errors();

    std::cout << "\n[PARSE URL / ERROR TESTS PASSED]\n";
    return 0;
}
