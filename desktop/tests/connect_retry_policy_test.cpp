#include "connect_retry_policy.h"

#include <iostream>

using namespace peerlink;
using ms = std::chrono::milliseconds;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

bool test_first_attempt_immediate() {
    std::cout << "Testing first attempt..." << std::endl;

    ConnectRetryPolicy policy(5, ms(1000));
    const auto now = ConnectRetryPolicy::Clock::now();
    auto v = policy.evaluate("peer", now);
    TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::INVITE_NOW, "Unknown peer must be invited now");
    TEST_ASSERT(v.attempts == 0, "No attempts recorded yet");
    TEST_ASSERT(policy.record_attempt("peer", now) == 1, "First attempt must be numbered 1");

    std::cout << "First attempt Passed!" << std::endl;
    return true;
}

bool test_backoff_window() {
    std::cout << "Testing backoff window..." << std::endl;

    ConnectRetryPolicy policy(5, ms(1000));
    const auto t0 = ConnectRetryPolicy::Clock::now();
    policy.record_attempt("peer", t0);

    auto v = policy.evaluate("peer", t0 + ms(400));
    TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::DEFER, "Inside the window the invite waits");
    TEST_ASSERT(v.wait == ms(600), "Wait must be what is left of the window");

    v = policy.evaluate("peer", t0 + ms(1000));
    TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::INVITE_NOW, "Window over, invite now");

    policy.record_attempt("peer", t0 + ms(1000));
    v = policy.evaluate("peer", t0 + ms(2500));
    TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::DEFER, "Second window is twice as long");
    TEST_ASSERT(v.wait == ms(500), "Second window ends 2s after the attempt");

    TEST_ASSERT(policy.backoff_for(0) == ms(0), "No wait before any attempt");
    TEST_ASSERT(policy.backoff_for(1) == ms(1000), "1x base after one attempt");
    TEST_ASSERT(policy.backoff_for(4) == ms(8000), "8x base after four attempts");

    std::cout << "Backoff window Passed!" << std::endl;
    return true;
}

bool test_cap() {
    std::cout << "Testing attempt cap..." << std::endl;

    ConnectRetryPolicy policy(5, ms(10));
    auto t = ConnectRetryPolicy::Clock::now();
    for (int i = 0; i < 5; ++i) {
        auto v = policy.evaluate("peer", t);
        TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::INVITE_NOW, "Attempt " << (i + 1) << " allowed");
        policy.record_attempt("peer", t);
        t += ms(10000);
    }

    auto v = policy.evaluate("peer", t + ms(3600 * 1000));
    TEST_ASSERT(v.decision == ConnectRetryPolicy::Decision::CAPPED, "Sixth attempt must be refused");
    TEST_ASSERT(v.attempts == 5, "Cap verdict reports the attempt count");
    TEST_ASSERT(policy.is_capped("peer"), "Peer must be capped");
    TEST_ASSERT(!policy.is_capped("other"), "Other peers are unaffected");

    policy.clear("peer");
    TEST_ASSERT(policy.attempts("peer") == 0, "Clear must reset the record");
    TEST_ASSERT(policy.evaluate("peer", t).decision == ConnectRetryPolicy::Decision::INVITE_NOW,
                "Cleared peer may be invited again");

    std::cout << "Attempt cap Passed!" << std::endl;
    return true;
}

bool test_clear_all() {
    std::cout << "Testing clear_all..." << std::endl;

    ConnectRetryPolicy policy(5, ms(10));
    const auto t = ConnectRetryPolicy::Clock::now();
    policy.record_attempt("a", t);
    policy.record_attempt("b", t);
    TEST_ASSERT(policy.tracked_peers().size() == 2, "Two records expected");

    policy.clear_all();
    TEST_ASSERT(policy.tracked_peers().empty(), "All records must be gone");

    ConnectRetryPolicy clamped(0, ms(10));
    TEST_ASSERT(clamped.max_attempts() == 1, "Cap is at least one attempt");

    std::cout << "clear_all Passed!" << std::endl;
    return true;
}

int main() {
    std::cout << "Running ConnectRetryPolicy Tests..." << std::endl;

    test_first_attempt_immediate();
    test_backoff_window();
    test_cap();
    test_clear_all();

    if (tests_failed == 0) {
        std::cout << "ALL CONNECT RETRY POLICY TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
