#include "coordinator_event_loop.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace peerlink;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

bool test_events_in_order() {
    std::cout << "Testing FIFO event handling..." << std::endl;

    std::mutex mu;
    std::vector<std::string> seen;
    CoordinatorEventLoop loop;
    loop.start([&](const CoordinatorEvent& ev) {
        if (auto* found = std::get_if<PeerFoundEvent>(&ev)) {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back(found->peer.id);
        }
    });

    for (int i = 0; i < 50; ++i) {
        loop.pushEvent(PeerFoundEvent{PeerIdentity(std::to_string(i), "p"), {}});
    }
    TEST_ASSERT(wait_until([&] {
                    std::lock_guard<std::mutex> lock(mu);
                    return seen.size() == 50;
                }),
                "All events must be handled");
    {
        std::lock_guard<std::mutex> lock(mu);
        for (int i = 0; i < 50; ++i) {
            TEST_ASSERT(seen[i] == std::to_string(i), "Events must keep push order");
        }
    }

    loop.stop();
    std::cout << "FIFO event handling Passed!" << std::endl;
    return true;
}

bool test_posted_tasks_run_on_loop_thread() {
    std::cout << "Testing posted tasks..." << std::endl;

    CoordinatorEventLoop loop;
    loop.start([](const CoordinatorEvent&) {});

    std::atomic<bool> on_loop{false};
    std::atomic<bool> ran{false};
    loop.post([&] {
        on_loop = loop.isLoopThread();
        ran = true;
    });
    TEST_ASSERT(wait_until([&] { return ran.load(); }), "Posted task must run");
    TEST_ASSERT(on_loop.load(), "Posted task must run on the loop thread");
    TEST_ASSERT(!loop.isLoopThread(), "Test thread is not the loop thread");

    loop.stop();
    std::cout << "Posted tasks Passed!" << std::endl;
    return true;
}

bool test_schedule_replace_and_cancel() {
    std::cout << "Testing scheduled tasks..." << std::endl;

    CoordinatorEventLoop loop;
    loop.start([](const CoordinatorEvent&) {});

    std::atomic<int> first{0};
    std::atomic<int> second{0};
    std::atomic<int> cancelled{0};

    loop.schedule("job", std::chrono::milliseconds(30), [&] { first++; });
    loop.schedule("job", std::chrono::milliseconds(30), [&] { second++; });
    loop.schedule("doomed", std::chrono::milliseconds(30), [&] { cancelled++; });
    TEST_ASSERT(loop.scheduledCount() == 2, "Same id must replace the earlier entry");
    TEST_ASSERT(loop.hasScheduledEvent("doomed"), "Entry must be visible before it fires");
    loop.cancel("doomed");
    TEST_ASSERT(!loop.hasScheduledEvent("doomed"), "Cancelled entry must be gone");

    TEST_ASSERT(wait_until([&] { return second.load() == 1; }), "Replacement must fire");
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    TEST_ASSERT(first.load() == 0, "Replaced task must not fire");
    TEST_ASSERT(cancelled.load() == 0, "Cancelled task must not fire");
    TEST_ASSERT(loop.scheduledCount() == 0, "Nothing left scheduled");

    loop.stop();
    std::cout << "Scheduled tasks Passed!" << std::endl;
    return true;
}

bool test_scheduled_events_fire_by_due_time() {
    std::cout << "Testing scheduled event ordering..." << std::endl;

    std::mutex mu;
    std::vector<TimerKind> fired;
    CoordinatorEventLoop loop;
    loop.start([&](const CoordinatorEvent& ev) {
        if (auto* tick = std::get_if<TimerTickEvent>(&ev)) {
            std::lock_guard<std::mutex> lock(mu);
            fired.push_back(tick->kind);
        }
    });

    const auto now = CoordinatorEventLoop::Clock::now();
    loop.addScheduledEvent("late", TimerTickEvent{TimerKind::QUALITY_CHECK}, now + std::chrono::milliseconds(60));
    loop.addScheduledEvent("early", TimerTickEvent{TimerKind::RECONNECT_SWEEP}, now + std::chrono::milliseconds(20));

    TEST_ASSERT(wait_until([&] {
                    std::lock_guard<std::mutex> lock(mu);
                    return fired.size() == 2;
                }),
                "Both timers must fire");
    {
        std::lock_guard<std::mutex> lock(mu);
        TEST_ASSERT(fired[0] == TimerKind::RECONNECT_SWEEP, "Earlier due time fires first");
        TEST_ASSERT(fired[1] == TimerKind::QUALITY_CHECK, "Later due time fires second");
    }

    loop.stop();
    std::cout << "Scheduled event ordering Passed!" << std::endl;
    return true;
}

bool test_handler_exception_contained() {
    std::cout << "Testing handler exceptions..." << std::endl;

    std::atomic<int> handled{0};
    CoordinatorEventLoop loop;
    loop.start([&](const CoordinatorEvent&) {
        handled++;
        throw std::runtime_error("boom");
    });

    loop.pushEvent(PeerLostEvent{PeerIdentity("x", "x")});
    loop.pushEvent(PeerLostEvent{PeerIdentity("y", "y")});
    TEST_ASSERT(wait_until([&] { return handled.load() == 2; }), "Loop must survive a throwing handler");
    TEST_ASSERT(loop.isRunning(), "Loop must still be running");

    loop.stop();
    std::cout << "Handler exceptions Passed!" << std::endl;
    return true;
}

bool test_stop_drops_pending_work() {
    std::cout << "Testing stop..." << std::endl;

    std::atomic<int> ran{0};
    CoordinatorEventLoop loop;
    loop.start([](const CoordinatorEvent&) {});
    loop.schedule("later", std::chrono::milliseconds(50), [&] { ran++; });
    loop.stop();

    TEST_ASSERT(!loop.isRunning(), "Loop must report stopped");
    TEST_ASSERT(loop.scheduledCount() == 0, "Scheduled work must be dropped");
    loop.post([&] { ran++; });
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    TEST_ASSERT(ran.load() == 0, "Nothing may run after stop");

    // Restartable.
    loop.start([](const CoordinatorEvent&) {});
    loop.post([&] { ran++; });
    TEST_ASSERT(wait_until([&] { return ran.load() == 1; }), "Restarted loop must run tasks");
    loop.stop();

    std::cout << "Stop Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    std::cout << "Running CoordinatorEventLoop Tests..." << std::endl;

    test_events_in_order();
    test_posted_tasks_run_on_loop_thread();
    test_schedule_replace_and_cancel();
    test_scheduled_events_fire_by_due_time();
    test_handler_exception_contained();
    test_stop_drops_pending_work();

    if (tests_failed == 0) {
        std::cout << "ALL COORDINATOR EVENT LOOP TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
