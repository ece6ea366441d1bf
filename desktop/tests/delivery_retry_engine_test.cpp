#include "delivery_retry_engine.h"
#include "envelope_codec.h"
#include "logger.h"
#include "telemetry.h"
#include "transport_adapter.h"

#include <chrono>
#include <deque>
#include <iostream>
#include <map>
#include <string>
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

// Runs everything on the test thread; timers fire only when asked to.
class ManualScheduler : public Scheduler {
public:
    void post(Task task) override { posted.push_back(std::move(task)); }

    void schedule(const std::string& id, std::chrono::milliseconds delay, Task task) override {
        delays.push_back(delay);
        timers[id] = std::move(task);
    }

    void cancel(const std::string& id) override {
        timers.erase(id);
        cancelled.push_back(id);
    }

    void runPosted() {
        while (!posted.empty()) {
            Task t = std::move(posted.front());
            posted.pop_front();
            t();
        }
    }

    // Fires every pending timer once, then drains what they posted.
    bool fireTimers() {
        if (timers.empty()) return false;
        std::map<std::string, Task> due;
        due.swap(timers);
        for (auto& kv : due) kv.second();
        runPosted();
        return true;
    }

    std::deque<Task> posted;
    std::map<std::string, Task> timers;
    std::vector<std::chrono::milliseconds> delays;
    std::vector<std::string> cancelled;
};

class FakeTransport : public TransportAdapter {
public:
    void setCallbacks(TransportCallbacks) override {}
    PeerIdentity localIdentity() const override { return PeerIdentity("LOCAL", "Local"); }
    void startAdvertising() override {}
    void stopAdvertising() override {}
    void startBrowsing() override {}
    void stopBrowsing() override {}
    void invite(const PeerIdentity&, int) override {}

    void send(const std::string& data, const std::vector<PeerIdentity>& peers) override {
        sends++;
        last_data = data;
        last_targets = peers;
        if (fail_remaining != 0) {
            if (fail_remaining > 0) fail_remaining--;
            std::vector<std::string> ids;
            for (const auto& p : peers) ids.push_back(p.id);
            throw TransmitError("link down", ids);
        }
    }

    std::vector<PeerIdentity> connectedPeers() const override { return {}; }
    void disconnect() override {}
    void rebind(const PeerIdentity&) override {}

    int sends = 0;
    int fail_remaining = 0;  // -1 = fail forever
    std::string last_data;
    std::vector<PeerIdentity> last_targets;
};

static DeliveryRetryEngine::Config default_config() {
    DeliveryRetryEngine::Config cfg;
    cfg.max_retry_attempts = 5;
    cfg.base_interval = std::chrono::milliseconds(2000);
    return cfg;
}

static const std::vector<PeerIdentity> kTargets = {PeerIdentity("PEER-B", "Bob")};

bool test_first_attempt_success() {
    std::cout << "Testing delivery on the first attempt..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    Telemetry telemetry;
    telemetry.initialize("LOCAL", Telemetry::Config{});
    DeliveryRetryEngine engine(transport, scheduler, nullptr, &telemetry, default_config());

    int completions = 0;
    bool delivered = false;
    const ChatMessage msg = ChatMessage::compose("Alice", "hello");
    engine.sendWithRetry(Envelope::chat(msg), kTargets, [&](bool ok) {
        completions++;
        delivered = ok;
    });
    scheduler.runPosted();

    TEST_ASSERT(transport.sends == 1, "Exactly one transmission expected");
    TEST_ASSERT(completions == 1 && delivered, "Completion must report delivery");
    TEST_ASSERT(scheduler.timers.empty(), "No retry may be scheduled after success");
    TEST_ASSERT(engine.inFlight() == 0, "Job must be retired");
    TEST_ASSERT(telemetry.counter_value("sends_delivered") == 1, "Delivery must be counted");

    auto decoded = EnvelopeCodec::decode(transport.last_data);
    TEST_ASSERT(decoded.envelope.has_value(), "Transmitted bytes must decode as an envelope");
    TEST_ASSERT(std::get<ChatMessage>(decoded.envelope->payload).id == msg.id, "Envelope must carry the message");
    TEST_ASSERT(transport.last_targets == kTargets, "Targets must be passed through");

    std::cout << "First attempt delivery Passed!" << std::endl;
    return true;
}

bool test_backoff_schedule_and_give_up() {
    std::cout << "Testing exponential backoff until abandonment..." << std::endl;

    FakeTransport transport;
    transport.fail_remaining = -1;
    ManualScheduler scheduler;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, default_config());

    int completions = 0;
    bool delivered = true;
    engine.sendWithRetry(Envelope::chat(ChatMessage::compose("Alice", "anyone?")), kTargets, [&](bool ok) {
        completions++;
        delivered = ok;
    });
    scheduler.runPosted();

    int rounds = 0;
    while (scheduler.fireTimers()) {
        rounds++;
        TEST_ASSERT(rounds <= 10, "Retries must stop on their own");
    }

    TEST_ASSERT(transport.sends == 6, "One attempt plus five retries expected, got " << transport.sends);
    const std::vector<std::chrono::milliseconds> expected = {
        std::chrono::milliseconds(2000), std::chrono::milliseconds(4000), std::chrono::milliseconds(8000),
        std::chrono::milliseconds(16000), std::chrono::milliseconds(32000)};
    TEST_ASSERT(scheduler.delays == expected, "Backoff must double from 2s to 32s");
    TEST_ASSERT(completions == 1 && !delivered, "Completion must report failure once");
    TEST_ASSERT(engine.inFlight() == 0, "Abandoned job must be retired");

    // Nothing left to fire: no seventh transmission.
    TEST_ASSERT(!scheduler.fireTimers(), "No timer may remain after giving up");
    TEST_ASSERT(transport.sends == 6, "No seventh transmission");

    std::cout << "Backoff and give-up Passed!" << std::endl;
    return true;
}

bool test_success_after_failures() {
    std::cout << "Testing recovery after transient failures..." << std::endl;

    FakeTransport transport;
    transport.fail_remaining = 2;
    ManualScheduler scheduler;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, default_config());

    int completions = 0;
    bool delivered = false;
    engine.sendWithRetry(Envelope::profileRequest(), kTargets, [&](bool ok) {
        completions++;
        delivered = ok;
    });
    scheduler.runPosted();
    while (scheduler.fireTimers()) {
    }

    TEST_ASSERT(transport.sends == 3, "Two failures then one success expected");
    TEST_ASSERT(scheduler.delays.size() == 2, "Two retries must have been scheduled");
    TEST_ASSERT(completions == 1 && delivered, "Completion must report delivery");

    std::cout << "Recovery after failures Passed!" << std::endl;
    return true;
}

bool test_payload_fixed_across_retries() {
    std::cout << "Testing that retries resend the same bytes..." << std::endl;

    FakeTransport transport;
    transport.fail_remaining = 1;
    ManualScheduler scheduler;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, default_config());

    engine.sendWithRetry(Envelope::profile(UserProfile::create("Alice", "Around")), kTargets);
    scheduler.runPosted();
    const std::string first = transport.last_data;
    while (scheduler.fireTimers()) {
    }

    TEST_ASSERT(transport.sends == 2, "One retry expected");
    TEST_ASSERT(transport.last_data == first, "Envelope must be encoded once");

    std::cout << "Fixed payload across retries Passed!" << std::endl;
    return true;
}

bool test_empty_targets_noop() {
    std::cout << "Testing empty target set..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, default_config());

    bool called = false;
    engine.sendWithRetry(Envelope::profileRequest(), {}, [&](bool) { called = true; });
    scheduler.runPosted();

    TEST_ASSERT(transport.sends == 0, "Nothing may be transmitted");
    TEST_ASSERT(!called, "Completion must not run for a no-op");
    TEST_ASSERT(engine.inFlight() == 0, "No job may be created");

    std::cout << "Empty target set Passed!" << std::endl;
    return true;
}

bool test_cancel_all() {
    std::cout << "Testing cancelAll..." << std::endl;

    FakeTransport transport;
    transport.fail_remaining = -1;
    ManualScheduler scheduler;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, default_config());

    bool called = false;
    engine.sendWithRetry(Envelope::chat(ChatMessage::compose("Alice", "x")), kTargets, [&](bool) { called = true; });
    scheduler.runPosted();
    TEST_ASSERT(engine.inFlight() == 1, "Job must be waiting for its retry");
    TEST_ASSERT(scheduler.timers.size() == 1, "Retry must be scheduled");

    engine.cancelAll();
    TEST_ASSERT(engine.inFlight() == 0, "Jobs must be dropped");
    TEST_ASSERT(scheduler.timers.empty(), "Retry timer must be cancelled");
    TEST_ASSERT(!called, "Cancelled jobs must not complete");
    TEST_ASSERT(transport.sends == 1, "No further transmission");

    std::cout << "cancelAll Passed!" << std::endl;
    return true;
}

bool test_zero_retries() {
    std::cout << "Testing max_retry_attempts = 0..." << std::endl;

    FakeTransport transport;
    transport.fail_remaining = -1;
    ManualScheduler scheduler;
    DeliveryRetryEngine::Config cfg = default_config();
    cfg.max_retry_attempts = 0;
    DeliveryRetryEngine engine(transport, scheduler, nullptr, nullptr, cfg);

    bool delivered = true;
    engine.sendWithRetry(Envelope::profileRequest(), kTargets, [&](bool ok) { delivered = ok; });
    scheduler.runPosted();

    TEST_ASSERT(transport.sends == 1, "Single attempt expected");
    TEST_ASSERT(scheduler.timers.empty(), "No retry expected");
    TEST_ASSERT(!delivered, "Completion must report failure");
    TEST_ASSERT(engine.backoffFor(3) == std::chrono::milliseconds(16000), "backoffFor must double per attempt");

    std::cout << "Zero retries Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running DeliveryRetryEngine Tests..." << std::endl;

    test_first_attempt_success();
    test_backoff_schedule_and_give_up();
    test_success_after_failures();
    test_payload_fixed_across_retries();
    test_empty_targets_noop();
    test_cancel_all();
    test_zero_retries();

    if (tests_failed == 0) {
        std::cout << "ALL DELIVERY RETRY ENGINE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
