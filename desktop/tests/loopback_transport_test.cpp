#include "loopback_transport.h"
#include "logger.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
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

// Collects every callback an endpoint reports.
struct Events {
    mutable std::mutex mu;
    std::vector<std::string> found;
    std::vector<std::string> lost;
    std::vector<std::pair<std::string, ConnectionState>> states;
    std::vector<std::pair<std::string, std::string>> data;
    std::vector<std::string> failures;
    bool accept = true;

    TransportCallbacks callbacks() {
        TransportCallbacks cb;
        cb.onPeerFound = [this](const PeerIdentity& p, const DiscoveryInfo&) {
            std::lock_guard<std::mutex> lock(mu);
            found.push_back(p.id);
        };
        cb.onPeerLost = [this](const PeerIdentity& p) {
            std::lock_guard<std::mutex> lock(mu);
            lost.push_back(p.id);
        };
        cb.onConnectionStateChanged = [this](const PeerIdentity& p, ConnectionState s) {
            std::lock_guard<std::mutex> lock(mu);
            states.emplace_back(p.id, s);
        };
        cb.onDataReceived = [this](const std::string& d, const PeerIdentity& from) {
            std::lock_guard<std::mutex> lock(mu);
            data.emplace_back(from.id, d);
        };
        cb.onAdvertisingFailed = [this](const std::string& e) {
            std::lock_guard<std::mutex> lock(mu);
            failures.push_back("advertise: " + e);
        };
        cb.onBrowsingFailed = [this](const std::string& e) {
            std::lock_guard<std::mutex> lock(mu);
            failures.push_back("browse: " + e);
        };
        cb.onInvitationReceived = [this](const PeerIdentity&) {
            std::lock_guard<std::mutex> lock(mu);
            return accept;
        };
        return cb;
    }

    std::vector<ConnectionState> statesFor(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mu);
        std::vector<ConnectionState> out;
        for (const auto& s : states) {
            if (s.first == id) out.push_back(s.second);
        }
        return out;
    }

    size_t count(const std::vector<std::string>& v, const std::string& id) const {
        std::lock_guard<std::mutex> lock(mu);
        return static_cast<size_t>(std::count(v.begin(), v.end(), id));
    }
};

struct Mesh {
    std::shared_ptr<LoopbackHub> hub = std::make_shared<LoopbackHub>();
    Events alice_events;
    Events bob_events;
    std::shared_ptr<LoopbackTransport> alice;
    std::shared_ptr<LoopbackTransport> bob;

    Mesh() {
        alice = hub->createEndpoint(PeerIdentity("ALICE", "Alice"));
        bob = hub->createEndpoint(PeerIdentity("BOB", "Bob"));
        alice->setCallbacks(alice_events.callbacks());
        bob->setCallbacks(bob_events.callbacks());
    }

    void linkUp() {
        alice->startAdvertising();
        alice->startBrowsing();
        bob->startAdvertising();
        bob->startBrowsing();
        hub->flush();
        alice->invite(bob->localIdentity(), 30);
        hub->flush();
    }
};

bool test_discovery() {
    std::cout << "Testing discovery..." << std::endl;

    Mesh m;
    m.bob->startAdvertising();
    m.alice->startBrowsing();
    m.hub->flush();
    TEST_ASSERT(m.alice_events.count(m.alice_events.found, "BOB") == 1, "Browser must find the advertiser once");
    TEST_ASSERT(m.bob_events.count(m.bob_events.found, "ALICE") == 0, "Alice is not advertising");

    // Browsing again after a stop reports the advertiser again.
    m.alice->stopBrowsing();
    m.alice->startBrowsing();
    m.hub->flush();
    TEST_ASSERT(m.alice_events.count(m.alice_events.found, "BOB") == 2, "Restarted browse must re-report");
    TEST_ASSERT(m.hub->browseStarts("ALICE") == 2, "Browse starts are counted");

    m.bob->stopAdvertising();
    m.hub->flush();
    TEST_ASSERT(m.alice_events.count(m.alice_events.lost, "BOB") == 1, "Stopped advertiser must be lost");
    TEST_ASSERT(!m.hub->isAdvertising("BOB"), "Bob no longer advertises");

    std::cout << "Discovery Passed!" << std::endl;
    return true;
}

bool test_invite_and_data() {
    std::cout << "Testing invitation and data..." << std::endl;

    Mesh m;
    m.linkUp();

    auto a = m.alice_events.statesFor("BOB");
    auto b = m.bob_events.statesFor("ALICE");
    TEST_ASSERT(a.size() == 2 && a[0] == ConnectionState::Connecting && a[1] == ConnectionState::Connected,
                "Inviter must see Connecting then Connected");
    TEST_ASSERT(b.size() == 2 && b[0] == ConnectionState::Connecting && b[1] == ConnectionState::Connected,
                "Invitee must see Connecting then Connected");
    TEST_ASSERT(m.hub->invitesSent("ALICE") == 1, "One invite sent");
    TEST_ASSERT(m.alice->connectedPeers().size() == 1, "Alice has one session");

    for (int i = 0; i < 20; ++i) {
        m.alice->send("msg-" + std::to_string(i), {m.bob->localIdentity()});
    }
    m.hub->flush();
    {
        std::lock_guard<std::mutex> lock(m.bob_events.mu);
        TEST_ASSERT(m.bob_events.data.size() == 20, "Every payload must arrive");
        for (int i = 0; i < 20; ++i) {
            TEST_ASSERT(m.bob_events.data[i].second == "msg-" + std::to_string(i), "Payloads keep send order");
            TEST_ASSERT(m.bob_events.data[i].first == "ALICE", "Sender identity is reported");
        }
    }
    TEST_ASSERT(m.hub->sendAttempts("ALICE") == 20, "Send attempts are counted");

    std::cout << "Invitation and data Passed!" << std::endl;
    return true;
}

bool test_send_errors() {
    std::cout << "Testing send errors..." << std::endl;

    Mesh m;
    auto carol = m.hub->createEndpoint(PeerIdentity("CAROL", "Carol"));
    m.linkUp();

    bool thrown = false;
    try {
        m.alice->send("x", {m.bob->localIdentity(), carol->localIdentity()});
    } catch (const TransmitError& e) {
        thrown = true;
        TEST_ASSERT(e.failedPeers().size() == 1 && e.failedPeers()[0] == "CAROL", "Only the unlinked peer fails");
    }
    TEST_ASSERT(thrown, "Send to an unlinked peer must throw");

    m.hub->setSendFailure("ALICE", true);
    thrown = false;
    try {
        m.alice->send("x", {m.bob->localIdentity()});
    } catch (const TransmitError& e) {
        thrown = true;
        TEST_ASSERT(e.failedPeers().size() == 1 && e.failedPeers()[0] == "BOB", "Injected failure lists every target");
    }
    TEST_ASSERT(thrown, "Injected failure must throw");

    m.hub->flush();
    std::lock_guard<std::mutex> lock(m.bob_events.mu);
    TEST_ASSERT(m.bob_events.data.empty(), "Failed sends deliver nothing");

    std::cout << "Send errors Passed!" << std::endl;
    return true;
}

bool test_failed_invitations() {
    std::cout << "Testing failed invitations..." << std::endl;

    Mesh m;
    m.bob->startAdvertising();
    m.hub->setUnreachable("BOB", true);
    m.alice->invite(m.bob->localIdentity(), 30);
    m.hub->flush();
    auto a = m.alice_events.statesFor("BOB");
    TEST_ASSERT(a.size() == 2 && a.back() == ConnectionState::Disconnected, "Unreachable peer ends Disconnected");
    TEST_ASSERT(m.bob_events.statesFor("ALICE").empty(), "Unreachable peer never hears the invite");

    m.hub->setUnreachable("BOB", false);
    {
        std::lock_guard<std::mutex> lock(m.bob_events.mu);
        m.bob_events.accept = false;
    }
    m.alice->invite(m.bob->localIdentity(), 30);
    m.hub->flush();
    a = m.alice_events.statesFor("BOB");
    TEST_ASSERT(a.size() == 4 && a.back() == ConnectionState::Disconnected, "Declined invite ends Disconnected");
    TEST_ASSERT(m.alice->connectedPeers().empty(), "No session after a decline");

    std::cout << "Failed invitations Passed!" << std::endl;
    return true;
}

bool test_range_and_disconnect() {
    std::cout << "Testing range loss and disconnect..." << std::endl;

    Mesh m;
    m.linkUp();

    m.hub->setInRange("BOB", false);
    m.hub->flush();
    TEST_ASSERT(m.alice_events.count(m.alice_events.lost, "BOB") == 1, "Out-of-range peer is lost");
    TEST_ASSERT(m.bob_events.count(m.bob_events.lost, "ALICE") == 1, "Out-of-range peer loses sight too");
    TEST_ASSERT(m.alice_events.statesFor("BOB").back() == ConnectionState::Disconnected, "Link drops");
    TEST_ASSERT(m.alice->connectedPeers().empty(), "No sessions left");

    m.hub->setInRange("BOB", true);
    m.hub->flush();
    TEST_ASSERT(m.alice_events.count(m.alice_events.found, "BOB") == 2, "Back in range is found again");

    m.alice->invite(m.bob->localIdentity(), 30);
    m.hub->flush();
    TEST_ASSERT(m.bob->connectedPeers().size() == 1, "Session restored");

    m.alice->disconnect();
    m.hub->flush();
    TEST_ASSERT(m.bob_events.statesFor("ALICE").back() == ConnectionState::Disconnected,
                "Remote side sees Disconnected");
    TEST_ASSERT(m.bob->connectedPeers().empty(), "Remote has no session");

    std::cout << "Range loss and disconnect Passed!" << std::endl;
    return true;
}

bool test_discovery_failure() {
    std::cout << "Testing discovery failure..." << std::endl;

    Mesh m;
    m.hub->setDiscoveryFailure("ALICE", true);
    m.alice->startAdvertising();
    m.alice->startBrowsing();
    m.hub->flush();
    {
        std::lock_guard<std::mutex> lock(m.alice_events.mu);
        TEST_ASSERT(m.alice_events.failures.size() == 2, "Both starts must report failure");
    }
    TEST_ASSERT(!m.hub->isAdvertising("ALICE") && !m.hub->isBrowsing("ALICE"), "Nothing started");
    TEST_ASSERT(m.hub->advertiseStarts("ALICE") == 0, "Failed starts are not counted");

    std::cout << "Discovery failure Passed!" << std::endl;
    return true;
}

bool test_rebind() {
    std::cout << "Testing rebind..." << std::endl;

    Mesh m;
    m.linkUp();
    m.alice->stopAdvertising();
    m.alice->stopBrowsing();
    m.alice->rebind(PeerIdentity("ALICE-2", "Alice"));
    m.hub->flush();

    TEST_ASSERT(m.alice->localIdentity().id == "ALICE-2", "New identity is reported");
    TEST_ASSERT(m.bob->connectedPeers().empty(), "Old sessions drop");
    m.alice->startAdvertising();
    m.hub->flush();
    TEST_ASSERT(m.bob_events.count(m.bob_events.found, "ALICE-2") == 1, "Peers find the new identity");

    std::cout << "Rebind Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running LoopbackTransport Tests..." << std::endl;

    test_discovery();
    test_invite_and_data();
    test_send_errors();
    test_failed_invitations();
    test_range_and_disconnect();
    test_discovery_failure();
    test_rebind();

    if (tests_failed == 0) {
        std::cout << "ALL LOOPBACK TRANSPORT TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
