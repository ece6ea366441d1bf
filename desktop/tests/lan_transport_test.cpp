#include "lan_transport.h"
#include "logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
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

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Asks the kernel for a currently unused UDP port.
static int get_free_udp_port() {
    int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) return 0;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    int port = 0;
    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(sock);
    return port;
}

struct Node {
    PeerIdentity identity;

    std::mutex mu;
    std::vector<std::string> found;
    std::vector<std::pair<std::string, ConnectionState>> states;
    std::vector<std::string> received;
    bool accept = true;

    // Declared last so its threads stop before the state above goes away.
    std::unique_ptr<LanTransport> transport;

    Node(const std::string& id, const std::string& name) : identity(id, name) {
        LanTransportConfig cfg;
        // A private beacon port keeps other nodes' beacons out of the test.
        cfg.discovery_port = get_free_udp_port();
        cfg.session_port = 0;
        cfg.beacon_interval_ms = 200;
        cfg.peer_lost_timeout_ms = 60000;
        cfg.hello_timeout_ms = 2000;
        transport.reset(new LanTransport(cfg, identity));

        TransportCallbacks cb;
        cb.onPeerFound = [this](const PeerIdentity& p, const DiscoveryInfo&) {
            std::lock_guard<std::mutex> lock(mu);
            found.push_back(p.id);
        };
        cb.onConnectionStateChanged = [this](const PeerIdentity& p, ConnectionState s) {
            std::lock_guard<std::mutex> lock(mu);
            states.emplace_back(p.id, s);
        };
        cb.onDataReceived = [this](const std::string& d, const PeerIdentity&) {
            std::lock_guard<std::mutex> lock(mu);
            received.push_back(d);
        };
        cb.onInvitationReceived = [this](const PeerIdentity&) {
            std::lock_guard<std::mutex> lock(mu);
            return accept;
        };
        transport->setCallbacks(std::move(cb));
    }

    void start() {
        transport->startAdvertising();
        transport->startBrowsing();
    }

    bool saw(const std::string& peer_id, ConnectionState state) {
        std::lock_guard<std::mutex> lock(mu);
        for (const auto& s : states) {
            if (s.first == peer_id && s.second == state) return true;
        }
        return false;
    }

    bool hasFound(const std::string& peer_id) {
        std::lock_guard<std::mutex> lock(mu);
        for (const auto& f : found) {
            if (f == peer_id) return true;
        }
        return false;
    }

    size_t receivedCount() {
        std::lock_guard<std::mutex> lock(mu);
        return received.size();
    }
};

static bool connect_nodes(Node& a, Node& b) {
    a.start();
    b.start();
    if (a.transport->listenPort() <= 0 || b.transport->listenPort() <= 0) return false;
    a.transport->addStaticPeer(b.identity, "127.0.0.1", b.transport->listenPort());
    a.transport->invite(b.identity, 5);
    return wait_until([&] {
        return a.saw(b.identity.id, ConnectionState::Connected) && b.saw(a.identity.id, ConnectionState::Connected);
    });
}

bool test_session_and_data() {
    std::cout << "Testing LAN session and data..." << std::endl;

    Node a("LAN-ALICE", "Alice");
    Node b("LAN-BOB", "Bob");
    a.start();
    TEST_ASSERT(a.transport->listenPort() > 0, "Advertising must bind a TCP port");
    b.start();
    a.transport->addStaticPeer(b.identity, "127.0.0.1", b.transport->listenPort());
    TEST_ASSERT(a.hasFound(b.identity.id), "Static peer is reported while browsing");

    a.transport->invite(b.identity, 5);
    TEST_ASSERT(wait_until([&] { return a.saw(b.identity.id, ConnectionState::Connected); }),
                "Inviter must reach Connected");
    TEST_ASSERT(wait_until([&] { return b.saw(a.identity.id, ConnectionState::Connected); }),
                "Invitee must reach Connected");
    TEST_ASSERT(a.saw(b.identity.id, ConnectionState::Connecting), "Inviter reports Connecting first");
    TEST_ASSERT(a.transport->connectedPeers().size() == 1, "Inviter has one session");

    a.transport->send("ping", {b.identity});
    TEST_ASSERT(wait_until([&] { return b.receivedCount() == 1; }), "Payload must arrive");
    b.transport->send("pong", {a.identity});
    TEST_ASSERT(wait_until([&] { return a.receivedCount() == 1; }), "Reply must arrive");
    {
        std::lock_guard<std::mutex> lock(b.mu);
        TEST_ASSERT(b.received[0] == "ping", "Payload must be intact");
    }

    const std::string big(200 * 1024, 'z');
    a.transport->send(big, {b.identity});
    TEST_ASSERT(wait_until([&] { return b.receivedCount() == 2; }), "Large payload must arrive");
    {
        std::lock_guard<std::mutex> lock(b.mu);
        TEST_ASSERT(b.received[1] == big, "Large payload must be reassembled");
    }

    std::cout << "LAN session and data Passed!" << std::endl;
    return true;
}

bool test_send_without_session() {
    std::cout << "Testing LAN send without a session..." << std::endl;

    Node a("LAN-SOLO", "Solo");
    a.start();
    bool thrown = false;
    try {
        a.transport->send("x", {PeerIdentity("NOBODY", "Nobody")});
    } catch (const TransmitError& e) {
        thrown = true;
        TEST_ASSERT(e.failedPeers().size() == 1 && e.failedPeers()[0] == "NOBODY", "Failed peer must be named");
    }
    TEST_ASSERT(thrown, "Send without a session must throw");

    a.transport->invite(PeerIdentity("NOWHERE", "Nowhere"), 1);
    TEST_ASSERT(wait_until([&] { return a.saw("NOWHERE", ConnectionState::Disconnected); }),
                "Invite to an unknown address ends Disconnected");

    std::cout << "LAN send without a session Passed!" << std::endl;
    return true;
}

bool test_rejected_invitation() {
    std::cout << "Testing LAN rejected invitation..." << std::endl;

    Node a("LAN-ASKER", "Asker");
    Node b("LAN-DECLINER", "Decliner");
    {
        std::lock_guard<std::mutex> lock(b.mu);
        b.accept = false;
    }
    TEST_ASSERT(!connect_nodes(a, b), "Declined invitation must not connect");
    TEST_ASSERT(a.saw(b.identity.id, ConnectionState::Disconnected), "Inviter must see Disconnected");
    TEST_ASSERT(!b.saw(a.identity.id, ConnectionState::Connected), "Decliner never reports Connected");
    TEST_ASSERT(b.transport->connectedPeers().empty(), "Decliner holds no session");

    std::cout << "LAN rejected invitation Passed!" << std::endl;
    return true;
}

bool test_disconnect() {
    std::cout << "Testing LAN disconnect..." << std::endl;

    Node a("LAN-LEAVER", "Leaver");
    Node b("LAN-STAYER", "Stayer");
    TEST_ASSERT(connect_nodes(a, b), "Nodes must connect");

    a.transport->disconnect();
    TEST_ASSERT(wait_until([&] { return b.saw(a.identity.id, ConnectionState::Disconnected); }),
                "Remote must see Disconnected");
    TEST_ASSERT(wait_until([&] { return a.saw(b.identity.id, ConnectionState::Disconnected); }),
                "Local side must see Disconnected");
    TEST_ASSERT(wait_until([&] { return b.transport->connectedPeers().empty(); }), "Remote session must close");

    // Identity changes are refused while discovery runs.
    a.transport->rebind(PeerIdentity("LAN-OTHER", "Other"));
    TEST_ASSERT(a.transport->localIdentity().id == "LAN-LEAVER", "Rebind must be ignored while advertising");

    a.transport->stopAdvertising();
    a.transport->stopBrowsing();
    TEST_ASSERT(a.transport->listenPort() == 0, "No listen port once advertising stops");
    a.transport->rebind(PeerIdentity("LAN-OTHER", "Other"));
    TEST_ASSERT(a.transport->localIdentity().id == "LAN-OTHER", "Rebind must apply once idle");

    std::cout << "LAN disconnect Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running LanTransport Tests..." << std::endl;

    test_session_and_data();
    test_send_without_session();
    test_rejected_invitation();
    test_disconnect();

    if (tests_failed == 0) {
        std::cout << "ALL LAN TRANSPORT TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
