#ifndef PEERLINK_LOOPBACK_TRANSPORT_H
#define PEERLINK_LOOPBACK_TRANSPORT_H

#include "transport_adapter.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace peerlink {

class LoopbackTransport;

/**
 * @brief In-process mesh connecting LoopbackTransport endpoints.
 *
 * Every callback is delivered on the hub's single delivery thread, in the
 * order the hub queued it, so data between a pair of endpoints arrives in
 * send order. The fault-injection knobs let callers simulate unreachable
 * peers, failing writes and radio range changes.
 */
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
public:
    LoopbackHub();
    ~LoopbackHub();

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    std::shared_ptr<LoopbackTransport> createEndpoint(const PeerIdentity& identity);

    // send() from this endpoint throws TransmitError while set.
    void setSendFailure(const std::string& peer_id, bool fail);
    // Invitations to this endpoint end in Disconnected while set.
    void setUnreachable(const std::string& peer_id, bool unreachable);
    // Out of range: every link of the endpoint drops and browsers report it lost.
    void setInRange(const std::string& peer_id, bool in_range);
    void dropLink(const std::string& a, const std::string& b);
    // startAdvertising/startBrowsing on this endpoint report failure while set.
    void setDiscoveryFailure(const std::string& peer_id, bool fail);

    size_t sendAttempts(const std::string& peer_id) const;
    size_t invitesSent(const std::string& peer_id) const;
    size_t advertiseStarts(const std::string& peer_id) const;
    size_t browseStarts(const std::string& peer_id) const;
    bool isAdvertising(const std::string& peer_id) const;
    bool isBrowsing(const std::string& peer_id) const;

    // Blocks until the delivery queue is empty and idle.
    void flush();

private:
    friend class LoopbackTransport;

    struct Endpoint {
        std::weak_ptr<LoopbackTransport> transport;
        PeerIdentity identity;
        DiscoveryInfo info;
        bool advertising = false;
        bool browsing = false;
        bool in_range = true;
        bool unreachable = false;
        bool fail_sends = false;
        bool fail_discovery = false;
        size_t send_attempts = 0;
        size_t invites_sent = 0;
        size_t advertise_starts = 0;
        size_t browse_starts = 0;
        std::set<std::string> known;  // peers this browser has reported found
        std::set<std::string> links;  // peers with an established session
    };

    using Task = std::function<void()>;

    // The *Locked helpers expect m_mutex held; they only queue tasks.
    const Endpoint* findLocked(const std::string& peer_id) const;
    void registerEndpoint(const std::shared_ptr<LoopbackTransport>& transport, const PeerIdentity& identity);
    void unregisterEndpoint(const std::string& peer_id);
    void startAdvertising(const std::string& peer_id);
    void stopAdvertising(const std::string& peer_id);
    void startBrowsing(const std::string& peer_id);
    void stopBrowsing(const std::string& peer_id);
    void invite(const std::string& from_id, const PeerIdentity& to, int timeout_seconds);
    void send(const std::string& from_id, const std::string& data, const std::vector<PeerIdentity>& peers);
    std::vector<PeerIdentity> linkedPeers(const std::string& peer_id) const;
    void disconnectAll(const std::string& peer_id);
    void rekey(const std::string& old_id, const PeerIdentity& identity);

    void completeInvite(const std::string& from_id, const PeerIdentity& to);
    bool visibleLocked(const Endpoint& browser, const Endpoint& advertiser) const;
    void announceLocked(const std::string& advertiser_id);
    void discoverLocked(const std::string& browser_id);
    void reportLostLocked(const std::string& advertiser_id);
    void dropLinkLocked(const std::string& a, const std::string& b);
    void notifyStateLocked(const std::string& target_id, const PeerIdentity& about, ConnectionState state);

    void enqueue(Task task);
    void deliveryLoop();

    mutable std::mutex m_mutex;
    std::map<std::string, Endpoint> m_endpoints;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::condition_variable m_idle_cv;
    std::deque<Task> m_queue;
    bool m_busy = false;
    bool m_running = true;
    std::thread m_delivery_thread;
};

/**
 * @brief TransportAdapter endpoint attached to a LoopbackHub.
 */
class LoopbackTransport : public TransportAdapter,
                          public std::enable_shared_from_this<LoopbackTransport> {
public:
    ~LoopbackTransport() override;

    void setCallbacks(TransportCallbacks callbacks) override;
    PeerIdentity localIdentity() const override;

    void startAdvertising() override;
    void stopAdvertising() override;
    void startBrowsing() override;
    void stopBrowsing() override;

    void invite(const PeerIdentity& peer, int timeout_seconds) override;
    void send(const std::string& data, const std::vector<PeerIdentity>& peers) override;
    std::vector<PeerIdentity> connectedPeers() const override;
    void disconnect() override;
    void rebind(const PeerIdentity& identity) override;

private:
    friend class LoopbackHub;

    LoopbackTransport(std::shared_ptr<LoopbackHub> hub, const PeerIdentity& identity);

    TransportCallbacks callbacks() const;
    std::string id() const;

    std::shared_ptr<LoopbackHub> m_hub;
    mutable std::mutex m_mutex;
    PeerIdentity m_identity;
    TransportCallbacks m_callbacks;
};

} // namespace peerlink

#endif // PEERLINK_LOOPBACK_TRANSPORT_H
