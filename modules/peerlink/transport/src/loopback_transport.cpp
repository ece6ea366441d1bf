#include "loopback_transport.h"
#include "logger.h"

namespace peerlink {

// ============================================================================
// LoopbackHub
// ============================================================================

LoopbackHub::LoopbackHub() {
    m_delivery_thread = std::thread(&LoopbackHub::deliveryLoop, this);
}

LoopbackHub::~LoopbackHub() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_running = false;
        m_queue.clear();
    }
    m_queue_cv.notify_all();
    m_idle_cv.notify_all();

    if (m_delivery_thread.joinable()) {
        // The last endpoint can be released from inside a delivery task.
        if (m_delivery_thread.get_id() == std::this_thread::get_id()) {
            m_delivery_thread.detach();
        } else {
            m_delivery_thread.join();
        }
    }
}

std::shared_ptr<LoopbackTransport> LoopbackHub::createEndpoint(const PeerIdentity& identity) {
    std::shared_ptr<LoopbackTransport> transport(new LoopbackTransport(shared_from_this(), identity));
    registerEndpoint(transport, identity);
    return transport;
}

void LoopbackHub::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running) return;
        m_queue.push_back(std::move(task));
    }
    m_queue_cv.notify_one();
}

void LoopbackHub::deliveryLoop() {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    for (;;) {
        m_queue_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });
        if (!m_running) break;

        Task task = std::move(m_queue.front());
        m_queue.pop_front();
        m_busy = true;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("LB: delivery task threw: ") + e.what());
        }

        lock.lock();
        m_busy = false;
        if (m_queue.empty()) {
            m_idle_cv.notify_all();
        }
    }
}

void LoopbackHub::flush() {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_idle_cv.wait(lock, [this] { return (m_queue.empty() && !m_busy) || !m_running; });
}

const LoopbackHub::Endpoint* LoopbackHub::findLocked(const std::string& peer_id) const {
    auto it = m_endpoints.find(peer_id);
    return it == m_endpoints.end() ? nullptr : &it->second;
}

void LoopbackHub::registerEndpoint(const std::shared_ptr<LoopbackTransport>& transport, const PeerIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Endpoint& ep = m_endpoints[identity.id];
    ep.transport = transport;
    ep.identity = identity;
    ep.info["transport"] = "loopback";
    LOG_DEBUG("LB: registered endpoint " + identity.describe());
}

void LoopbackHub::unregisterEndpoint(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end()) return;

    reportLostLocked(peer_id);
    const std::set<std::string> links = it->second.links;
    for (const auto& other : links) {
        dropLinkLocked(peer_id, other);
    }
    m_endpoints.erase(peer_id);
}

bool LoopbackHub::visibleLocked(const Endpoint& browser, const Endpoint& advertiser) const {
    return browser.identity.id != advertiser.identity.id &&
           browser.browsing && advertiser.advertising &&
           browser.in_range && advertiser.in_range;
}

void LoopbackHub::announceLocked(const std::string& advertiser_id) {
    auto adv_it = m_endpoints.find(advertiser_id);
    if (adv_it == m_endpoints.end()) return;
    const Endpoint& adv = adv_it->second;

    for (auto& kv : m_endpoints) {
        Endpoint& browser = kv.second;
        if (!visibleLocked(browser, adv) || browser.known.count(advertiser_id)) continue;
        browser.known.insert(advertiser_id);

        std::weak_ptr<LoopbackTransport> target = browser.transport;
        PeerIdentity found = adv.identity;
        DiscoveryInfo info = adv.info;
        enqueue([target, found, info] {
            if (auto t = target.lock()) {
                auto cb = t->callbacks();
                if (cb.onPeerFound) cb.onPeerFound(found, info);
            }
        });
    }
}

void LoopbackHub::discoverLocked(const std::string& browser_id) {
    for (const auto& kv : m_endpoints) {
        if (kv.first != browser_id) {
            announceLocked(kv.first);
        }
    }
}

void LoopbackHub::reportLostLocked(const std::string& advertiser_id) {
    auto adv_it = m_endpoints.find(advertiser_id);
    if (adv_it == m_endpoints.end()) return;
    const PeerIdentity lost = adv_it->second.identity;

    for (auto& kv : m_endpoints) {
        Endpoint& browser = kv.second;
        if (browser.known.erase(advertiser_id) == 0) continue;

        std::weak_ptr<LoopbackTransport> target = browser.transport;
        enqueue([target, lost] {
            if (auto t = target.lock()) {
                auto cb = t->callbacks();
                if (cb.onPeerLost) cb.onPeerLost(lost);
            }
        });
    }
}

void LoopbackHub::notifyStateLocked(const std::string& target_id, const PeerIdentity& about, ConnectionState state) {
    const Endpoint* ep = findLocked(target_id);
    if (!ep) return;

    std::weak_ptr<LoopbackTransport> target = ep->transport;
    enqueue([target, about, state] {
        if (auto t = target.lock()) {
            auto cb = t->callbacks();
            if (cb.onConnectionStateChanged) cb.onConnectionStateChanged(about, state);
        }
    });
}

void LoopbackHub::dropLinkLocked(const std::string& a, const std::string& b) {
    auto a_it = m_endpoints.find(a);
    auto b_it = m_endpoints.find(b);
    if (a_it == m_endpoints.end() || b_it == m_endpoints.end()) return;
    if (a_it->second.links.erase(b) == 0) return;
    b_it->second.links.erase(a);

    notifyStateLocked(a, b_it->second.identity, ConnectionState::Disconnected);
    notifyStateLocked(b, a_it->second.identity, ConnectionState::Disconnected);
}

void LoopbackHub::startAdvertising(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end()) return;
    Endpoint& ep = it->second;

    if (ep.fail_discovery) {
        std::weak_ptr<LoopbackTransport> target = ep.transport;
        enqueue([target] {
            if (auto t = target.lock()) {
                auto cb = t->callbacks();
                if (cb.onAdvertisingFailed) cb.onAdvertisingFailed("advertising unavailable");
            }
        });
        return;
    }

    ep.advertise_starts++;
    ep.advertising = true;
    announceLocked(peer_id);
}

void LoopbackHub::stopAdvertising(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end() || !it->second.advertising) return;
    it->second.advertising = false;
    reportLostLocked(peer_id);
}

void LoopbackHub::startBrowsing(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end()) return;
    Endpoint& ep = it->second;

    if (ep.fail_discovery) {
        std::weak_ptr<LoopbackTransport> target = ep.transport;
        enqueue([target] {
            if (auto t = target.lock()) {
                auto cb = t->callbacks();
                if (cb.onBrowsingFailed) cb.onBrowsingFailed("browsing unavailable");
            }
        });
        return;
    }

    ep.browse_starts++;
    ep.browsing = true;
    discoverLocked(peer_id);
}

void LoopbackHub::stopBrowsing(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end()) return;
    it->second.browsing = false;
    // A later startBrowsing reports every visible advertiser again.
    it->second.known.clear();
}

void LoopbackHub::invite(const std::string& from_id, const PeerIdentity& to, int timeout_seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(from_id);
    if (it == m_endpoints.end()) return;
    it->second.invites_sent++;

    LOG_DEBUG("LB: " + it->second.identity.describe() + " invites " + to.describe() +
              " (timeout " + std::to_string(timeout_seconds) + "s)");

    notifyStateLocked(from_id, to, ConnectionState::Connecting);
    std::weak_ptr<LoopbackHub> weak_hub = shared_from_this();
    enqueue([weak_hub, from_id, to] {
        if (auto hub = weak_hub.lock()) {
            hub->completeInvite(from_id, to);
        }
    });
}

void LoopbackHub::completeInvite(const std::string& from_id, const PeerIdentity& to) {
    std::function<bool(const PeerIdentity&)> decide;
    PeerIdentity from_identity;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Endpoint* from = findLocked(from_id);
        if (!from) return;
        const Endpoint* target = findLocked(to.id);

        // Unreachable peers time out; the loopback reports the timeout at once.
        if (!target || !target->advertising || target->unreachable || !target->in_range || !from->in_range) {
            notifyStateLocked(from_id, to, ConnectionState::Disconnected);
            return;
        }
        if (from->links.count(to.id)) {
            notifyStateLocked(from_id, target->identity, ConnectionState::Connected);
            return;
        }
        if (auto t = target->transport.lock()) {
            decide = t->callbacks().onInvitationReceived;
        }
        from_identity = from->identity;
    }

    // Ask the invitee without holding the hub lock; the hook may call back into its transport.
    const bool accepted = !decide || decide(from_identity);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto from_it = m_endpoints.find(from_id);
    auto to_it = m_endpoints.find(to.id);
    if (from_it == m_endpoints.end()) return;
    if (!accepted || to_it == m_endpoints.end()) {
        LOG_DEBUG("LB: invitation from " + from_identity.describe() + " declined by " + to.describe());
        notifyStateLocked(from_id, to, ConnectionState::Disconnected);
        return;
    }

    notifyStateLocked(to.id, from_it->second.identity, ConnectionState::Connecting);
    from_it->second.links.insert(to.id);
    to_it->second.links.insert(from_id);
    notifyStateLocked(from_id, to_it->second.identity, ConnectionState::Connected);
    notifyStateLocked(to.id, from_it->second.identity, ConnectionState::Connected);
}

void LoopbackHub::send(const std::string& from_id, const std::string& data, const std::vector<PeerIdentity>& peers) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(from_id);
    if (it == m_endpoints.end()) {
        throw TransmitError("endpoint is not registered");
    }
    Endpoint& from = it->second;
    from.send_attempts++;

    if (from.fail_sends) {
        std::vector<std::string> ids;
        for (const auto& p : peers) ids.push_back(p.id);
        throw TransmitError("injected send failure", ids);
    }

    std::vector<std::string> failed;
    for (const auto& p : peers) {
        if (!from.links.count(p.id) || !m_endpoints.count(p.id)) {
            failed.push_back(p.id);
        }
    }
    if (!failed.empty()) {
        throw TransmitError("peer not connected: " + failed.front(), failed);
    }

    const PeerIdentity sender = from.identity;
    for (const auto& p : peers) {
        std::weak_ptr<LoopbackTransport> target = m_endpoints[p.id].transport;
        enqueue([target, sender, data] {
            if (auto t = target.lock()) {
                auto cb = t->callbacks();
                if (cb.onDataReceived) cb.onDataReceived(data, sender);
            }
        });
    }
}

std::vector<PeerIdentity> LoopbackHub::linkedPeers(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PeerIdentity> out;
    const Endpoint* ep = findLocked(peer_id);
    if (!ep) return out;
    for (const auto& other : ep->links) {
        if (const Endpoint* o = findLocked(other)) {
            out.push_back(o->identity);
        }
    }
    return out;
}

void LoopbackHub::disconnectAll(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    if (!ep) return;
    const std::set<std::string> links = ep->links;
    for (const auto& other : links) {
        dropLinkLocked(peer_id, other);
    }
}

void LoopbackHub::rekey(const std::string& old_id, const PeerIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(old_id);
    if (it == m_endpoints.end()) return;

    const std::set<std::string> links = it->second.links;
    for (const auto& other : links) {
        dropLinkLocked(old_id, other);
    }
    reportLostLocked(old_id);

    Endpoint ep = std::move(it->second);
    m_endpoints.erase(it);
    ep.identity = identity;
    ep.advertising = false;
    ep.browsing = false;
    ep.known.clear();
    ep.links.clear();
    m_endpoints[identity.id] = std::move(ep);
}

void LoopbackHub::setSendFailure(const std::string& peer_id, bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it != m_endpoints.end()) it->second.fail_sends = fail;
}

void LoopbackHub::setUnreachable(const std::string& peer_id, bool unreachable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it != m_endpoints.end()) it->second.unreachable = unreachable;
}

void LoopbackHub::setDiscoveryFailure(const std::string& peer_id, bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it != m_endpoints.end()) it->second.fail_discovery = fail;
}

void LoopbackHub::setInRange(const std::string& peer_id, bool in_range) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(peer_id);
    if (it == m_endpoints.end() || it->second.in_range == in_range) return;

    if (!in_range) {
        reportLostLocked(peer_id);
        const std::set<std::string> links = it->second.links;
        for (const auto& other : links) {
            dropLinkLocked(peer_id, other);
        }
        // The endpoint also loses sight of everything it had found.
        std::weak_ptr<LoopbackTransport> target = it->second.transport;
        for (const auto& known_id : it->second.known) {
            const Endpoint* lost = findLocked(known_id);
            if (!lost) continue;
            PeerIdentity lost_identity = lost->identity;
            enqueue([target, lost_identity] {
                if (auto t = target.lock()) {
                    auto cb = t->callbacks();
                    if (cb.onPeerLost) cb.onPeerLost(lost_identity);
                }
            });
        }
        it->second.known.clear();
        it->second.in_range = false;
        return;
    }

    it->second.in_range = true;
    announceLocked(peer_id);
    discoverLocked(peer_id);
}

void LoopbackHub::dropLink(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(m_mutex);
    dropLinkLocked(a, b);
}

size_t LoopbackHub::sendAttempts(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep ? ep->send_attempts : 0;
}

size_t LoopbackHub::invitesSent(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep ? ep->invites_sent : 0;
}

size_t LoopbackHub::advertiseStarts(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep ? ep->advertise_starts : 0;
}

size_t LoopbackHub::browseStarts(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep ? ep->browse_starts : 0;
}

bool LoopbackHub::isAdvertising(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep && ep->advertising;
}

bool LoopbackHub::isBrowsing(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Endpoint* ep = findLocked(peer_id);
    return ep && ep->browsing;
}

// ============================================================================
// LoopbackTransport
// ============================================================================

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub, const PeerIdentity& identity)
    : m_hub(std::move(hub)), m_identity(identity) {}

LoopbackTransport::~LoopbackTransport() {
    m_hub->unregisterEndpoint(id());
}

TransportCallbacks LoopbackTransport::callbacks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callbacks;
}

std::string LoopbackTransport::id() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_identity.id;
}

void LoopbackTransport::setCallbacks(TransportCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks = std::move(callbacks);
}

PeerIdentity LoopbackTransport::localIdentity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_identity;
}

void LoopbackTransport::startAdvertising() { m_hub->startAdvertising(id()); }
void LoopbackTransport::stopAdvertising() { m_hub->stopAdvertising(id()); }
void LoopbackTransport::startBrowsing() { m_hub->startBrowsing(id()); }
void LoopbackTransport::stopBrowsing() { m_hub->stopBrowsing(id()); }

void LoopbackTransport::invite(const PeerIdentity& peer, int timeout_seconds) {
    m_hub->invite(id(), peer, timeout_seconds);
}

void LoopbackTransport::send(const std::string& data, const std::vector<PeerIdentity>& peers) {
    m_hub->send(id(), data, peers);
}

std::vector<PeerIdentity> LoopbackTransport::connectedPeers() const {
    return m_hub->linkedPeers(id());
}

void LoopbackTransport::disconnect() {
    m_hub->disconnectAll(id());
}

void LoopbackTransport::rebind(const PeerIdentity& identity) {
    std::string old_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old_id = m_identity.id;
        m_identity = identity;
    }
    m_hub->rekey(old_id, identity);
    LOG_INFO("LB: endpoint rebound to " + identity.describe());
}

} // namespace peerlink
