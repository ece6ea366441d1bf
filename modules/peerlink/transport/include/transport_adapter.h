#ifndef PEERLINK_TRANSPORT_ADAPTER_H
#define PEERLINK_TRANSPORT_ADAPTER_H

#include "connection_state.h"
#include "peer_identity.h"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace peerlink {

/**
 * @brief Raised by TransportAdapter::send when the payload could not be
 * handed to one or more of the target peers.
 */
class TransmitError : public std::runtime_error {
public:
    explicit TransmitError(const std::string& what, std::vector<std::string> failed_peers = {})
        : std::runtime_error(what), m_failed_peers(std::move(failed_peers)) {}

    const std::vector<std::string>& failedPeers() const { return m_failed_peers; }

private:
    std::vector<std::string> m_failed_peers;
};

/**
 * @brief Events a transport reports. Callbacks may fire on any transport-owned
 * thread; receivers must not assume a particular thread and must not block.
 */
struct TransportCallbacks {
    std::function<void(const PeerIdentity&, const DiscoveryInfo&)> onPeerFound;
    std::function<void(const PeerIdentity&)> onPeerLost;
    std::function<void(const PeerIdentity&, ConnectionState)> onConnectionStateChanged;
    std::function<void(const std::string& data, const PeerIdentity& from)> onDataReceived;
    std::function<void(const std::string& error)> onAdvertisingFailed;
    std::function<void(const std::string& error)> onBrowsingFailed;
    // Decides whether an incoming invitation is accepted. Absent = accept.
    std::function<bool(const PeerIdentity&)> onInvitationReceived;
};

/**
 * @brief Narrow interface over the link layer (nearby radio, LAN, in-process mesh).
 *
 * The adapter owns at most one session per peer. start/stop calls are cheap and
 * must not block on the network; failures to start are reported through
 * onAdvertisingFailed / onBrowsingFailed. invite() returns immediately and the
 * outcome arrives as Connecting then Connected or Disconnected.
 */
class TransportAdapter {
public:
    virtual ~TransportAdapter() = default;

    virtual void setCallbacks(TransportCallbacks callbacks) = 0;
    virtual PeerIdentity localIdentity() const = 0;

    virtual void startAdvertising() = 0;
    virtual void stopAdvertising() = 0;
    virtual void startBrowsing() = 0;
    virtual void stopBrowsing() = 0;

    virtual void invite(const PeerIdentity& peer, int timeout_seconds) = 0;

    // May block on the network. Throws TransmitError.
    virtual void send(const std::string& data, const std::vector<PeerIdentity>& peers) = 0;

    virtual std::vector<PeerIdentity> connectedPeers() const = 0;

    // Drops every session; each connected peer is reported Disconnected.
    virtual void disconnect() = 0;

    // Replaces the local identity. Only valid while neither advertising nor browsing.
    virtual void rebind(const PeerIdentity& identity) = 0;
};

} // namespace peerlink

#endif // PEERLINK_TRANSPORT_ADAPTER_H
