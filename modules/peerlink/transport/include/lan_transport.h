#ifndef PEERLINK_LAN_TRANSPORT_H
#define PEERLINK_LAN_TRANSPORT_H

#include "transport_adapter.h"

#include <memory>
#include <string>

namespace peerlink {

class ConfigManager;

struct LanTransportConfig {
    int discovery_port = 30400;      // UDP beacon port shared by every node
    int session_port = 30401;        // TCP listen port (0 = ephemeral)
    int beacon_interval_ms = 2000;
    int peer_lost_timeout_ms = 7000; // browsers report a peer lost after this much silence
    int hello_timeout_ms = 10000;    // invitee side wait for the HELLO frame

    static LanTransportConfig fromConfig(const ConfigManager& config);
};

/**
 * @brief TransportAdapter over the local network.
 *
 * Advertising broadcasts "PEERLINK_BEACON:<id>:<tcp_port>:<name>" on every
 * IPv4 broadcast address and accepts TCP sessions; browsing listens for
 * beacons. A session starts with HELLO / HELLO_ACK (or HELLO_REJECT) frames
 * and then carries DATA frames until either side sends BYE or the socket drops.
 */
class LanTransport : public TransportAdapter {
public:
    LanTransport(const LanTransportConfig& config, const PeerIdentity& identity);
    ~LanTransport() override;

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

    // Registers a peer reachable at host:port without waiting for its beacon.
    void addStaticPeer(const PeerIdentity& peer, const std::string& host, int port);

    // Actual TCP port while advertising (resolves session_port 0), else 0.
    int listenPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace peerlink

#endif // PEERLINK_LAN_TRANSPORT_H
