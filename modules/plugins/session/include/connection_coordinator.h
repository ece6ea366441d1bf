#ifndef PEERLINK_CONNECTION_COORDINATOR_H
#define PEERLINK_CONNECTION_COORDINATOR_H

#include "chat_models.h"
#include "connection_state.h"
#include "coordinator_config.h"
#include "peer_identity.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

class Telemetry;
class TransportAdapter;

enum class AppMode {
    Foreground,
    Background
};

// Every callback runs on the coordinator's dispatch context: the event
// thread by default, or whatever setDispatcher() installs.
struct CoordinatorCallbacks {
    std::function<void(const ChatMessage&, const PeerIdentity& from)> onMessageReceived;
    std::function<void(const std::vector<PeerIdentity>& connected)> onPeerListChanged;
    std::function<void(const UserProfile&, const PeerIdentity& from)> onProfileReceived;
    std::function<void(const PeerIdentity&, ConnectionState)> onConnectionStateChanged;
    // SENT once the transport accepted the message, FAILED once retries ran out.
    std::function<void(const std::string& message_id, MessageStatus)> onMessageStatusChanged;
};

/**
 * @brief Owns one transport session and every piece of per-peer state.
 *
 * Discovery, transport and timer events are serialized onto a single event
 * thread, which is the only writer of the connection map, the pending set,
 * the connect retry records and the profile cache. Accessors may be called
 * from any thread. Transmission happens on a sender pool through the
 * DeliveryRetryEngine.
 */
class ConnectionCoordinator {
public:
    using Dispatcher = std::function<void(std::function<void()>)>;
    using PeerList = std::vector<PeerIdentity>;

    ConnectionCoordinator(std::shared_ptr<TransportAdapter> transport,
                          const CoordinatorConfig& config,
                          std::shared_ptr<Telemetry> telemetry = nullptr);
    ~ConnectionCoordinator();

    ConnectionCoordinator(const ConnectionCoordinator&) = delete;
    ConnectionCoordinator& operator=(const ConnectionCoordinator&) = delete;

    void setCallbacks(CoordinatorCallbacks callbacks);
    void setDispatcher(Dispatcher dispatcher);

    // Starts advertising, browsing and the periodic timers.
    void start();
    // Cancels all timers and in-flight retries, drops every session and
    // clears all in-memory peer state. Must not be called from a callback.
    void stop();
    bool isRunning() const;

    // Foreground runs a sweep right away; both modes re-arm the sweep timer
    // with their own interval.
    void setAppMode(AppMode mode);
    AppMode appMode() const;

    // Tears the session down and comes back under a fresh identity with the
    // given display name. Existing connections drop.
    PeerIdentity rebindIdentity(const std::string& display_name);

    void setLocalProfile(const UserProfile& profile);
    std::optional<UserProfile> localProfile() const;

    // Without targets the message goes to connectedPeers() as of this call;
    // an empty target set is a no-op.
    void send(const ChatMessage& message, const std::optional<PeerList>& targets = std::nullopt);
    void shareProfile(const std::optional<PeerList>& targets = std::nullopt);
    void requestProfile(const PeerIdentity& peer);

    PeerList connectedPeers() const;
    PeerList pendingPeers() const;
    PeerList knownPeers() const;
    ConnectionState connectionState(const PeerIdentity& peer) const;
    std::optional<UserProfile> getProfile(const PeerIdentity& peer) const;
    int connectAttempts(const PeerIdentity& peer) const;
    PeerIdentity localIdentity() const;

    const CoordinatorConfig& config() const;
    std::shared_ptr<Telemetry> telemetry() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace peerlink

#endif // PEERLINK_CONNECTION_COORDINATOR_H
