#pragma once

#include "chat_models.h"
#include "connection_coordinator.h"
#include "peer_identity.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

class ChatStore;
class ConfigManager;
class LoopbackHub;
class Telemetry;
class TransportAdapter;

// UI hooks. They fire on the coordinator's event thread.
struct ChatNodeEvents {
    std::function<void(const ChatMessage&, const PeerIdentity& from)> onMessage;
    std::function<void(const PeerIdentity&, ConnectionState)> onPeerState;
    std::function<void(const UserProfile&, const PeerIdentity& from)> onProfile;
    std::function<void(const std::string& message_id, MessageStatus)> onMessageStatus;
};

/**
 * @brief Desktop node: one transport, one coordinator and the chat store.
 *
 * Sent and received messages land in per-peer threads; message status
 * updates from the coordinator are written back to the store. In loopback
 * mode an in-process echo peer shares the mesh so the shell works offline.
 */
class ChatNode {
public:
    explicit ChatNode(const ConfigManager& config);
    ~ChatNode();

    ChatNode(const ChatNode&) = delete;
    ChatNode& operator=(const ChatNode&) = delete;

    // transport_kind: "lan" or "loopback". An empty status keeps the stored one.
    bool start(const std::string& display_name, const std::string& status, const std::string& transport_kind);
    void stop();
    bool isRunning() const;

    // nullopt when the peer is not connected.
    std::optional<ChatMessage> sendTo(const PeerIdentity& peer, const std::string& text);
    // Returns the number of peers targeted (0 = nothing sent).
    size_t broadcast(const std::string& text);

    void requestProfile(const PeerIdentity& peer);
    // New identity under the given name; existing connections drop.
    PeerIdentity rename(const std::string& display_name);
    void setStatus(const std::string& status);
    void setAppMode(AppMode mode);

    PeerIdentity identity() const;
    std::optional<UserProfile> localProfile() const;
    std::vector<PeerIdentity> connectedPeers() const;
    std::vector<PeerIdentity> knownPeers() const;
    ConnectionState connectionState(const PeerIdentity& peer) const;
    std::optional<UserProfile> profileOf(const PeerIdentity& peer) const;
    std::optional<ChatThread> history(const std::string& peer_id) const;
    std::string transportKind() const { return m_transport_kind; }
    std::string statsJson() const;

    // Unique match of an id prefix or display name among known peers.
    std::optional<PeerIdentity> resolvePeer(const std::string& query, std::vector<std::string>* matches = nullptr) const;

    void setEventCallbacks(ChatNodeEvents events);
    void clearEventCallbacks();

private:
    void wireCoordinator();
    void startEchoPeer();
    std::string titleFor(const PeerIdentity& peer) const;
    ChatNodeEvents events() const;

    const ConfigManager& m_config;
    std::shared_ptr<Telemetry> m_telemetry;
    std::unique_ptr<ChatStore> m_store;

    std::shared_ptr<LoopbackHub> m_hub;
    std::shared_ptr<TransportAdapter> m_transport;
    std::unique_ptr<ConnectionCoordinator> m_coordinator;
    std::unique_ptr<ConnectionCoordinator> m_echo;
    std::string m_transport_kind;
    bool m_running = false;

    mutable std::mutex m_events_mutex;
    ChatNodeEvents m_events;
};

} // namespace peerlink
