#include "chat_node.h"

#include "chat_store.h"
#include "config_manager.h"
#include "constants.h"
#include "coordinator_config.h"
#include "lan_transport.h"
#include "logger.h"
#include "loopback_transport.h"
#include "telemetry.h"

#include <algorithm>

namespace peerlink {

namespace {

const char* const kDefaultDisplayName = "PeerLink User";
const char* const kEchoName = "Echo";

} // namespace

ChatNode::ChatNode(const ConfigManager& config)
    : m_config(config), m_telemetry(std::make_shared<Telemetry>()) {}

ChatNode::~ChatNode() {
    if (m_running) {
        stop();
    }
}

bool ChatNode::start(const std::string& display_name, const std::string& status, const std::string& transport_kind) {
    if (m_running) {
        LOG_ERROR("Node: already running");
        return false;
    }

    try {
        m_store = std::make_unique<ChatStore>(m_config.getStorePath());
        if (!m_store->load()) {
            LOG_WARN("Node: chat store unreadable, continuing with an empty one");
        }

        // The stored profile survives restarts unless the caller overrides it.
        std::optional<UserProfile> stored = m_store->loadProfile();
        std::string name = display_name;
        if (name.empty()) name = stored ? stored->displayName : kDefaultDisplayName;

        UserProfile profile = stored ? *stored : UserProfile::create(name, status);
        if (profile.displayName != name || (!status.empty() && profile.status != status)) {
            profile.displayName = name;
            if (!status.empty()) profile.status = status;
        }
        if (!m_store->saveProfile(profile)) {
            LOG_WARN("Node: could not persist profile");
        }

        const PeerIdentity identity(generate_uuid(), profile.displayName);
        if (transport_kind == "loopback") {
            m_hub = std::make_shared<LoopbackHub>();
            m_transport = m_hub->createEndpoint(identity);
        } else if (transport_kind == "lan") {
            m_transport = std::make_shared<LanTransport>(LanTransportConfig::fromConfig(m_config), identity);
        } else {
            LOG_ERROR("Node: unknown transport \"" + transport_kind + "\"");
            return false;
        }
        m_transport_kind = transport_kind;

        Telemetry::Config tcfg;
        tcfg.enabled = m_config.isTelemetryEnabled();
        tcfg.flush_interval_ms = m_config.getTelemetryFlushIntervalMs();
        tcfg.file_path = m_config.getTelemetryFilePath();
        m_telemetry->initialize(identity.id, tcfg);

        m_coordinator = std::make_unique<ConnectionCoordinator>(
            m_transport, CoordinatorConfig::fromConfig(m_config), m_telemetry);
        m_coordinator->setLocalProfile(profile);
        wireCoordinator();
        m_coordinator->start();

        if (m_hub) {
            startEchoPeer();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Node: failed to start: ") + e.what());
        m_echo.reset();
        m_coordinator.reset();
        m_transport.reset();
        m_hub.reset();
        return false;
    }

    m_running = true;
    LOG_INFO("Node: started as " + identity().describe() + " over " + m_transport_kind);
    return true;
}

void ChatNode::stop() {
    if (!m_running) return;
    m_running = false;

    LOG_INFO("Node: stopping");
    if (m_echo) m_echo->stop();
    if (m_coordinator) m_coordinator->stop();
    m_echo.reset();
    m_coordinator.reset();
    m_transport.reset();
    m_hub.reset();
}

bool ChatNode::isRunning() const {
    return m_running;
}

void ChatNode::wireCoordinator() {
    CoordinatorCallbacks cb;

    cb.onMessageReceived = [this](const ChatMessage& message, const PeerIdentity& from) {
        ChatMessage stored = message;
        stored.status = MessageStatus::DELIVERED;
        if (!m_store->appendMessage(from.id, titleFor(from), stored)) {
            LOG_WARN("Node: could not store message " + message.id.substr(0, 8));
        }
        if (auto fn = events().onMessage) fn(message, from);
    };

    cb.onPeerListChanged = [](const std::vector<PeerIdentity>& connected) {
        LOG_DEBUG("Node: " + std::to_string(connected.size()) + " peer(s) connected");
    };

    cb.onProfileReceived = [this](const UserProfile& profile, const PeerIdentity& from) {
        if (auto fn = events().onProfile) fn(profile, from);
    };

    cb.onConnectionStateChanged = [this](const PeerIdentity& peer, ConnectionState state) {
        if (auto fn = events().onPeerState) fn(peer, state);
    };

    cb.onMessageStatusChanged = [this](const std::string& message_id, MessageStatus status) {
        if (!m_store->updateMessageStatus(message_id, status)) {
            LOG_DEBUG("Node: status for unknown message " + message_id.substr(0, 8));
        }
        if (auto fn = events().onMessageStatus) fn(message_id, status);
    };

    m_coordinator->setCallbacks(std::move(cb));
}

// A second coordinator on the same hub that answers every message.
void ChatNode::startEchoPeer() {
    auto endpoint = m_hub->createEndpoint(PeerIdentity(generate_uuid(), kEchoName));
    CoordinatorConfig cfg = CoordinatorConfig::fromConfig(m_config);
    m_echo = std::make_unique<ConnectionCoordinator>(endpoint, cfg);
    m_echo->setLocalProfile(UserProfile::create(kEchoName, "Repeats whatever you say"));

    ConnectionCoordinator* echo = m_echo.get();
    CoordinatorCallbacks cb;
    cb.onMessageReceived = [echo](const ChatMessage& message, const PeerIdentity& from) {
        echo->send(ChatMessage::compose(kEchoName, message.text), ConnectionCoordinator::PeerList{from});
    };
    m_echo->setCallbacks(std::move(cb));
    m_echo->start();
}

std::optional<ChatMessage> ChatNode::sendTo(const PeerIdentity& peer, const std::string& text) {
    if (!m_coordinator || m_coordinator->connectionState(peer) != ConnectionState::Connected) {
        return std::nullopt;
    }
    const auto profile = m_coordinator->localProfile();
    ChatMessage message = ChatMessage::compose(profile ? profile->displayName : identity().displayName, text);
    if (!m_store->appendMessage(peer.id, titleFor(peer), message)) {
        LOG_WARN("Node: could not store outgoing message");
    }
    m_coordinator->send(message, ConnectionCoordinator::PeerList{peer});
    return message;
}

size_t ChatNode::broadcast(const std::string& text) {
    if (!m_coordinator) return 0;
    const auto peers = m_coordinator->connectedPeers();
    if (peers.empty()) return 0;

    const auto profile = m_coordinator->localProfile();
    ChatMessage message = ChatMessage::compose(profile ? profile->displayName : identity().displayName, text);
    for (const auto& peer : peers) {
        if (!m_store->appendMessage(peer.id, titleFor(peer), message)) {
            LOG_WARN("Node: could not store broadcast for " + peer.describe());
        }
    }
    m_coordinator->send(message, peers);
    return peers.size();
}

void ChatNode::requestProfile(const PeerIdentity& peer) {
    if (m_coordinator) m_coordinator->requestProfile(peer);
}

PeerIdentity ChatNode::rename(const std::string& display_name) {
    if (!m_coordinator) return PeerIdentity();

    UserProfile profile = m_coordinator->localProfile().value_or(UserProfile::create(display_name, ""));
    profile.displayName = display_name;
    m_coordinator->setLocalProfile(profile);
    if (!m_store->saveProfile(profile)) {
        LOG_WARN("Node: could not persist profile");
    }
    return m_coordinator->rebindIdentity(display_name);
}

void ChatNode::setStatus(const std::string& status) {
    if (!m_coordinator) return;

    UserProfile profile = m_coordinator->localProfile().value_or(UserProfile::create(identity().displayName, status));
    profile.status = status.empty() ? DEFAULT_PROFILE_STATUS : status;
    m_coordinator->setLocalProfile(profile);
    if (!m_store->saveProfile(profile)) {
        LOG_WARN("Node: could not persist profile");
    }
    m_coordinator->shareProfile();
}

void ChatNode::setAppMode(AppMode mode) {
    if (m_coordinator) m_coordinator->setAppMode(mode);
}

PeerIdentity ChatNode::identity() const {
    return m_coordinator ? m_coordinator->localIdentity() : PeerIdentity();
}

std::optional<UserProfile> ChatNode::localProfile() const {
    return m_coordinator ? m_coordinator->localProfile() : std::nullopt;
}

std::vector<PeerIdentity> ChatNode::connectedPeers() const {
    return m_coordinator ? m_coordinator->connectedPeers() : std::vector<PeerIdentity>{};
}

std::vector<PeerIdentity> ChatNode::knownPeers() const {
    return m_coordinator ? m_coordinator->knownPeers() : std::vector<PeerIdentity>{};
}

ConnectionState ChatNode::connectionState(const PeerIdentity& peer) const {
    return m_coordinator ? m_coordinator->connectionState(peer) : ConnectionState::Disconnected;
}

std::optional<UserProfile> ChatNode::profileOf(const PeerIdentity& peer) const {
    return m_coordinator ? m_coordinator->getProfile(peer) : std::nullopt;
}

std::optional<ChatThread> ChatNode::history(const std::string& peer_id) const {
    if (!m_store) return std::nullopt;
    for (const auto& thread : m_store->loadThreads()) {
        if (thread.peerID == peer_id) return thread;
    }
    return std::nullopt;
}

std::string ChatNode::statsJson() const {
    return m_telemetry->snapshot_json("cli");
}

std::optional<PeerIdentity> ChatNode::resolvePeer(const std::string& query, std::vector<std::string>* matches) const {
    if (query.empty()) return std::nullopt;

    std::vector<PeerIdentity> found;
    for (const auto& peer : knownPeers()) {
        if (peer.id == query || peer.displayName == query) {
            return peer;
        }
        if (peer.id.compare(0, query.size(), query) == 0) {
            found.push_back(peer);
        }
    }
    if (matches) {
        matches->clear();
        for (const auto& p : found) matches->push_back(p.describe());
    }
    if (found.size() == 1) return found.front();
    return std::nullopt;
}

void ChatNode::setEventCallbacks(ChatNodeEvents events) {
    std::lock_guard<std::mutex> lock(m_events_mutex);
    m_events = std::move(events);
}

void ChatNode::clearEventCallbacks() {
    std::lock_guard<std::mutex> lock(m_events_mutex);
    m_events = ChatNodeEvents{};
}

std::string ChatNode::titleFor(const PeerIdentity& peer) const {
    if (auto profile = profileOf(peer)) {
        return profile->displayName;
    }
    return peer.displayName;
}

ChatNodeEvents ChatNode::events() const {
    std::lock_guard<std::mutex> lock(m_events_mutex);
    return m_events;
}

} // namespace peerlink
