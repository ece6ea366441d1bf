#include "connection_coordinator.h"

#include "connect_retry_policy.h"
#include "coordinator_event_loop.h"
#include "delivery_retry_engine.h"
#include "envelope_codec.h"
#include "event_thread_pool.h"
#include "logger.h"
#include "peer_state_machine.h"
#include "profile_exchange.h"
#include "telemetry.h"
#include "transport_adapter.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <type_traits>
#include <variant>

namespace peerlink {

namespace {

const char* const kSweepTimer = "reconnect-sweep";
const char* const kQualityTimer = "quality-check";
const char* const kTelemetryTimer = "telemetry-flush";
const char* const kDiscoveryRestartTimer = "discovery-restart";

std::string profileExchangeTimer(const std::string& peer_id) { return "profile-exchange:" + peer_id; }
std::string deferredInviteTimer(const std::string& peer_id) { return "deferred-invite:" + peer_id; }
std::string discoveryRetryTimer(DiscoveryOperation op) {
    return std::string("discovery-retry:") + discovery_operation_to_string(op);
}

PeerEvent toPeerEvent(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return PeerEvent::TRANSPORT_CONNECTING;
        case ConnectionState::Connected: return PeerEvent::TRANSPORT_CONNECTED;
        case ConnectionState::Disconnected:
        default: return PeerEvent::TRANSPORT_DISCONNECTED;
    }
}

// Answers the transport's "accept this invitation?" question from whatever
// thread the transport runs it on. Invitations carrying our own id are refused.
class InvitationFilter {
public:
    explicit InvitationFilter(std::string local_id) : m_local_id(std::move(local_id)) {}

    void setLocalId(const std::string& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_local_id = id;
    }

    bool accept(const PeerIdentity& from) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (from.id == m_local_id) {
            LOG_WARN("PC: rejecting invitation carrying our own id " + from.id.substr(0, 8));
            return false;
        }
        return true;
    }

private:
    mutable std::mutex m_mutex;
    std::string m_local_id;
};

} // namespace

class ConnectionCoordinator::Impl {
public:
    Impl(std::shared_ptr<TransportAdapter> transport, const CoordinatorConfig& config,
         std::shared_ptr<Telemetry> telemetry)
        : m_transport(std::move(transport)),
          m_config(config),
          m_telemetry(std::move(telemetry)),
          m_loop(std::make_shared<CoordinatorEventLoop>()),
          m_retry(config.max_connect_attempts, config.connect_backoff_base),
          m_identity(m_transport->localIdentity()),
          m_filter(std::make_shared<InvitationFilter>(m_identity.id)) {}

    ~Impl() { stop(); }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------
    void start() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        if (m_running.load()) {
            LOG_WARN("PC: start() called while running");
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_delivery_mutex);
            m_delivery.reset();
            m_pool.reset();
            m_pool = std::make_unique<EventThreadPool>(
                static_cast<size_t>(std::max(1, m_config.sender_workers)));

            DeliveryRetryEngine::Config dcfg;
            dcfg.max_retry_attempts = m_config.delivery_max_retry_attempts;
            dcfg.base_interval = m_config.delivery_base_interval;
            m_delivery = std::make_unique<DeliveryRetryEngine>(
                *m_transport, *m_loop, m_pool.get(), m_telemetry.get(), dcfg);
        }

        m_restart_in_progress = false;
        m_running.store(true);
        m_loop->start([this](const CoordinatorEvent& event) { handleEvent(event); });
        m_transport->setCallbacks(makeTransportCallbacks());

        LOG_INFO("PC: starting as " + localIdentity().describe());
        m_loop->post([this]() {
            startDiscovery();
            armSweep();
            armQualityCheck();
            armTelemetryFlush();
        });
    }

    void stop() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        if (!m_running.exchange(false)) return;

        LOG_INFO("PC: stopping");
        m_transport->setCallbacks(TransportCallbacks{});
        m_transport->stopAdvertising();
        m_transport->stopBrowsing();
        m_transport->disconnect();

        if (m_pool) m_pool->shutdown(true);
        {
            std::lock_guard<std::mutex> lock(m_delivery_mutex);
            if (m_delivery) m_delivery->cancelAll();
        }
        m_loop->stop();

        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_peers.clear();
            m_pending.clear();
            m_retry.clear_all();
        }
        m_profiles.clearPeers();
        updateGauges();

        if (m_telemetry) m_telemetry->flush("shutdown");
    }

    bool isRunning() const { return m_running.load(); }

    void setCallbacks(CoordinatorCallbacks callbacks) {
        std::lock_guard<std::mutex> lock(m_callbacks_mutex);
        m_callbacks = std::move(callbacks);
    }

    void setDispatcher(Dispatcher dispatcher) {
        std::lock_guard<std::mutex> lock(m_callbacks_mutex);
        m_dispatcher = std::move(dispatcher);
    }

    void setAppMode(AppMode mode) {
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_mode = mode;
        }
        if (!m_running.load()) return;

        m_loop->post([this, mode]() {
            if (mode == AppMode::Foreground) {
                LOG_INFO("PC: foreground, sweeping now");
                sweep();
            } else {
                LOG_INFO("PC: background, slowing the reconnect sweep");
            }
            armSweep();
        });
    }

    AppMode appMode() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_mode;
    }

    PeerIdentity rebindIdentity(const std::string& display_name) {
        PeerIdentity fresh(generate_uuid(), display_name);
        if (!m_running.load()) {
            m_transport->rebind(fresh);
            {
                std::lock_guard<std::mutex> lock(m_state_mutex);
                m_identity = fresh;
            }
            m_filter->setLocalId(fresh.id);
            LOG_INFO("PC: identity is now " + fresh.describe());
            return fresh;
        }
        m_loop->post([this, fresh]() { performRebind(fresh); });
        return fresh;
    }

    // ------------------------------------------------------------------
    // Messaging
    // ------------------------------------------------------------------
    void send(const ChatMessage& message, const std::optional<PeerList>& targets) {
        PeerList resolved = targets ? *targets : connectedPeers();
        if (resolved.empty()) {
            LOG_DEBUG("PC: no target peers, message " + message.id.substr(0, 8) + " not sent");
            return;
        }

        const std::string message_id = message.id;
        submit(Envelope::chat(message), resolved, [this, message_id](bool delivered) {
            notifyMessageStatus(message_id, delivered ? MessageStatus::SENT : MessageStatus::FAILED);
        });
    }

    void shareProfile(const std::optional<PeerList>& targets) {
        auto profile = m_profiles.localProfile();
        if (!profile) {
            LOG_DEBUG("PX: no local profile to share");
            return;
        }
        PeerList resolved = targets ? *targets : connectedPeers();
        if (resolved.empty()) return;

        LOG_DEBUG("PX: sharing profile with " + std::to_string(resolved.size()) + " peer(s)");
        submit(Envelope::profile(*profile), resolved, {});
    }

    void requestProfile(const PeerIdentity& peer) {
        LOG_DEBUG("PX: requesting profile from " + peer.describe());
        submit(Envelope::profileRequest(), {peer}, {});
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------
    PeerList connectedPeers() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        PeerList out;
        for (const auto& kv : m_peers) {
            if (kv.second.state == ConnectionState::Connected) out.push_back(kv.second.peer);
        }
        return out;
    }

    PeerList pendingPeers() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        PeerList out;
        for (const auto& id : m_pending) {
            auto it = m_peers.find(id);
            if (it != m_peers.end()) out.push_back(it->second.peer);
        }
        return out;
    }

    PeerList knownPeers() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        PeerList out;
        out.reserve(m_peers.size());
        for (const auto& kv : m_peers) out.push_back(kv.second.peer);
        return out;
    }

    ConnectionState connectionState(const PeerIdentity& peer) const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        auto it = m_peers.find(peer.id);
        return it == m_peers.end() ? ConnectionState::Disconnected : it->second.state;
    }

    int connectAttempts(const PeerIdentity& peer) const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_retry.attempts(peer.id);
    }

    PeerIdentity localIdentity() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_identity;
    }

    ProfileExchange& profiles() { return m_profiles; }
    const ProfileExchange& profiles() const { return m_profiles; }
    const CoordinatorConfig& config() const { return m_config; }
    std::shared_ptr<Telemetry> telemetry() const { return m_telemetry; }

private:
    // ------------------------------------------------------------------
    // Event dispatch (event thread)
    // ------------------------------------------------------------------
    void handleEvent(const CoordinatorEvent& event) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, PeerFoundEvent>) {
                onPeerFound(e);
            } else if constexpr (std::is_same_v<T, PeerLostEvent>) {
                onPeerLost(e);
            } else if constexpr (std::is_same_v<T, ConnectionStateEvent>) {
                onConnectionState(e);
            } else if constexpr (std::is_same_v<T, DataReceivedEvent>) {
                onData(e);
            } else if constexpr (std::is_same_v<T, DiscoveryFailedEvent>) {
                onDiscoveryFailed(e);
            } else if constexpr (std::is_same_v<T, TimerTickEvent>) {
                onTimer(e);
            }
        }, event);
    }

    TransportCallbacks makeTransportCallbacks() {
        std::weak_ptr<CoordinatorEventLoop> weak = m_loop;
        TransportCallbacks cb;

        cb.onPeerFound = [weak](const PeerIdentity& peer, const DiscoveryInfo& info) {
            if (auto loop = weak.lock()) loop->pushEvent(PeerFoundEvent{peer, info});
        };
        cb.onPeerLost = [weak](const PeerIdentity& peer) {
            if (auto loop = weak.lock()) loop->pushEvent(PeerLostEvent{peer});
        };
        cb.onConnectionStateChanged = [weak](const PeerIdentity& peer, ConnectionState state) {
            if (auto loop = weak.lock()) loop->pushEvent(ConnectionStateEvent{peer, state});
        };
        cb.onDataReceived = [weak](const std::string& data, const PeerIdentity& from) {
            if (auto loop = weak.lock())
                loop->pushEvent(DataReceivedEvent{from, data, std::chrono::steady_clock::now()});
        };
        cb.onAdvertisingFailed = [weak](const std::string& error) {
            if (auto loop = weak.lock())
                loop->pushEvent(DiscoveryFailedEvent{DiscoveryOperation::ADVERTISING, error});
        };
        cb.onBrowsingFailed = [weak](const std::string& error) {
            if (auto loop = weak.lock())
                loop->pushEvent(DiscoveryFailedEvent{DiscoveryOperation::BROWSING, error});
        };
        cb.onInvitationReceived = [filter = m_filter](const PeerIdentity& from) {
            return filter->accept(from);
        };
        return cb;
    }

    // --- discovery ---
    void onPeerFound(const PeerFoundEvent& ev) {
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            if (ev.peer.id == m_identity.id) return;

            auto it = m_peers.find(ev.peer.id);
            if (it == m_peers.end()) {
                it = m_peers.emplace(ev.peer.id, PeerContext(ev.peer)).first;
            } else {
                it->second.peer.displayName = ev.peer.displayName;
            }
            it->second.discovered = true;
            it->second.last_seen = std::chrono::steady_clock::now();
            it->second.info = ev.info;
        }

        LOG_INFO("PC: found " + ev.peer.describe());
        count("peers_found");
        maybeInvite(ev.peer.id);
    }

    void onPeerLost(const PeerLostEvent& ev) {
        bool left_pending = false;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            auto it = m_peers.find(ev.peer.id);
            if (it == m_peers.end()) return;

            it->second.discovered = false;
            it->second.last_seen = std::chrono::steady_clock::now();
            FSMResult r = m_fsm.handle_event(it->second, PeerEvent::PEER_LOST);
            left_pending = r.has(PeerAction::LEAVE_PENDING);
            applyActions(it->second, r);
        }

        m_loop->cancel(deferredInviteTimer(ev.peer.id));
        LOG_INFO("PC: lost " + ev.peer.describe());
        count("peers_lost");
        updateGauges();

        if (left_pending) notifyConnectionState(ev.peer, ConnectionState::Disconnected);
        notifyPeerListChanged();
    }

    // Invites a discovered, Disconnected peer unless its retry record says
    // to wait (a deferred invite is scheduled) or it hit the attempt cap.
    void maybeInvite(const std::string& peer_id) {
        if (!m_running.load()) return;

        PeerIdentity target;
        int attempt = 0;
        std::chrono::milliseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            auto it = m_peers.find(peer_id);
            if (it == m_peers.end() || !it->second.discovered) return;

            PeerContext& ctx = it->second;
            if (ctx.state != ConnectionState::Disconnected) {
                LOG_DEBUG("PC: not inviting " + ctx.peer.describe() + ", already " +
                          connection_state_to_string(ctx.state));
                return;
            }

            const auto now = std::chrono::steady_clock::now();
            const auto verdict = m_retry.evaluate(peer_id, now);
            switch (verdict.decision) {
                case ConnectRetryPolicy::Decision::CAPPED:
                    LOG_DEBUG("PC: " + ctx.peer.describe() + " reached " +
                              std::to_string(verdict.attempts) + " attempts, ignoring");
                    return;
                case ConnectRetryPolicy::Decision::DEFER:
                    wait = verdict.wait;
                    break;
                case ConnectRetryPolicy::Decision::INVITE_NOW: {
                    attempt = m_retry.record_attempt(peer_id, now);
                    FSMResult r = m_fsm.handle_event(ctx, PeerEvent::INVITE_SENT);
                    applyActions(ctx, r);
                    target = ctx.peer;
                    break;
                }
            }
        }

        if (attempt == 0) {
            LOG_DEBUG("PC: deferring invite to " + peer_id.substr(0, 8) + " by " +
                      std::to_string(wait.count()) + "ms");
            m_loop->schedule(deferredInviteTimer(peer_id), wait, [this, peer_id]() { maybeInvite(peer_id); });
            return;
        }

        LOG_INFO("PC: inviting " + target.describe() + " (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(m_config.max_connect_attempts) + ")");
        count("invites_sent");
        updateGauges();
        m_transport->invite(target, m_config.invite_timeout_sec);
    }

    // --- sessions ---
    void onConnectionState(const ConnectionStateEvent& ev) {
        const std::string& id = ev.peer.id;
        bool schedule_exchange = false;
        bool failed_handshake = false;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            if (id == m_identity.id) return;

            auto it = m_peers.find(id);
            if (it == m_peers.end()) {
                if (ev.state == ConnectionState::Disconnected) {
                    LOG_DEBUG("PC: Disconnected for unknown peer " + ev.peer.describe());
                    return;
                }
                it = m_peers.emplace(id, PeerContext(ev.peer)).first;
            }

            PeerContext& ctx = it->second;
            const ConnectionState before = ctx.state;
            FSMResult r = m_fsm.handle_event(ctx, toPeerEvent(ev.state));
            applyActions(ctx, r);

            if (ev.state == ConnectionState::Connected) ctx.last_seen = std::chrono::steady_clock::now();
            schedule_exchange = r.has(PeerAction::SCHEDULE_PROFILE_EXCHANGE);
            // A handshake that never reached Connected keeps its retry record
            failed_handshake = before == ConnectionState::Connecting &&
                               ev.state == ConnectionState::Disconnected &&
                               ctx.discovered && m_retry.attempts(id) > 0;
        }

        LOG_INFO("PC: " + ev.peer.describe() + " is " + connection_state_to_string(ev.state));

        if (schedule_exchange) {
            const PeerIdentity peer = ev.peer;
            m_loop->schedule(profileExchangeTimer(id), m_config.profile_exchange_delay,
                             [this, peer]() { exchangeProfiles(peer); });
        }
        if (ev.state == ConnectionState::Disconnected) {
            m_loop->cancel(profileExchangeTimer(id));
        }

        updateGauges();
        notifyConnectionState(ev.peer, ev.state);
        notifyPeerListChanged();

        if (failed_handshake) maybeInvite(id);
    }

    void exchangeProfiles(const PeerIdentity& peer) {
        if (connectionState(peer) != ConnectionState::Connected) {
            LOG_DEBUG("PX: skipping exchange, " + peer.describe() + " no longer connected");
            return;
        }
        shareProfile(PeerList{peer});
        requestProfile(peer);
    }

    // --- inbound envelopes ---
    void onData(const DataReceivedEvent& ev) {
        count("envelopes_received");
        EnvelopeCodec::DecodeResult decoded = EnvelopeCodec::decode(ev.data);
        if (!decoded.envelope) {
            LOG_WARN("PC: dropping undecodable payload from " + ev.from.describe() + ": " + decoded.error);
            count("decode_failures");
            return;
        }
        if (decoded.legacy) {
            LOG_DEBUG("PC: legacy message from " + ev.from.describe());
            count("legacy_decodes");
        }

        std::visit([this, &ev](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;

            if constexpr (std::is_same_v<T, ChatMessage>) {
                count("messages_received");
                notifyMessage(payload, ev.from);
            } else if constexpr (std::is_same_v<T, UserProfile>) {
                count("profiles_received");
                if (connectionState(ev.from) != ConnectionState::Connected) {
                    LOG_DEBUG("PX: ignoring profile from unconnected " + ev.from.describe());
                    return;
                }
                m_profiles.store(ev.from.id, payload);
                notifyProfile(payload, ev.from);
            } else if constexpr (std::is_same_v<T, ProfileRequest>) {
                count("profile_requests_received");
                shareProfile(PeerList{ev.from});
            }
        }, decoded.envelope->payload);
    }

    // --- discovery failures ---
    void onDiscoveryFailed(const DiscoveryFailedEvent& ev) {
        const DiscoveryOperation op = ev.operation;
        LOG_WARN(std::string("PC: ") + discovery_operation_to_string(op) + " failed: " + ev.error +
                 ", retrying in " + std::to_string(m_config.discovery_retry_delay.count()) + "ms");
        count("discovery_failures");

        m_loop->schedule(discoveryRetryTimer(op), m_config.discovery_retry_delay, [this, op]() {
            if (!m_running.load()) return;
            if (op == DiscoveryOperation::ADVERTISING) {
                m_transport->startAdvertising();
            } else {
                m_transport->startBrowsing();
            }
        });
    }

    // --- timers ---
    void onTimer(const TimerTickEvent& ev) {
        switch (ev.kind) {
            case TimerKind::RECONNECT_SWEEP:
                sweep();
                armSweep();
                break;
            case TimerKind::QUALITY_CHECK:
                qualityCheck();
                armQualityCheck();
                break;
            case TimerKind::TELEMETRY_FLUSH:
                if (m_telemetry) m_telemetry->flush("periodic");
                armTelemetryFlush();
                break;
        }
    }

    void armSweep() {
        const auto interval = appMode() == AppMode::Foreground ? m_config.sweep_foreground
                                                               : m_config.sweep_background;
        m_loop->addScheduledEvent(kSweepTimer, TimerTickEvent{TimerKind::RECONNECT_SWEEP},
                                  CoordinatorEventLoop::Clock::now() + interval);
    }

    void armQualityCheck() {
        if (!m_config.quality_check_enabled) return;
        m_loop->addScheduledEvent(kQualityTimer, TimerTickEvent{TimerKind::QUALITY_CHECK},
                                  CoordinatorEventLoop::Clock::now() + m_config.quality_check_interval);
    }

    void armTelemetryFlush() {
        if (!m_telemetry || !m_telemetry->is_enabled()) return;
        m_loop->addScheduledEvent(kTelemetryTimer, TimerTickEvent{TimerKind::TELEMETRY_FLUSH},
                                  CoordinatorEventLoop::Clock::now() + m_config.telemetry_flush_interval);
    }

    /**
     * Periodic maintenance:
     *  - pending handshakes older than stale_handshake are dropped
     *  - retry records of peers the transport reports connected are cleared
     *  - discovery restarts when nothing is connected or pending
     *  - undiscovered, disconnected peers are forgotten after peer_expiry
     */
    void sweep() {
        const PeerList transport_connected = m_transport->connectedPeers();
        const auto now = std::chrono::steady_clock::now();

        PeerList stale;
        size_t expired = 0;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);

            std::vector<std::string> stale_ids;
            for (const auto& id : m_pending) {
                auto it = m_peers.find(id);
                if (it == m_peers.end() || now - it->second.pending_since >= m_config.stale_handshake) {
                    stale_ids.push_back(id);
                }
            }
            for (const auto& id : stale_ids) {
                auto it = m_peers.find(id);
                if (it == m_peers.end()) {
                    m_pending.erase(id);
                    continue;
                }
                FSMResult r = m_fsm.handle_event(it->second, PeerEvent::HANDSHAKE_STALE);
                applyActions(it->second, r);
                m_pending.erase(id);
                stale.push_back(it->second.peer);
            }

            for (const auto& peer : transport_connected) m_retry.clear(peer.id);

            for (auto it = m_peers.begin(); it != m_peers.end();) {
                const PeerContext& ctx = it->second;
                if (ctx.state == ConnectionState::Disconnected && !ctx.discovered &&
                    now - ctx.last_seen >= m_config.peer_expiry &&
                    now - ctx.last_state_change >= m_config.peer_expiry) {
                    m_retry.clear(it->first);
                    m_profiles.evict(it->first);
                    it = m_peers.erase(it);
                    ++expired;
                } else {
                    ++it;
                }
            }

            size_t connected = 0;
            for (const auto& kv : m_peers) {
                if (kv.second.state == ConnectionState::Connected) ++connected;
            }
            idle = transport_connected.empty() && connected == 0 && m_pending.empty();
        }

        LOG_DEBUG("PC: sweep stale=" + std::to_string(stale.size()) + " expired=" +
                  std::to_string(expired) + (idle ? " idle" : ""));

        for (const auto& peer : stale) {
            LOG_WARN("PC: handshake with " + peer.describe() + " went stale");
            count("stale_handshakes");
            m_loop->cancel(deferredInviteTimer(peer.id));
            notifyConnectionState(peer, ConnectionState::Disconnected);
        }
        if (!stale.empty()) notifyPeerListChanged();
        updateGauges();

        if (idle) restartDiscovery("no connected or pending peers");
    }

    // connected < pending suggests discovery is stuck; bounce it.
    void qualityCheck() {
        size_t connected = 0;
        size_t pending = 0;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            for (const auto& kv : m_peers) {
                if (kv.second.state == ConnectionState::Connected) ++connected;
            }
            pending = m_pending.size();
        }
        if (connected < pending) {
            restartDiscovery("connected=" + std::to_string(connected) + " < pending=" + std::to_string(pending));
        }
    }

    void startDiscovery() {
        m_transport->startAdvertising();
        m_transport->startBrowsing();
    }

    void restartDiscovery(const std::string& reason) {
        if (m_restart_in_progress) {
            LOG_DEBUG("PC: discovery restart already in progress");
            return;
        }
        m_restart_in_progress = true;
        LOG_INFO("PC: restarting discovery (" + reason + ")");
        count("discovery_restarts");

        m_transport->stopAdvertising();
        m_transport->stopBrowsing();
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            for (auto& kv : m_peers) kv.second.discovered = false;
        }

        m_loop->schedule(kDiscoveryRestartTimer, m_config.discovery_settle, [this]() {
            m_restart_in_progress = false;
            if (m_running.load()) startDiscovery();
        });
    }

    void performRebind(const PeerIdentity& fresh) {
        LOG_INFO("PC: rebinding identity as " + fresh.describe());

        m_transport->stopAdvertising();
        m_transport->stopBrowsing();
        m_transport->disconnect();

        PeerList dropped;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            for (auto& kv : m_peers) {
                m_loop->cancel(profileExchangeTimer(kv.first));
                m_loop->cancel(deferredInviteTimer(kv.first));
                if (kv.second.state != ConnectionState::Disconnected) {
                    m_fsm.handle_event(kv.second, PeerEvent::SHUTDOWN);
                    dropped.push_back(kv.second.peer);
                }
            }
            m_peers.clear();
            m_pending.clear();
            m_retry.clear_all();
            m_identity = fresh;
        }
        m_profiles.clearPeers();

        for (const char* id : {kSweepTimer, kQualityTimer, kTelemetryTimer, kDiscoveryRestartTimer}) {
            m_loop->cancel(id);
        }
        m_loop->cancel(discoveryRetryTimer(DiscoveryOperation::ADVERTISING));
        m_loop->cancel(discoveryRetryTimer(DiscoveryOperation::BROWSING));
        m_restart_in_progress = false;

        m_transport->rebind(fresh);
        m_filter->setLocalId(fresh.id);

        for (const auto& peer : dropped) notifyConnectionState(peer, ConnectionState::Disconnected);
        notifyPeerListChanged();
        updateGauges();

        startDiscovery();
        armSweep();
        armQualityCheck();
        armTelemetryFlush();
    }

    // Runs under m_state_mutex. SCHEDULE_PROFILE_EXCHANGE is left to the caller.
    void applyActions(const PeerContext& ctx, const FSMResult& result) {
        const std::string& id = ctx.peer.id;
        for (PeerAction action : result.actions) {
            switch (action) {
                case PeerAction::ENTER_PENDING: m_pending.insert(id); break;
                case PeerAction::LEAVE_PENDING: m_pending.erase(id); break;
                case PeerAction::CLEAR_RETRY: m_retry.clear(id); break;
                case PeerAction::EVICT_PROFILE: m_profiles.evict(id); break;
                case PeerAction::SCHEDULE_PROFILE_EXCHANGE: break;
            }
        }
    }

    void submit(const Envelope& envelope, const PeerList& targets, DeliveryRetryEngine::Completion completion) {
        std::lock_guard<std::mutex> lock(m_delivery_mutex);
        if (!m_running.load() || !m_delivery) {
            LOG_WARN(std::string("PC: not running, dropping ") + envelope_kind_to_string(envelope.kind()));
            return;
        }
        m_delivery->sendWithRetry(envelope, targets, std::move(completion));
    }

    // ------------------------------------------------------------------
    // Outbound notifications
    // ------------------------------------------------------------------
    void notify(std::function<void()> fn) {
        Dispatcher dispatcher;
        {
            std::lock_guard<std::mutex> lock(m_callbacks_mutex);
            dispatcher = m_dispatcher;
        }
        auto guarded = [fn = std::move(fn)]() {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("PC: callback threw: ") + e.what());
            }
        };
        if (dispatcher) {
            dispatcher(std::move(guarded));
        } else {
            guarded();
        }
    }

    CoordinatorCallbacks callbacks() {
        std::lock_guard<std::mutex> lock(m_callbacks_mutex);
        return m_callbacks;
    }

    void notifyMessage(const ChatMessage& message, const PeerIdentity& from) {
        auto cb = callbacks().onMessageReceived;
        if (cb) notify([cb, message, from]() { cb(message, from); });
    }

    void notifyProfile(const UserProfile& profile, const PeerIdentity& from) {
        auto cb = callbacks().onProfileReceived;
        if (cb) notify([cb, profile, from]() { cb(profile, from); });
    }

    void notifyConnectionState(const PeerIdentity& peer, ConnectionState state) {
        auto cb = callbacks().onConnectionStateChanged;
        if (cb) notify([cb, peer, state]() { cb(peer, state); });
    }

    void notifyPeerListChanged() {
        auto cb = callbacks().onPeerListChanged;
        if (!cb) return;
        PeerList peers = connectedPeers();
        notify([cb, peers]() { cb(peers); });
    }

    void notifyMessageStatus(const std::string& message_id, MessageStatus status) {
        auto cb = callbacks().onMessageStatusChanged;
        if (cb) notify([cb, message_id, status]() { cb(message_id, status); });
    }

    void count(const std::string& name) {
        if (m_telemetry) m_telemetry->inc_counter(name);
    }

    void updateGauges() {
        if (!m_telemetry) return;
        int64_t connected = 0;
        int64_t pending = 0;
        int64_t known = 0;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            for (const auto& kv : m_peers) {
                if (kv.second.state == ConnectionState::Connected) ++connected;
            }
            pending = static_cast<int64_t>(m_pending.size());
            known = static_cast<int64_t>(m_peers.size());
        }
        m_telemetry->set_gauge("peers_connected", connected);
        m_telemetry->set_gauge("peers_pending", pending);
        m_telemetry->set_gauge("peers_known", known);
    }

    std::shared_ptr<TransportAdapter> m_transport;
    const CoordinatorConfig m_config;
    std::shared_ptr<Telemetry> m_telemetry;

    // Declaration order matters: the engine references the pool and the loop.
    std::shared_ptr<CoordinatorEventLoop> m_loop;
    std::unique_ptr<EventThreadPool> m_pool;
    std::unique_ptr<DeliveryRetryEngine> m_delivery;
    std::mutex m_delivery_mutex;

    mutable std::mutex m_state_mutex;
    std::map<std::string, PeerContext> m_peers;
    std::set<std::string> m_pending;
    ConnectRetryPolicy m_retry;
    AppMode m_mode = AppMode::Foreground;
    PeerIdentity m_identity;

    PeerStateMachine m_fsm;
    ProfileExchange m_profiles;
    std::shared_ptr<InvitationFilter> m_filter;

    std::mutex m_callbacks_mutex;
    CoordinatorCallbacks m_callbacks;
    Dispatcher m_dispatcher;

    std::mutex m_lifecycle_mutex;
    std::atomic<bool> m_running{false};
    bool m_restart_in_progress = false;  // event thread only
};

// ======================================================================
// ConnectionCoordinator
// ======================================================================
ConnectionCoordinator::ConnectionCoordinator(std::shared_ptr<TransportAdapter> transport,
                                             const CoordinatorConfig& config,
                                             std::shared_ptr<Telemetry> telemetry)
    : m_impl(std::make_unique<Impl>(std::move(transport), config, std::move(telemetry))) {}

ConnectionCoordinator::~ConnectionCoordinator() = default;

void ConnectionCoordinator::setCallbacks(CoordinatorCallbacks callbacks) { m_impl->setCallbacks(std::move(callbacks)); }
void ConnectionCoordinator::setDispatcher(Dispatcher dispatcher) { m_impl->setDispatcher(std::move(dispatcher)); }

void ConnectionCoordinator::start() { m_impl->start(); }
void ConnectionCoordinator::stop() { m_impl->stop(); }
bool ConnectionCoordinator::isRunning() const { return m_impl->isRunning(); }

void ConnectionCoordinator::setAppMode(AppMode mode) { m_impl->setAppMode(mode); }
AppMode ConnectionCoordinator::appMode() const { return m_impl->appMode(); }

PeerIdentity ConnectionCoordinator::rebindIdentity(const std::string& display_name) {
    return m_impl->rebindIdentity(display_name);
}

void ConnectionCoordinator::setLocalProfile(const UserProfile& profile) { m_impl->profiles().setLocalProfile(profile); }
std::optional<UserProfile> ConnectionCoordinator::localProfile() const { return m_impl->profiles().localProfile(); }

void ConnectionCoordinator::send(const ChatMessage& message, const std::optional<PeerList>& targets) {
    m_impl->send(message, targets);
}

void ConnectionCoordinator::shareProfile(const std::optional<PeerList>& targets) { m_impl->shareProfile(targets); }
void ConnectionCoordinator::requestProfile(const PeerIdentity& peer) { m_impl->requestProfile(peer); }

ConnectionCoordinator::PeerList ConnectionCoordinator::connectedPeers() const { return m_impl->connectedPeers(); }
ConnectionCoordinator::PeerList ConnectionCoordinator::pendingPeers() const { return m_impl->pendingPeers(); }
ConnectionCoordinator::PeerList ConnectionCoordinator::knownPeers() const { return m_impl->knownPeers(); }

ConnectionState ConnectionCoordinator::connectionState(const PeerIdentity& peer) const {
    return m_impl->connectionState(peer);
}

std::optional<UserProfile> ConnectionCoordinator::getProfile(const PeerIdentity& peer) const {
    return m_impl->profiles().get(peer.id);
}

int ConnectionCoordinator::connectAttempts(const PeerIdentity& peer) const { return m_impl->connectAttempts(peer); }
PeerIdentity ConnectionCoordinator::localIdentity() const { return m_impl->localIdentity(); }

const CoordinatorConfig& ConnectionCoordinator::config() const { return m_impl->config(); }
std::shared_ptr<Telemetry> ConnectionCoordinator::telemetry() const { return m_impl->telemetry(); }

} // namespace peerlink
