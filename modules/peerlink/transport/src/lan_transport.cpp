#include "lan_transport.h"
#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include "wire_codec.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace peerlink {

LanTransportConfig LanTransportConfig::fromConfig(const ConfigManager& config) {
    LanTransportConfig cfg;
    cfg.discovery_port = config.getDiscoveryPort();
    cfg.session_port = config.getSessionPort();
    cfg.beacon_interval_ms = config.getBeaconIntervalMs();
    cfg.peer_lost_timeout_ms = config.getPeerLostTimeoutMs();
    return cfg;
}

namespace {

using Clock = std::chrono::steady_clock;

std::vector<sockaddr_in> get_ipv4_broadcast_targets(uint16_t port) {
    std::vector<sockaddr_in> targets;

    auto add_target = [&](in_addr addr) {
        const uint32_t host = ntohl(addr.s_addr);
        if (host == 0) return;
        for (const auto& existing : targets) {
            if (existing.sin_addr.s_addr == addr.s_addr) return;
        }
        sockaddr_in dst{};
        dst.sin_family = AF_INET;
        dst.sin_port = htons(port);
        dst.sin_addr = addr;
        targets.push_back(dst);
    };

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == 0 && ifaddr) {
        for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
            if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;
            if ((ifa->ifa_flags & IFF_BROADCAST) == 0) continue;

            if (ifa->ifa_broadaddr && ifa->ifa_broadaddr->sa_family == AF_INET) {
                add_target(reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr)->sin_addr);
                continue;
            }
            // broadcast = (ip & mask) | ~mask
            if (ifa->ifa_netmask && ifa->ifa_netmask->sa_family == AF_INET) {
                const uint32_t ip_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
                const uint32_t mask_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
                in_addr bcast{};
                bcast.s_addr = htonl((ip_h & mask_h) | (~mask_h));
                add_target(bcast);
            }
        }
        freeifaddrs(ifaddr);
    }

    // Limited broadcast also reaches nodes on this host.
    in_addr limited{};
    limited.s_addr = htonl(INADDR_BROADCAST);
    add_target(limited);
    return targets;
}

bool send_all(int fd, const std::string& data) {
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        total_sent += static_cast<size_t>(n);
    }
    return true;
}

// 1 = readable, 0 = timeout, -1 = error
int wait_readable(int fd, int timeout_ms) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);
    timeval timeout{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
    const int res = select(fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (res < 0 && errno == EINTR) return 0;
    return res;
}

int remaining_ms(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void configure_stream_socket(int fd) {
    int nodelay = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
        LOG_DEBUG("LAN: TCP_NODELAY failed: " + std::string(strerror(errno)));
    }
    // A stalled peer must not pin a sender worker forever.
    timeval send_timeout{5, 0};
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout));
}

std::string hello_payload(const PeerIdentity& identity) {
    return nlohmann::json{{"id", identity.id}, {"name", identity.displayName}}.dump();
}

bool parse_hello(const std::string& payload, PeerIdentity& out) {
    try {
        const auto j = nlohmann::json::parse(payload);
        out.id = j.at("id").get<std::string>();
        out.displayName = j.value("name", std::string());
        return !out.id.empty();
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN(std::string("LAN: malformed HELLO payload: ") + e.what());
        return false;
    }
}

int connect_with_timeout(const std::string& host, int port, int timeout_ms) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &dest.sin_addr) != 1) {
        LOG_WARN("LAN: invalid address " + host);
        return -1;
    }

    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LOG_ERROR("LAN: socket() failed: " + std::string(strerror(errno)));
        return -1;
    }

    const int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    int result = ::connect(sock, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (result < 0 && errno != EINPROGRESS) {
        LOG_DEBUG("LAN: connect to " + host + ":" + std::to_string(port) + " failed: " + strerror(errno));
        ::close(sock);
        return -1;
    }
    if (result < 0) {
        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock, &write_fds);
        timeval timeout{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
        result = select(sock + 1, nullptr, &write_fds, nullptr, &timeout);
        if (result <= 0) {
            LOG_DEBUG("LAN: connect to " + host + ":" + std::to_string(port) + " timed out");
            ::close(sock);
            return -1;
        }
        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            LOG_DEBUG("LAN: connect to " + host + ":" + std::to_string(port) + " failed: " +
                      (error ? strerror(error) : "unknown error"));
            ::close(sock);
            return -1;
        }
    }

    // Back to blocking; reads are gated by select() and writes by SO_SNDTIMEO.
    fcntl(sock, F_SETFL, flags);
    configure_stream_socket(sock);
    return sock;
}

} // namespace

class LanTransport::Impl {
public:
    Impl(const LanTransportConfig& cfg, const PeerIdentity& identity)
        : m_cfg(cfg), m_identity(identity) {}

    ~Impl() { shutdownAll(); }

    void setCallbacks(TransportCallbacks callbacks) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callbacks = std::move(callbacks);
    }

    PeerIdentity localIdentity() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_identity;
    }

    int listenPort() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_advertising ? m_listen_port : 0;
    }

    // ------------------------------------------------------------------
    // Advertising / browsing
    // ------------------------------------------------------------------

    void startAdvertising() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_advertising) return;
        }

        std::string error;
        if (!openServerSocket(error) || !ensureDiscoverySocket(error)) {
            closeServerSocket();
            LOG_ERROR("LAN: advertising failed: " + error);
            auto cb = callbacks();
            if (cb.onAdvertisingFailed) cb.onAdvertisingFailed(error);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_advertising = true;
        }
        m_accepting = true;
        m_accept_thread = std::thread(&Impl::acceptLoop, this);
        startDiscoveryThread();
        LOG_INFO("LAN: advertising on TCP port " + std::to_string(m_listen_port));
    }

    void stopAdvertising() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_advertising) return;
            m_advertising = false;
        }
        m_accepting = false;
        if (m_accept_thread.joinable()) m_accept_thread.join();
        closeServerSocket();
        stopDiscoveryThreadIfIdle();
        LOG_INFO("LAN: advertising stopped");
    }

    void startBrowsing() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_browsing) return;
        }

        std::string error;
        if (!ensureDiscoverySocket(error)) {
            LOG_ERROR("LAN: browsing failed: " + error);
            auto cb = callbacks();
            if (cb.onBrowsingFailed) cb.onBrowsingFailed(error);
            return;
        }

        std::vector<std::pair<PeerIdentity, DiscoveryInfo>> found;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_browsing = true;
            for (auto& kv : m_discovered) {
                if (kv.second.is_static && !kv.second.reported) {
                    kv.second.reported = true;
                    found.emplace_back(kv.second.identity, infoFor(kv.second));
                }
            }
        }
        startDiscoveryThread();
        LOG_INFO("LAN: browsing on UDP port " + std::to_string(m_cfg.discovery_port));

        auto cb = callbacks();
        for (const auto& f : found) {
            if (cb.onPeerFound) cb.onPeerFound(f.first, f.second);
        }
    }

    void stopBrowsing() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_browsing) return;
            m_browsing = false;
            // Forget beacon-discovered peers so the next browse reports them again.
            for (auto it = m_discovered.begin(); it != m_discovered.end();) {
                if (it->second.is_static) {
                    it->second.reported = false;
                    ++it;
                } else {
                    it = m_discovered.erase(it);
                }
            }
        }
        stopDiscoveryThreadIfIdle();
        LOG_INFO("LAN: browsing stopped");
    }

    void addStaticPeer(const PeerIdentity& peer, const std::string& host, int port) {
        DiscoveryInfo info;
        bool report = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            DiscoveredPeer& p = m_discovered[peer.id];
            p.identity = peer;
            p.host = host;
            p.port = port;
            p.last_seen = Clock::now();
            p.is_static = true;
            if (m_browsing && !p.reported) {
                p.reported = true;
                report = true;
                info = infoFor(p);
            }
        }
        if (report) {
            auto cb = callbacks();
            if (cb.onPeerFound) cb.onPeerFound(peer, info);
        }
    }

    // ------------------------------------------------------------------
    // Sessions
    // ------------------------------------------------------------------

    void invite(const PeerIdentity& peer, int timeout_seconds) {
        std::string host;
        int port = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_discovered.find(peer.id);
            if (it != m_discovered.end()) {
                host = it->second.host;
                port = it->second.port;
            }
        }
        const int timeout_ms = std::max(1, timeout_seconds) * 1000;
        spawn([this, peer, host, port, timeout_ms] { runInvite(peer, host, port, timeout_ms); });
    }

    void send(const std::string& data, const std::vector<PeerIdentity>& peers) {
        const std::string frame = wire::encode_frame(wire::FrameType::DATA, data);
        std::vector<std::string> failed;

        for (const auto& peer : peers) {
            std::shared_ptr<Session> session = findSession(peer.id);
            if (!session) {
                failed.push_back(peer.id);
                continue;
            }
            std::lock_guard<std::mutex> write_lock(session->write_mutex);
            if (session->fd < 0 || !send_all(session->fd, frame)) {
                LOG_WARN("LAN: write to " + peer.describe() + " failed: " + strerror(errno));
                failed.push_back(peer.id);
                // Wake the reader; it reports the disconnect.
                if (session->fd >= 0) ::shutdown(session->fd, SHUT_RDWR);
            }
        }

        if (!failed.empty()) {
            throw TransmitError("send failed for " + std::to_string(failed.size()) + " of " +
                                std::to_string(peers.size()) + " peer(s)", failed);
        }
    }

    std::vector<PeerIdentity> connectedPeers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<PeerIdentity> out;
        out.reserve(m_sessions.size());
        for (const auto& kv : m_sessions) {
            out.push_back(kv.second->peer);
        }
        return out;
    }

    void disconnect() {
        std::map<std::string, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            sessions = m_sessions;
        }
        const std::string bye = wire::encode_frame(wire::FrameType::BYE, "");
        for (const auto& kv : sessions) {
            std::lock_guard<std::mutex> write_lock(kv.second->write_mutex);
            if (kv.second->fd < 0) continue;
            if (!send_all(kv.second->fd, bye)) {
                LOG_DEBUG("LAN: BYE to " + kv.second->peer.describe() + " not delivered");
            }
            ::shutdown(kv.second->fd, SHUT_RDWR);
        }
        if (!sessions.empty()) {
            LOG_INFO("LAN: closing " + std::to_string(sessions.size()) + " session(s)");
        }
    }

    void rebind(const PeerIdentity& identity) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_advertising || m_browsing) {
                LOG_ERROR("LAN: rebind ignored while advertising or browsing");
                return;
            }
        }
        disconnect();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_identity = identity;
        LOG_INFO("LAN: identity rebound to " + identity.describe());
    }

private:
    struct DiscoveredPeer {
        PeerIdentity identity;
        std::string host;
        int port = 0;
        Clock::time_point last_seen;
        bool reported = false;
        bool is_static = false;
    };

    struct Session {
        int fd = -1;
        PeerIdentity peer;
        std::string initiator_id;
        std::mutex write_mutex;
        wire::FrameReader reader;
        std::vector<wire::Frame> backlog;  // frames that arrived with the handshake
        std::atomic<bool> superseded{false};
    };

    enum class RegisterOutcome { Registered, Replaced, Rejected };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    static DiscoveryInfo infoFor(const DiscoveredPeer& p) {
        return DiscoveryInfo{{"transport", "lan"}, {"address", p.host + ":" + std::to_string(p.port)}};
    }

    TransportCallbacks callbacks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_callbacks;
    }

    void reportState(const PeerIdentity& peer, ConnectionState state) {
        auto cb = callbacks();
        if (cb.onConnectionStateChanged) cb.onConnectionStateChanged(peer, state);
    }

    std::shared_ptr<Session> findSession(const std::string& peer_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(peer_id);
        return it == m_sessions.end() ? nullptr : it->second;
    }

    void spawn(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(m_workers_mutex);
        if (m_shutting_down) return;
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        m_workers.push_back(Worker{std::thread([fn, done] {
                                       fn();
                                       done->store(true);
                                   }),
                                   done});
    }

    // Both ends keep the session opened by the node with the smaller id when
    // simultaneous invitations produce two sockets.
    RegisterOutcome registerSession(const std::shared_ptr<Session>& session) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(session->peer.id);
        if (it == m_sessions.end()) {
            m_sessions[session->peer.id] = session;
            return RegisterOutcome::Registered;
        }
        if (session->initiator_id < it->second->initiator_id) {
            it->second->superseded = true;
            ::shutdown(it->second->fd, SHUT_RDWR);
            it->second = session;
            return RegisterOutcome::Replaced;
        }
        session->superseded = true;
        return RegisterOutcome::Rejected;
    }

    void runInvite(const PeerIdentity& peer, const std::string& host, int port, int timeout_ms) {
        if (findSession(peer.id)) {
            reportState(peer, ConnectionState::Connected);
            return;
        }
        reportState(peer, ConnectionState::Connecting);

        std::shared_ptr<Session> session;
        if (host.empty()) {
            LOG_WARN("LAN: no address known for " + peer.describe());
        } else {
            session = handshakeOutbound(peer, host, port, timeout_ms);
        }

        if (!session) {
            reportState(peer, findSession(peer.id) ? ConnectionState::Connected : ConnectionState::Disconnected);
            return;
        }

        const RegisterOutcome outcome = registerSession(session);
        if (outcome == RegisterOutcome::Rejected) {
            ::close(session->fd);
            reportState(peer, ConnectionState::Connected);
            return;
        }
        LOG_INFO("LAN: session established with " + session->peer.describe() + " (outbound)");
        reportState(session->peer, ConnectionState::Connected);
        runSession(session);
    }

    std::shared_ptr<Session> handshakeOutbound(const PeerIdentity& peer, const std::string& host, int port,
                                               int timeout_ms) {
        const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        const int fd = connect_with_timeout(host, port, timeout_ms);
        if (fd < 0) return nullptr;

        auto session = std::make_shared<Session>();
        session->fd = fd;
        const PeerIdentity self = localIdentity();
        session->initiator_id = self.id;

        if (!send_all(fd, wire::encode_frame(wire::FrameType::HELLO, hello_payload(self)))) {
            ::close(fd);
            return nullptr;
        }

        std::vector<wire::Frame> frames;
        if (!readFrames(*session, deadline, frames)) {
            LOG_WARN("LAN: no handshake reply from " + peer.describe());
            ::close(fd);
            return nullptr;
        }

        const wire::Frame& reply = frames.front();
        if (reply.type == wire::FrameType::HELLO_REJECT) {
            LOG_INFO("LAN: " + peer.describe() + " declined the invitation: " + reply.payload);
            ::close(fd);
            return nullptr;
        }
        PeerIdentity remote;
        if (reply.type != wire::FrameType::HELLO_ACK || !parse_hello(reply.payload, remote) || remote.id != peer.id) {
            LOG_WARN("LAN: unexpected handshake reply from " + host + ":" + std::to_string(port));
            ::close(fd);
            return nullptr;
        }

        session->peer = remote;
        session->backlog.assign(frames.begin() + 1, frames.end());
        return session;
    }

    void handleIncoming(int fd, const std::string& remote_addr) {
        auto session = std::make_shared<Session>();
        session->fd = fd;

        std::vector<wire::Frame> frames;
        const auto deadline = Clock::now() + std::chrono::milliseconds(m_cfg.hello_timeout_ms);
        PeerIdentity remote;
        if (!readFrames(*session, deadline, frames) || frames.front().type != wire::FrameType::HELLO ||
            !parse_hello(frames.front().payload, remote)) {
            LOG_WARN("LAN: dropping connection from " + remote_addr + " without a valid HELLO");
            ::close(fd);
            return;
        }

        const PeerIdentity self = localIdentity();
        auto cb = callbacks();
        const bool accepted = remote.id != self.id && (!cb.onInvitationReceived || cb.onInvitationReceived(remote));
        if (!accepted) {
            LOG_INFO("LAN: declined invitation from " + remote.describe());
            if (!send_all(fd, wire::encode_frame(wire::FrameType::HELLO_REJECT, "declined"))) {
                LOG_DEBUG("LAN: HELLO_REJECT to " + remote_addr + " not delivered");
            }
            ::close(fd);
            return;
        }
        if (!send_all(fd, wire::encode_frame(wire::FrameType::HELLO_ACK, hello_payload(self)))) {
            ::close(fd);
            return;
        }

        session->peer = remote;
        session->initiator_id = remote.id;
        session->backlog.assign(frames.begin() + 1, frames.end());

        const RegisterOutcome outcome = registerSession(session);
        if (outcome == RegisterOutcome::Rejected) {
            ::close(fd);
            return;
        }
        if (outcome == RegisterOutcome::Registered) {
            reportState(remote, ConnectionState::Connecting);
            reportState(remote, ConnectionState::Connected);
        }
        LOG_INFO("LAN: session established with " + remote.describe() + " (inbound from " + remote_addr + ")");
        runSession(session);
    }

    // Reads until at least one frame is available or the deadline passes.
    bool readFrames(Session& session, Clock::time_point deadline, std::vector<wire::Frame>& frames) {
        char buf[TCP_READ_CHUNK];
        while (frames.empty()) {
            const int left = remaining_ms(deadline);
            if (left <= 0 || m_shutting_down) return false;
            const int ready = wait_readable(session.fd, std::min(left, SELECT_TIMEOUT_MS));
            if (ready < 0) return false;
            if (ready == 0) continue;
            const ssize_t n = ::recv(session.fd, buf, sizeof(buf), 0);
            if (n <= 0) return false;
            if (!session.reader.feed(buf, static_cast<size_t>(n), frames)) return false;
        }
        return true;
    }

    // Returns false when the frame ends the session.
    bool handleFrame(const Session& session, const wire::Frame& frame) {
        switch (frame.type) {
            case wire::FrameType::DATA: {
                auto cb = callbacks();
                if (cb.onDataReceived) cb.onDataReceived(frame.payload, session.peer);
                return true;
            }
            case wire::FrameType::BYE:
                LOG_DEBUG("LAN: BYE from " + session.peer.describe());
                return false;
            default:
                LOG_DEBUG(std::string("LAN: ignoring ") + wire::frame_type_to_string(frame.type) +
                          " frame mid-session");
                return true;
        }
    }

    void runSession(const std::shared_ptr<Session>& session) {
        bool open = true;
        for (const auto& frame : session->backlog) {
            if (!handleFrame(*session, frame)) {
                open = false;
                break;
            }
        }
        session->backlog.clear();

        char buf[TCP_READ_CHUNK];
        while (open && !m_shutting_down) {
            const int ready = wait_readable(session->fd, SELECT_TIMEOUT_MS);
            if (ready < 0) break;
            if (ready == 0) continue;

            const ssize_t n = ::recv(session->fd, buf, sizeof(buf), 0);
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                break;
            }
            std::vector<wire::Frame> frames;
            if (!session->reader.feed(buf, static_cast<size_t>(n), frames)) {
                LOG_WARN("LAN: corrupt stream from " + session->peer.describe());
                break;
            }
            for (const auto& frame : frames) {
                if (!handleFrame(*session, frame)) {
                    open = false;
                    break;
                }
            }
        }
        endSession(session);
    }

    void endSession(const std::shared_ptr<Session>& session) {
        bool was_active = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(session->peer.id);
            if (it != m_sessions.end() && it->second == session) {
                m_sessions.erase(it);
                was_active = true;
            }
        }
        {
            std::lock_guard<std::mutex> write_lock(session->write_mutex);
            ::close(session->fd);
            session->fd = -1;
        }
        if (was_active && !session->superseded) {
            LOG_INFO("LAN: session with " + session->peer.describe() + " closed");
            reportState(session->peer, ConnectionState::Disconnected);
        }
    }

    // ------------------------------------------------------------------
    // Sockets and discovery threads
    // ------------------------------------------------------------------

    bool openServerSocket(std::string& error) {
        int sock = ::socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) {
            error = "socket(): " + std::string(strerror(errno));
            return false;
        }
        int opt = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(m_cfg.session_port));
        if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            error = "bind(" + std::to_string(m_cfg.session_port) + "): " + strerror(errno);
            ::close(sock);
            return false;
        }
        if (::listen(sock, DEFAULT_LISTEN_BACKLOG) < 0) {
            error = "listen(): " + std::string(strerror(errno));
            ::close(sock);
            return false;
        }

        socklen_t len = sizeof(addr);
        getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_server_sock = sock;
        m_listen_port = ntohs(addr.sin_port);
        return true;
    }

    void closeServerSocket() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_server_sock >= 0) {
            ::shutdown(m_server_sock, SHUT_RDWR);
            ::close(m_server_sock);
            m_server_sock = -1;
        }
    }

    void acceptLoop() {
        int server_sock;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            server_sock = m_server_sock;
        }
        while (m_accepting) {
            const int ready = wait_readable(server_sock, SELECT_TIMEOUT_MS);
            if (ready < 0) {
                if (m_accepting) LOG_ERROR("LAN: select() failed in accept loop: " + std::string(strerror(errno)));
                break;
            }
            if (ready == 0) continue;

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            const int client = ::accept(server_sock, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client < 0) {
                if (m_accepting) LOG_WARN("LAN: accept() failed: " + std::string(strerror(errno)));
                continue;
            }
            configure_stream_socket(client);

            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            const std::string remote = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
            spawn([this, client, remote] { handleIncoming(client, remote); });
        }
    }

    bool ensureDiscoverySocket(std::string& error) {
        if (m_udp_sock >= 0) return true;

        int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (sock < 0) {
            error = "socket(): " + std::string(strerror(errno));
            return false;
        }
        int on = 1;
        setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on));
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#ifdef SO_REUSEPORT
        setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on));
#endif
        sockaddr_in bind_addr{};
        bind_addr.sin_family = AF_INET;
        bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
        bind_addr.sin_port = htons(static_cast<uint16_t>(m_cfg.discovery_port));
        if (::bind(sock, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
            error = "bind(" + std::to_string(m_cfg.discovery_port) + "): " + strerror(errno);
            ::close(sock);
            return false;
        }
        m_udp_sock = sock;
        return true;
    }

    void startDiscoveryThread() {
        if (m_discovery_running) return;
        m_discovery_running = true;
        m_discovery_thread = std::thread(&Impl::discoveryLoop, this);
    }

    void stopDiscoveryThreadIfIdle() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_advertising || m_browsing) return;
        }
        m_discovery_running = false;
        if (m_discovery_thread.joinable()) m_discovery_thread.join();
        if (m_udp_sock >= 0) {
            ::close(m_udp_sock);
            m_udp_sock = -1;
        }
    }

    void discoveryLoop() {
        char buf[DISCOVERY_MSG_MAX];
        auto next_beacon = Clock::now();

        while (m_discovery_running) {
            bool advertising;
            bool browsing;
            std::string beacon;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                advertising = m_advertising;
                browsing = m_browsing;
                beacon = std::string(BEACON_PREFIX) + ":" + m_identity.id + ":" + std::to_string(m_listen_port) +
                         ":" + m_identity.displayName;
            }

            const auto now = Clock::now();
            if (advertising && now >= next_beacon) {
                sendBeacon(beacon);
                next_beacon = now + std::chrono::milliseconds(m_cfg.beacon_interval_ms);
            }

            if (wait_readable(m_udp_sock, 200) > 0) {
                sockaddr_in from{};
                socklen_t from_len = sizeof(from);
                const ssize_t n = ::recvfrom(m_udp_sock, buf, sizeof(buf) - 1, 0,
                                             reinterpret_cast<sockaddr*>(&from), &from_len);
                if (n > 0 && browsing) {
                    char ip[INET_ADDRSTRLEN];
                    inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
                    handleBeacon(std::string(buf, static_cast<size_t>(n)), ip);
                }
            }

            if (browsing) {
                expirePeers();
            }
        }
    }

    void sendBeacon(const std::string& beacon) {
        bool any_sent = false;
        for (const auto& dst : get_ipv4_broadcast_targets(static_cast<uint16_t>(m_cfg.discovery_port))) {
            if (::sendto(m_udp_sock, beacon.data(), beacon.size(), 0,
                         reinterpret_cast<const sockaddr*>(&dst), sizeof(dst)) >= 0) {
                any_sent = true;
            }
        }
        if (!any_sent) {
            LOG_WARN("LAN: beacon could not be sent on any interface");
        }
    }

    // "PEERLINK_BEACON:<id>:<port>:<name>"; the name may itself contain ':'.
    void handleBeacon(const std::string& msg, const std::string& sender_ip) {
        const std::string prefix = std::string(BEACON_PREFIX) + ":";
        if (msg.rfind(prefix, 0) != 0) return;

        const size_t id_end = msg.find(':', prefix.size());
        if (id_end == std::string::npos) return;
        const size_t port_end = msg.find(':', id_end + 1);
        if (port_end == std::string::npos) return;

        PeerIdentity peer;
        peer.id = msg.substr(prefix.size(), id_end - prefix.size());
        peer.displayName = msg.substr(port_end + 1);
        int port = 0;
        try {
            port = std::stoi(msg.substr(id_end + 1, port_end - id_end - 1));
        } catch (const std::exception&) {
            LOG_DEBUG("LAN: beacon with bad port from " + sender_ip);
            return;
        }
        if (peer.id.empty() || port <= 0 || port > 65535) return;

        DiscoveryInfo info;
        bool is_new = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (peer.id == m_identity.id) return;  // our own beacon
            DiscoveredPeer& p = m_discovered[peer.id];
            p.identity = peer;
            p.host = sender_ip;
            p.port = port;
            p.last_seen = Clock::now();
            if (!p.reported) {
                p.reported = true;
                is_new = true;
                info = infoFor(p);
            }
        }
        if (is_new) {
            LOG_INFO("LAN: found " + peer.describe() + " at " + sender_ip + ":" + std::to_string(port));
            auto cb = callbacks();
            if (cb.onPeerFound) cb.onPeerFound(peer, info);
        }
    }

    void expirePeers() {
        std::vector<PeerIdentity> lost;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const auto cutoff = Clock::now() - std::chrono::milliseconds(m_cfg.peer_lost_timeout_ms);
            for (auto it = m_discovered.begin(); it != m_discovered.end();) {
                if (!it->second.is_static && it->second.reported && it->second.last_seen < cutoff) {
                    lost.push_back(it->second.identity);
                    it = m_discovered.erase(it);
                } else {
                    ++it;
                }
            }
        }
        auto cb = callbacks();
        for (const auto& peer : lost) {
            LOG_INFO("LAN: lost " + peer.describe());
            if (cb.onPeerLost) cb.onPeerLost(peer);
        }
    }

    void shutdownAll() {
        setCallbacks(TransportCallbacks{});
        stopAdvertising();
        stopBrowsing();
        disconnect();

        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_workers_mutex);
            m_shutting_down = true;
            workers.swap(m_workers);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    LanTransportConfig m_cfg;

    mutable std::mutex m_mutex;  // identity, callbacks, flags, peers, sessions
    PeerIdentity m_identity;
    TransportCallbacks m_callbacks;
    bool m_advertising = false;
    bool m_browsing = false;
    int m_listen_port = 0;
    int m_server_sock = -1;
    std::map<std::string, DiscoveredPeer> m_discovered;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;

    std::mutex m_lifecycle_mutex;  // serializes start/stop calls
    std::atomic<bool> m_accepting{false};
    std::thread m_accept_thread;
    int m_udp_sock = -1;
    std::atomic<bool> m_discovery_running{false};
    std::thread m_discovery_thread;

    std::mutex m_workers_mutex;
    std::list<Worker> m_workers;
    std::atomic<bool> m_shutting_down{false};
};

LanTransport::LanTransport(const LanTransportConfig& config, const PeerIdentity& identity)
    : m_impl(std::make_unique<Impl>(config, identity)) {}
LanTransport::~LanTransport() = default;

void LanTransport::setCallbacks(TransportCallbacks callbacks) { m_impl->setCallbacks(std::move(callbacks)); }
PeerIdentity LanTransport::localIdentity() const { return m_impl->localIdentity(); }
void LanTransport::startAdvertising() { m_impl->startAdvertising(); }
void LanTransport::stopAdvertising() { m_impl->stopAdvertising(); }
void LanTransport::startBrowsing() { m_impl->startBrowsing(); }
void LanTransport::stopBrowsing() { m_impl->stopBrowsing(); }
void LanTransport::invite(const PeerIdentity& peer, int timeout_seconds) { m_impl->invite(peer, timeout_seconds); }
void LanTransport::send(const std::string& data, const std::vector<PeerIdentity>& peers) { m_impl->send(data, peers); }
std::vector<PeerIdentity> LanTransport::connectedPeers() const { return m_impl->connectedPeers(); }
void LanTransport::disconnect() { m_impl->disconnect(); }
void LanTransport::rebind(const PeerIdentity& identity) { m_impl->rebind(identity); }
void LanTransport::addStaticPeer(const PeerIdentity& peer, const std::string& host, int port) {
    m_impl->addStaticPeer(peer, host, port);
}
int LanTransport::listenPort() const { return m_impl->listenPort(); }

} // namespace peerlink
