#include "profile_exchange.h"
#include "logger.h"

namespace peerlink {

void ProfileExchange::setLocalProfile(const UserProfile& profile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_local = profile;
}

std::optional<UserProfile> ProfileExchange::localProfile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_local;
}

void ProfileExchange::store(const std::string& peer_id, const UserProfile& profile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peer_id);
    if (it == m_peers.end()) {
        LOG_INFO("PX: cached profile \"" + profile.displayName + "\" for " + peer_id.substr(0, 8));
        m_peers.emplace(peer_id, profile);
    } else {
        it->second = profile;
    }
}

bool ProfileExchange::evict(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const bool removed = m_peers.erase(peer_id) > 0;
    if (removed) {
        LOG_DEBUG("PX: evicted profile for " + peer_id.substr(0, 8));
    }
    return removed;
}

void ProfileExchange::clearPeers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peers.clear();
}

std::optional<UserProfile> ProfileExchange::get(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peer_id);
    if (it == m_peers.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ProfileExchange::cachedPeers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_peers.size());
    for (const auto& kv : m_peers) {
        out.push_back(kv.first);
    }
    return out;
}

size_t ProfileExchange::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.size();
}

} // namespace peerlink
