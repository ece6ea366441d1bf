#ifndef PEERLINK_PROFILE_EXCHANGE_H
#define PEERLINK_PROFILE_EXCHANGE_H

#include "chat_models.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

// The user's own profile plus the last profile each connected peer sent.
// Peer entries are unauthenticated claims and are kept only while the peer
// stays connected; the coordinator evicts them on disconnect.
class ProfileExchange {
public:
    void setLocalProfile(const UserProfile& profile);
    std::optional<UserProfile> localProfile() const;

    // Insert or overwrite.
    void store(const std::string& peer_id, const UserProfile& profile);
    bool evict(const std::string& peer_id);
    void clearPeers();

    std::optional<UserProfile> get(const std::string& peer_id) const;
    std::vector<std::string> cachedPeers() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::optional<UserProfile> m_local;
    std::map<std::string, UserProfile> m_peers;
};

} // namespace peerlink

#endif // PEERLINK_PROFILE_EXCHANGE_H
