#ifndef PEERLINK_PEER_IDENTITY_H
#define PEERLINK_PEER_IDENTITY_H

#include <functional>
#include <map>
#include <string>

namespace peerlink {

// Transport-assigned identity of a node. Two identities are the same peer
// iff their ids match; the display name is informational.
struct PeerIdentity {
    std::string id;
    std::string displayName;

    PeerIdentity() = default;
    PeerIdentity(std::string peer_id, std::string display_name)
        : id(std::move(peer_id)), displayName(std::move(display_name)) {}

    bool operator==(const PeerIdentity& other) const { return id == other.id; }
    bool operator!=(const PeerIdentity& other) const { return id != other.id; }
    bool operator<(const PeerIdentity& other) const { return id < other.id; }

    // "name (id-prefix)" for log lines
    std::string describe() const {
        return displayName + " (" + id.substr(0, 8) + ")";
    }
};

// Optional key/value info a peer advertises alongside its identity.
using DiscoveryInfo = std::map<std::string, std::string>;

} // namespace peerlink

namespace std {
template <>
struct hash<peerlink::PeerIdentity> {
    size_t operator()(const peerlink::PeerIdentity& p) const noexcept {
        return hash<string>()(p.id);
    }
};
} // namespace std

#endif // PEERLINK_PEER_IDENTITY_H
