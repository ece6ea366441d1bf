#ifndef PEERLINK_PEER_STATE_MACHINE_H
#define PEERLINK_PEER_STATE_MACHINE_H

#include "connection_state.h"
#include "peer_identity.h"

#include <chrono>
#include <initializer_list>
#include <vector>

namespace peerlink {

// =======================================================
// FSM Input Events
// =======================================================
enum class PeerEvent {
    INVITE_SENT,             // we invited the peer
    TRANSPORT_CONNECTING,    // transport reports a handshake (either direction)
    TRANSPORT_CONNECTED,
    TRANSPORT_DISCONNECTED,
    PEER_LOST,               // browser stopped seeing the peer
    HANDSHAKE_STALE,         // sweep found the peer pending too long
    SHUTDOWN
};

// =======================================================
// FSM Output Actions (intents only, the coordinator applies them)
// =======================================================
enum class PeerAction {
    ENTER_PENDING,
    LEAVE_PENDING,
    CLEAR_RETRY,
    SCHEDULE_PROFILE_EXCHANGE,
    EVICT_PROFILE
};

struct FSMResult {
    ConnectionState new_state;
    std::vector<PeerAction> actions;

    explicit FSMResult(ConnectionState state)
        : new_state(state) {}

    FSMResult(ConnectionState state, std::initializer_list<PeerAction> action_list)
        : new_state(state), actions(action_list) {}

    bool has(PeerAction action) const {
        for (auto a : actions) {
            if (a == action) return true;
        }
        return false;
    }
};

// =======================================================
// Peer Context (one per known peer, owned by the coordinator)
// =======================================================
struct PeerContext {
    PeerIdentity peer;
    ConnectionState state = ConnectionState::Disconnected;

    DiscoveryInfo info;
    bool discovered = false;  // currently visible to the browser

    std::chrono::steady_clock::time_point last_seen;
    std::chrono::steady_clock::time_point last_state_change;
    std::chrono::steady_clock::time_point pending_since;

    explicit PeerContext(const PeerIdentity& identity = PeerIdentity())
        : peer(identity) {
        auto now = std::chrono::steady_clock::now();
        last_seen = now;
        last_state_change = now;
        pending_since = now;
    }
};

// =======================================================
// Peer State Machine (pure transition logic)
// =======================================================
class PeerStateMachine {
public:
    // (Context + Event) -> (New State + Actions). Updates the context's state
    // and timestamps; everything else is left to the caller.
    FSMResult handle_event(PeerContext& peer, PeerEvent event) const;

    static const char* event_to_string(PeerEvent event);
    static const char* action_to_string(PeerAction action);

private:
    FSMResult compute_transition(ConnectionState current, PeerEvent event) const;
};

} // namespace peerlink

#endif // PEERLINK_PEER_STATE_MACHINE_H
