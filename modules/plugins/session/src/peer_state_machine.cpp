#include "peer_state_machine.h"
#include "logger.h"

namespace peerlink {

// ==========================================================
// FSM ENTRY POINT
// ==========================================================
FSMResult PeerStateMachine::handle_event(PeerContext& peer, PeerEvent event) const {
    const ConnectionState old_state = peer.state;
    FSMResult result = compute_transition(old_state, event);

    const auto now = std::chrono::steady_clock::now();
    if (result.has(PeerAction::ENTER_PENDING)) {
        peer.pending_since = now;
    }

    if (result.new_state != old_state) {
        peer.state = result.new_state;
        peer.last_state_change = now;

        LOG_INFO(
            std::string("[PeerFSM] ") +
            connection_state_to_string(old_state) +
            " --(" + event_to_string(event) + ")--> " +
            connection_state_to_string(result.new_state) +
            " peer=" + peer.peer.describe()
        );
    }

    return result;
}

// ==========================================================
// TRANSITION TABLE
// ==========================================================
FSMResult PeerStateMachine::compute_transition(ConnectionState current, PeerEvent event) const {
    // Valid from every state.
    switch (event) {
        case PeerEvent::TRANSPORT_DISCONNECTED:
        case PeerEvent::SHUTDOWN:
            return FSMResult(
                ConnectionState::Disconnected,
                { PeerAction::LEAVE_PENDING, PeerAction::EVICT_PROFILE }
            );
        default:
            break;
    }

    switch (current) {

    // ------------------------------------------------------
    case ConnectionState::Disconnected:
        if (event == PeerEvent::INVITE_SENT || event == PeerEvent::TRANSPORT_CONNECTING)
            return FSMResult(ConnectionState::Connecting, { PeerAction::ENTER_PENDING });

        // Sessions accepted without a prior Connecting report.
        if (event == PeerEvent::TRANSPORT_CONNECTED)
            return FSMResult(
                ConnectionState::Connected,
                { PeerAction::LEAVE_PENDING, PeerAction::CLEAR_RETRY, PeerAction::SCHEDULE_PROFILE_EXCHANGE }
            );

        if (event == PeerEvent::PEER_LOST || event == PeerEvent::HANDSHAKE_STALE)
            return FSMResult(ConnectionState::Disconnected);
        break;

    // ------------------------------------------------------
    case ConnectionState::Connecting:
        // Idempotency: our invite and the transport's own Connecting report
        // arrive for the same handshake.
        if (event == PeerEvent::INVITE_SENT || event == PeerEvent::TRANSPORT_CONNECTING)
            return FSMResult(ConnectionState::Connecting);

        if (event == PeerEvent::TRANSPORT_CONNECTED)
            return FSMResult(
                ConnectionState::Connected,
                { PeerAction::LEAVE_PENDING, PeerAction::CLEAR_RETRY, PeerAction::SCHEDULE_PROFILE_EXCHANGE }
            );

        // A renegotiating peer may still hold a cached profile.
        if (event == PeerEvent::PEER_LOST || event == PeerEvent::HANDSHAKE_STALE)
            return FSMResult(
                ConnectionState::Disconnected,
                { PeerAction::LEAVE_PENDING, PeerAction::EVICT_PROFILE }
            );
        break;

    // ------------------------------------------------------
    case ConnectionState::Connected:
        if (event == PeerEvent::TRANSPORT_CONNECTED)
            return FSMResult(ConnectionState::Connected);

        // Losing the advertisement does not end the session.
        if (event == PeerEvent::PEER_LOST || event == PeerEvent::HANDSHAKE_STALE || event == PeerEvent::INVITE_SENT)
            return FSMResult(ConnectionState::Connected);

        // The transport is renegotiating the session; the profile stays
        // cached until a Disconnected report.
        if (event == PeerEvent::TRANSPORT_CONNECTING)
            return FSMResult(ConnectionState::Connecting, { PeerAction::ENTER_PENDING });
        break;
    }

    LOG_WARN(
        std::string("[PeerFSM] Ignored transition ") +
        connection_state_to_string(current) +
        " + " + event_to_string(event)
    );
    return FSMResult(current);
}

// ==========================================================
// DEBUG HELPERS
// ==========================================================
const char* PeerStateMachine::event_to_string(PeerEvent event) {
    switch (event) {
        case PeerEvent::INVITE_SENT: return "INVITE_SENT";
        case PeerEvent::TRANSPORT_CONNECTING: return "TRANSPORT_CONNECTING";
        case PeerEvent::TRANSPORT_CONNECTED: return "TRANSPORT_CONNECTED";
        case PeerEvent::TRANSPORT_DISCONNECTED: return "TRANSPORT_DISCONNECTED";
        case PeerEvent::PEER_LOST: return "PEER_LOST";
        case PeerEvent::HANDSHAKE_STALE: return "HANDSHAKE_STALE";
        case PeerEvent::SHUTDOWN: return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

const char* PeerStateMachine::action_to_string(PeerAction action) {
    switch (action) {
        case PeerAction::ENTER_PENDING: return "ENTER_PENDING";
        case PeerAction::LEAVE_PENDING: return "LEAVE_PENDING";
        case PeerAction::CLEAR_RETRY: return "CLEAR_RETRY";
        case PeerAction::SCHEDULE_PROFILE_EXCHANGE: return "SCHEDULE_PROFILE_EXCHANGE";
        case PeerAction::EVICT_PROFILE: return "EVICT_PROFILE";
        default: return "UNKNOWN";
    }
}

} // namespace peerlink
