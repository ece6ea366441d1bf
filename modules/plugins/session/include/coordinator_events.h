#ifndef PEERLINK_COORDINATOR_EVENTS_H
#define PEERLINK_COORDINATOR_EVENTS_H

#include "connection_state.h"
#include "peer_identity.h"

#include <chrono>
#include <functional>
#include <string>
#include <variant>

namespace peerlink {

// --- Browser saw a peer advertising ---
struct PeerFoundEvent {
    PeerIdentity peer;
    DiscoveryInfo info;
};

// --- Browser stopped seeing a peer ---
struct PeerLostEvent {
    PeerIdentity peer;
};

// --- Transport reported a session state change ---
struct ConnectionStateEvent {
    PeerIdentity peer;
    ConnectionState state;
};

// --- Bytes arrived on a session ---
struct DataReceivedEvent {
    PeerIdentity from;
    std::string data;
    std::chrono::steady_clock::time_point arrival_time;
};

enum class DiscoveryOperation {
    ADVERTISING,
    BROWSING
};

// --- startAdvertising / startBrowsing failed ---
struct DiscoveryFailedEvent {
    DiscoveryOperation operation;
    std::string error;
};

enum class TimerKind {
    RECONNECT_SWEEP,
    QUALITY_CHECK,
    TELEMETRY_FLUSH
};

// --- Periodic timer fired ---
struct TimerTickEvent {
    TimerKind kind;
};

// --- Arbitrary work marshalled onto the event thread ---
struct DeferredTaskEvent {
    std::function<void()> task;
};

using CoordinatorEvent = std::variant<
    PeerFoundEvent,
    PeerLostEvent,
    ConnectionStateEvent,
    DataReceivedEvent,
    DiscoveryFailedEvent,
    TimerTickEvent,
    DeferredTaskEvent
>;

inline const char* discovery_operation_to_string(DiscoveryOperation op) {
    return op == DiscoveryOperation::ADVERTISING ? "advertising" : "browsing";
}

} // namespace peerlink

#endif // PEERLINK_COORDINATOR_EVENTS_H
