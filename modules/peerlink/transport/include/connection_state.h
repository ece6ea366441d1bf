#ifndef PEERLINK_CONNECTION_STATE_H
#define PEERLINK_CONNECTION_STATE_H

namespace peerlink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

inline const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
    }
    return "UNKNOWN";
}

} // namespace peerlink

#endif // PEERLINK_CONNECTION_STATE_H
