#ifndef PEERLINK_CONSTANTS_H
#define PEERLINK_CONSTANTS_H

#include <cstddef>

namespace peerlink {

// Connection coordinator defaults (overridable from config.json "coordinator")
constexpr int DEFAULT_MAX_CONNECT_ATTEMPTS = 5;
constexpr int DEFAULT_CONNECT_BACKOFF_BASE_MS = 1000;
constexpr int DEFAULT_INVITE_TIMEOUT_SEC = 30;
constexpr int DEFAULT_PROFILE_EXCHANGE_DELAY_MS = 500;
constexpr int DEFAULT_RECONNECT_SWEEP_FOREGROUND_MS = 15000;
constexpr int DEFAULT_RECONNECT_SWEEP_BACKGROUND_MS = 30000;  // Longer interval saves battery
constexpr int DEFAULT_QUALITY_CHECK_INTERVAL_MS = 10000;
constexpr int DEFAULT_DISCOVERY_SETTLE_MS = 1000;
constexpr int DEFAULT_DISCOVERY_RETRY_DELAY_MS = 5000;
constexpr int DEFAULT_STALE_HANDSHAKE_MS = 15000;
constexpr int DEFAULT_PEER_EXPIRY_MS = 120000;

// Delivery retry engine defaults (config.json "delivery")
constexpr int DEFAULT_DELIVERY_MAX_RETRY_ATTEMPTS = 5;
constexpr int DEFAULT_DELIVERY_BASE_INTERVAL_MS = 2000;
constexpr int DEFAULT_SENDER_WORKERS = 2;

// LAN transport (config.json "transport")
constexpr int DEFAULT_DISCOVERY_PORT = 30400;
constexpr int DEFAULT_SESSION_PORT = 30401;
constexpr int DEFAULT_BEACON_INTERVAL_MS = 2000;
constexpr int DEFAULT_PEER_LOST_TIMEOUT_MS = 7000;
constexpr int DEFAULT_LISTEN_BACKLOG = 8;
constexpr int SELECT_TIMEOUT_MS = 500;
constexpr size_t TCP_READ_CHUNK = 4096;
constexpr size_t DISCOVERY_MSG_MAX = 1024;
constexpr const char* BEACON_PREFIX = "PEERLINK_BEACON";

// Telemetry
constexpr int DEFAULT_TELEMETRY_FLUSH_INTERVAL_MS = 30000;

// Profile defaults
constexpr const char* DEFAULT_PROFILE_STATUS = "Hey there! I'm using PeerLink";

} // namespace peerlink

#endif // PEERLINK_CONSTANTS_H
