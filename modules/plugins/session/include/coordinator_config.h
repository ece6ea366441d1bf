#ifndef PEERLINK_COORDINATOR_CONFIG_H
#define PEERLINK_COORDINATOR_CONFIG_H

#include "constants.h"

#include <chrono>

namespace peerlink {

class ConfigManager;

struct CoordinatorConfig {
    using ms = std::chrono::milliseconds;

    int max_connect_attempts = DEFAULT_MAX_CONNECT_ATTEMPTS;
    ms connect_backoff_base{DEFAULT_CONNECT_BACKOFF_BASE_MS};
    int invite_timeout_sec = DEFAULT_INVITE_TIMEOUT_SEC;
    ms profile_exchange_delay{DEFAULT_PROFILE_EXCHANGE_DELAY_MS};

    ms sweep_foreground{DEFAULT_RECONNECT_SWEEP_FOREGROUND_MS};
    ms sweep_background{DEFAULT_RECONNECT_SWEEP_BACKGROUND_MS};

    // connected < pending => restart discovery (heuristic, may be disabled)
    bool quality_check_enabled = true;
    ms quality_check_interval{DEFAULT_QUALITY_CHECK_INTERVAL_MS};

    ms discovery_settle{DEFAULT_DISCOVERY_SETTLE_MS};
    ms discovery_retry_delay{DEFAULT_DISCOVERY_RETRY_DELAY_MS};
    ms stale_handshake{DEFAULT_STALE_HANDSHAKE_MS};
    ms peer_expiry{DEFAULT_PEER_EXPIRY_MS};

    int delivery_max_retry_attempts = DEFAULT_DELIVERY_MAX_RETRY_ATTEMPTS;
    ms delivery_base_interval{DEFAULT_DELIVERY_BASE_INTERVAL_MS};
    int sender_workers = DEFAULT_SENDER_WORKERS;

    ms telemetry_flush_interval{DEFAULT_TELEMETRY_FLUSH_INTERVAL_MS};

    static CoordinatorConfig fromConfig(const ConfigManager& config);
};

} // namespace peerlink

#endif // PEERLINK_COORDINATOR_CONFIG_H
