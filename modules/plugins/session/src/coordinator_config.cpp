#include "coordinator_config.h"
#include "config_manager.h"

namespace peerlink {

CoordinatorConfig CoordinatorConfig::fromConfig(const ConfigManager& config) {
    CoordinatorConfig cfg;
    cfg.max_connect_attempts = config.getMaxConnectAttempts();
    cfg.connect_backoff_base = ms(config.getConnectBackoffBaseMs());
    cfg.invite_timeout_sec = config.getInviteTimeoutSec();
    cfg.profile_exchange_delay = ms(config.getProfileExchangeDelayMs());
    cfg.sweep_foreground = ms(config.getReconnectSweepForegroundMs());
    cfg.sweep_background = ms(config.getReconnectSweepBackgroundMs());
    cfg.quality_check_enabled = config.isQualityCheckEnabled();
    cfg.quality_check_interval = ms(config.getQualityCheckIntervalMs());
    cfg.discovery_settle = ms(config.getDiscoverySettleMs());
    cfg.discovery_retry_delay = ms(config.getDiscoveryRetryDelayMs());
    cfg.stale_handshake = ms(config.getStaleHandshakeMs());
    cfg.peer_expiry = ms(config.getPeerExpiryMs());
    cfg.delivery_max_retry_attempts = config.getDeliveryMaxRetryAttempts();
    cfg.delivery_base_interval = ms(config.getDeliveryBaseIntervalMs());
    cfg.sender_workers = config.getSenderWorkers();
    cfg.telemetry_flush_interval = ms(config.getTelemetryFlushIntervalMs());
    return cfg;
}

} // namespace peerlink
