#include "config_manager.h"
#include "constants.h"
#include "logger.h"

#include <fstream>

namespace peerlink {

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_WARN("Config: failed to open " + config_path);
        return false;
    }

    try {
        json parsed = json::parse(config_file);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level of " + config_path + " is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        m_path = config_path;
    } catch (const json::exception& e) {
        LOG_ERROR("Config: loading " + config_path + " failed: " + e.what());
        return false;
    }

    LOG_INFO("Config: loaded " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: inline configuration is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        m_path.clear();
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Config: inline configuration invalid: ") + e.what());
        return false;
    }
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (child.is_null()) {
            child = json::object();
        }
        if (!child.is_object()) {
            return false;
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

std::string ConfigManager::loadedPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_path;
}

template <typename T>
T ConfigManager::valueOr(const char* section, const char* key, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sec = m_config.find(section);
    if (sec == m_config.end() || !sec->is_object()) {
        return fallback;
    }
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN(std::string("Config: ") + section + "." + key + " has the wrong type, using default (" +
                 e.what() + ")");
        return fallback;
    }
}

int ConfigManager::getMaxConnectAttempts() const {
    return valueOr<int>("coordinator", "max_connect_attempts", DEFAULT_MAX_CONNECT_ATTEMPTS);
}

int ConfigManager::getConnectBackoffBaseMs() const {
    return valueOr<int>("coordinator", "connect_backoff_base_ms", DEFAULT_CONNECT_BACKOFF_BASE_MS);
}

int ConfigManager::getInviteTimeoutSec() const {
    return valueOr<int>("coordinator", "invite_timeout_sec", DEFAULT_INVITE_TIMEOUT_SEC);
}

int ConfigManager::getProfileExchangeDelayMs() const {
    return valueOr<int>("coordinator", "profile_exchange_delay_ms", DEFAULT_PROFILE_EXCHANGE_DELAY_MS);
}

int ConfigManager::getReconnectSweepForegroundMs() const {
    return valueOr<int>("coordinator", "reconnect_sweep_foreground_ms", DEFAULT_RECONNECT_SWEEP_FOREGROUND_MS);
}

int ConfigManager::getReconnectSweepBackgroundMs() const {
    return valueOr<int>("coordinator", "reconnect_sweep_background_ms", DEFAULT_RECONNECT_SWEEP_BACKGROUND_MS);
}

bool ConfigManager::isQualityCheckEnabled() const {
    return valueOr<bool>("coordinator", "quality_check_enabled", true);
}

int ConfigManager::getQualityCheckIntervalMs() const {
    return valueOr<int>("coordinator", "quality_check_interval_ms", DEFAULT_QUALITY_CHECK_INTERVAL_MS);
}

int ConfigManager::getDiscoverySettleMs() const {
    return valueOr<int>("coordinator", "discovery_settle_ms", DEFAULT_DISCOVERY_SETTLE_MS);
}

int ConfigManager::getDiscoveryRetryDelayMs() const {
    return valueOr<int>("coordinator", "discovery_retry_delay_ms", DEFAULT_DISCOVERY_RETRY_DELAY_MS);
}

int ConfigManager::getStaleHandshakeMs() const {
    return valueOr<int>("coordinator", "stale_handshake_ms", DEFAULT_STALE_HANDSHAKE_MS);
}

int ConfigManager::getPeerExpiryMs() const {
    return valueOr<int>("coordinator", "peer_expiry_ms", DEFAULT_PEER_EXPIRY_MS);
}

int ConfigManager::getDeliveryMaxRetryAttempts() const {
    return valueOr<int>("delivery", "max_retry_attempts", DEFAULT_DELIVERY_MAX_RETRY_ATTEMPTS);
}

int ConfigManager::getDeliveryBaseIntervalMs() const {
    return valueOr<int>("delivery", "base_interval_ms", DEFAULT_DELIVERY_BASE_INTERVAL_MS);
}

int ConfigManager::getSenderWorkers() const {
    return valueOr<int>("delivery", "sender_workers", DEFAULT_SENDER_WORKERS);
}

std::string ConfigManager::getTransportKind() const {
    return valueOr<std::string>("transport", "kind", "lan");
}

int ConfigManager::getDiscoveryPort() const {
    return valueOr<int>("transport", "discovery_port", DEFAULT_DISCOVERY_PORT);
}

int ConfigManager::getSessionPort() const {
    return valueOr<int>("transport", "session_port", DEFAULT_SESSION_PORT);
}

int ConfigManager::getBeaconIntervalMs() const {
    return valueOr<int>("transport", "beacon_interval_ms", DEFAULT_BEACON_INTERVAL_MS);
}

int ConfigManager::getPeerLostTimeoutMs() const {
    return valueOr<int>("transport", "peer_lost_timeout_ms", DEFAULT_PEER_LOST_TIMEOUT_MS);
}

std::string ConfigManager::getLogLevel() const {
    return valueOr<std::string>("logging", "level", "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueOr<bool>("logging", "async", false);
}

bool ConfigManager::isTelemetryEnabled() const {
    return valueOr<bool>("telemetry", "enabled", true);
}

int ConfigManager::getTelemetryFlushIntervalMs() const {
    return valueOr<int>("telemetry", "flush_interval_ms", DEFAULT_TELEMETRY_FLUSH_INTERVAL_MS);
}

std::string ConfigManager::getTelemetryFilePath() const {
    return valueOr<std::string>("telemetry", "file_path", "");
}

std::string ConfigManager::getStorePath() const {
    return valueOr<std::string>("store", "path", "peerlink_store.json");
}

} // namespace peerlink
