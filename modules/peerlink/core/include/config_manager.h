#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace peerlink {

using json = nlohmann::json;

// JSON-backed configuration. Every getter falls back to the compiled-in
// default from constants.h when the key is absent or has the wrong type.
// Instances are constructed at startup and passed to whoever needs them.
class ConfigManager {
public:
    ConfigManager() = default;

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);

    // Overwrite (or create) a nested key, e.g. {"coordinator", "max_connect_attempts"}.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    json snapshot() const;
    std::string loadedPath() const;

    // Coordinator
    int getMaxConnectAttempts() const;
    int getConnectBackoffBaseMs() const;
    int getInviteTimeoutSec() const;
    int getProfileExchangeDelayMs() const;
    int getReconnectSweepForegroundMs() const;
    int getReconnectSweepBackgroundMs() const;
    bool isQualityCheckEnabled() const;
    int getQualityCheckIntervalMs() const;
    int getDiscoverySettleMs() const;
    int getDiscoveryRetryDelayMs() const;
    int getStaleHandshakeMs() const;
    int getPeerExpiryMs() const;

    // Delivery
    int getDeliveryMaxRetryAttempts() const;
    int getDeliveryBaseIntervalMs() const;
    int getSenderWorkers() const;

    // Transport
    std::string getTransportKind() const;
    int getDiscoveryPort() const;
    int getSessionPort() const;
    int getBeaconIntervalMs() const;
    int getPeerLostTimeoutMs() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Telemetry
    bool isTelemetryEnabled() const;
    int getTelemetryFlushIntervalMs() const;
    std::string getTelemetryFilePath() const;

    // Chat store
    std::string getStorePath() const;

private:
    template <typename T>
    T valueOr(const char* section, const char* key, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
    std::string m_path;
};

} // namespace peerlink
