#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include "telemetry.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace peerlink;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

bool test_defaults() {
    std::cout << "Testing configuration defaults..." << std::endl;

    ConfigManager config;
    TEST_ASSERT(config.getMaxConnectAttempts() == DEFAULT_MAX_CONNECT_ATTEMPTS, "Connect attempt default");
    TEST_ASSERT(config.getMaxConnectAttempts() == 5, "Five connect attempts by default");
    TEST_ASSERT(config.getReconnectSweepForegroundMs() == 15000, "Foreground sweep is 15s");
    TEST_ASSERT(config.getReconnectSweepBackgroundMs() == 30000, "Background sweep is 30s");
    TEST_ASSERT(config.getQualityCheckIntervalMs() == 10000, "Quality check is 10s");
    TEST_ASSERT(config.isQualityCheckEnabled(), "Quality check enabled by default");
    TEST_ASSERT(config.getDeliveryMaxRetryAttempts() == 5, "Five delivery retries by default");
    TEST_ASSERT(config.getDeliveryBaseIntervalMs() == 2000, "Delivery backoff starts at 2s");
    TEST_ASSERT(config.getTransportKind() == "lan", "LAN transport by default");
    TEST_ASSERT(config.getLogLevel() == "info", "Info logging by default");
    TEST_ASSERT(config.loadedPath().empty(), "Nothing loaded yet");

    std::cout << "Configuration defaults Passed!" << std::endl;
    return true;
}

bool test_load_and_override() {
    std::cout << "Testing configuration loading..." << std::endl;

    ConfigManager config;
    TEST_ASSERT(config.loadFromString(R"({
        "coordinator": {"max_connect_attempts": 3, "quality_check_enabled": false,
                        "stale_handshake_ms": "soon"},
        "delivery": {"base_interval_ms": 500},
        "transport": {"kind": "loopback", "discovery_port": 41000},
        "logging": {"level": "debug"}
    })"),
                "Valid JSON must load");
    TEST_ASSERT(config.getMaxConnectAttempts() == 3, "Loaded value wins");
    TEST_ASSERT(!config.isQualityCheckEnabled(), "Loaded flag wins");
    TEST_ASSERT(config.getStaleHandshakeMs() == DEFAULT_STALE_HANDSHAKE_MS, "Wrong type falls back to default");
    TEST_ASSERT(config.getDeliveryBaseIntervalMs() == 500, "Delivery section is read");
    TEST_ASSERT(config.getDeliveryMaxRetryAttempts() == DEFAULT_DELIVERY_MAX_RETRY_ATTEMPTS, "Missing key defaults");
    TEST_ASSERT(config.getTransportKind() == "loopback", "Transport kind is read");
    TEST_ASSERT(config.getDiscoveryPort() == 41000, "Discovery port is read");

    TEST_ASSERT(config.setValueAtPath({"coordinator", "max_connect_attempts"}, 7), "Override must succeed");
    TEST_ASSERT(config.getMaxConnectAttempts() == 7, "Override must be visible");
    TEST_ASSERT(config.setValueAtPath({"store", "path"}, "/tmp/x.json"), "New section must be created");
    TEST_ASSERT(config.getStorePath() == "/tmp/x.json", "New section value must be visible");
    TEST_ASSERT(!config.setValueAtPath({"logging", "level", "deeper"}, 1), "Cannot descend into a string");
    TEST_ASSERT(!config.setValueAtPath({}, 1), "Empty path is refused");
    TEST_ASSERT(config.snapshot()["coordinator"]["max_connect_attempts"] == 7, "Snapshot reflects overrides");

    TEST_ASSERT(!config.loadFromString("{ not json"), "Malformed JSON must be refused");
    TEST_ASSERT(!config.loadFromString("[1, 2]"), "Non-object JSON must be refused");
    TEST_ASSERT(config.getMaxConnectAttempts() == 7, "Failed load keeps the previous configuration");

    std::cout << "Configuration loading Passed!" << std::endl;
    return true;
}

bool test_load_file() {
    std::cout << "Testing configuration file..." << std::endl;

    const std::string path = "peerlink_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"telemetry": {"enabled": false, "flush_interval_ms": 1000}})";
    }
    ConfigManager config;
    TEST_ASSERT(config.loadConfig(path), "File must load");
    TEST_ASSERT(config.loadedPath() == path, "Loaded path is remembered");
    TEST_ASSERT(!config.isTelemetryEnabled(), "Telemetry flag is read");
    TEST_ASSERT(config.getTelemetryFlushIntervalMs() == 1000, "Flush interval is read");
    std::remove(path.c_str());

    TEST_ASSERT(!config.loadConfig("does_not_exist/peerlink.json"), "Missing file must be refused");

    std::cout << "Configuration file Passed!" << std::endl;
    return true;
}

bool test_log_levels() {
    std::cout << "Testing log levels..." << std::endl;

    TEST_ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG, "Case-insensitive debug");
    TEST_ASSERT(parse_log_level("warn") == LogLevel::WARNING, "warn alias");
    TEST_ASSERT(parse_log_level("warning") == LogLevel::WARNING, "warning");
    TEST_ASSERT(parse_log_level("none") == LogLevel::NONE, "none");
    TEST_ASSERT(parse_log_level("loud", LogLevel::ERROR) == LogLevel::ERROR, "Unknown uses the fallback");

    const LogLevel before = get_log_level();
    set_log_level(LogLevel::WARNING);
    TEST_ASSERT(get_log_level() == LogLevel::WARNING, "Level must be stored");
    set_log_level(before);

    std::cout << "Log levels Passed!" << std::endl;
    return true;
}

bool test_telemetry() {
    std::cout << "Testing telemetry..." << std::endl;

    Telemetry disabled;
    Telemetry::Config off;
    off.enabled = false;
    disabled.initialize("node", off);
    disabled.inc_counter("x");
    disabled.set_gauge("g", 3);
    TEST_ASSERT(disabled.counter_value("x") == 0, "Disabled telemetry records nothing");
    TEST_ASSERT(disabled.snapshot_json() == "{}", "Disabled snapshot is empty");

    const std::string sink = "peerlink_telemetry_test.jsonl";
    std::remove(sink.c_str());

    Telemetry t;
    Telemetry::Config on;
    on.log_json = false;
    on.file_path = sink;
    t.initialize("node-1", on);
    t.inc_counter("messages_sent");
    t.inc_counter("messages_sent", 2);
    t.set_gauge("peers_connected", 4);
    t.set_gauge("peers_connected", 2);
    t.observe_hist_ms("handshake", 30);
    t.observe_hist_ms("handshake", 10);
    TEST_ASSERT(t.counter_value("messages_sent") == 3, "Counters accumulate");
    TEST_ASSERT(t.gauge_value("peers_connected") == 2, "Gauges keep the last value");

    const nlohmann::json snap = nlohmann::json::parse(t.snapshot_json("test"));
    TEST_ASSERT(snap["node_id"] == "node-1", "Snapshot names the node");
    TEST_ASSERT(snap["reason"] == "test", "Snapshot carries the reason");
    TEST_ASSERT(snap["hists_ms"]["handshake"]["min"] == 10, "Histogram min");
    TEST_ASSERT(snap["hists_ms"]["handshake"]["max"] == 30, "Histogram max");
    TEST_ASSERT(snap["hists_ms"]["handshake"]["count"] == 2, "Histogram count");

    t.flush("shutdown");
    std::ifstream in(sink);
    std::string line;
    TEST_ASSERT(std::getline(in, line), "Flush must append a line");
    TEST_ASSERT(nlohmann::json::parse(line)["reason"] == "shutdown", "File line is the snapshot");
    in.close();
    std::remove(sink.c_str());

    std::cout << "Telemetry Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    std::cout << "Running Config Tests..." << std::endl;

    test_defaults();
    test_load_and_override();
    test_load_file();
    test_log_levels();
    test_telemetry();

    if (tests_failed == 0) {
        std::cout << "ALL CONFIG TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
