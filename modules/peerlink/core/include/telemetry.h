#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace peerlink {

// Local-only counters, gauges and millisecond histograms.
// Flushed periodically as one JSON line to the log (and optionally a JSONL file).
class Telemetry final {
public:
    struct Config {
        bool enabled = true;
        bool log_json = true;
        int flush_interval_ms = 30000;
        std::string file_path;  // optional JSONL sink
    };

    Telemetry() = default;
    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    void initialize(const std::string& node_id, const Config& cfg);
    bool is_enabled() const { return m_enabled.load(std::memory_order_acquire); }

    // Flushes when the configured interval has elapsed since the last flush.
    void tick();
    void flush(const std::string& reason);

    std::string snapshot_json(const std::string& reason = "snapshot") const;

    void inc_counter(const std::string& name, int64_t delta = 1);
    void set_gauge(const std::string& name, int64_t value);
    void observe_hist_ms(const std::string& name, int64_t ms);

    int64_t counter_value(const std::string& name) const;
    int64_t gauge_value(const std::string& name) const;

private:
    struct Hist {
        int64_t count = 0;
        int64_t sum = 0;
        int64_t min = 0;
        int64_t max = 0;
    };

    void append_to_file_(const std::string& line) const;

    std::atomic<bool> m_enabled{false};
    std::atomic<bool> m_log_json{true};
    std::atomic<int> m_flush_interval_ms{30000};
    std::atomic<int64_t> m_start_ms{0};
    std::atomic<int64_t> m_last_flush_ms{0};

    mutable std::mutex m_mu;
    std::string m_node_id;
    std::string m_file_path;
    std::map<std::string, int64_t> m_counters;
    std::map<std::string, int64_t> m_gauges;
    std::map<std::string, Hist> m_hists;
};

} // namespace peerlink
