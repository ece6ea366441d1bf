#include "telemetry.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>

namespace peerlink {

namespace {
int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
} // namespace

void Telemetry::initialize(const std::string& node_id, const Config& cfg) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_node_id = node_id;
        m_file_path = cfg.file_path;
    }

    m_enabled.store(cfg.enabled, std::memory_order_release);
    m_log_json.store(cfg.log_json, std::memory_order_release);
    m_flush_interval_ms.store(cfg.flush_interval_ms, std::memory_order_release);

    const int64_t t = now_ms();
    int64_t expected = 0;
    m_start_ms.compare_exchange_strong(expected, t, std::memory_order_acq_rel);
    m_last_flush_ms.store(t, std::memory_order_release);
}

void Telemetry::tick() {
    if (!is_enabled()) return;
    const int interval = m_flush_interval_ms.load(std::memory_order_acquire);
    if (interval <= 0) return;

    const int64_t t = now_ms();
    int64_t last = m_last_flush_ms.load(std::memory_order_acquire);
    if (t - last < interval) return;
    if (m_last_flush_ms.compare_exchange_strong(last, t, std::memory_order_acq_rel)) {
        flush("periodic");
    }
}

void Telemetry::flush(const std::string& reason) {
    if (!is_enabled()) return;
    const std::string line = snapshot_json(reason);
    if (m_log_json.load(std::memory_order_acquire)) {
        LOG_INFO("TELEMETRY " + line);
    }
    append_to_file_(line);
}

std::string Telemetry::snapshot_json(const std::string& reason) const {
    if (!is_enabled()) return "{}";

    const int64_t t = now_ms();
    const int64_t start = m_start_ms.load(std::memory_order_acquire);

    nlohmann::json out;
    out["ts_ms"] = t;
    out["uptime_ms"] = start > 0 ? t - start : 0;
    out["reason"] = reason;

    std::lock_guard<std::mutex> lk(m_mu);
    out["node_id"] = m_node_id;
    out["counters"] = nlohmann::json::object();
    for (const auto& kv : m_counters) {
        out["counters"][kv.first] = kv.second;
    }
    out["gauges"] = nlohmann::json::object();
    for (const auto& kv : m_gauges) {
        out["gauges"][kv.first] = kv.second;
    }
    out["hists_ms"] = nlohmann::json::object();
    for (const auto& kv : m_hists) {
        out["hists_ms"][kv.first] = {
            {"count", kv.second.count},
            {"sum", kv.second.sum},
            {"min", kv.second.min},
            {"max", kv.second.max},
        };
    }
    return out.dump();
}

void Telemetry::inc_counter(const std::string& name, int64_t delta) {
    if (!is_enabled()) return;
    std::lock_guard<std::mutex> lk(m_mu);
    m_counters[name] += delta;
}

void Telemetry::set_gauge(const std::string& name, int64_t value) {
    if (!is_enabled()) return;
    std::lock_guard<std::mutex> lk(m_mu);
    m_gauges[name] = value;
}

void Telemetry::observe_hist_ms(const std::string& name, int64_t ms) {
    if (!is_enabled()) return;
    std::lock_guard<std::mutex> lk(m_mu);
    Hist& h = m_hists[name];
    if (h.count == 0) {
        h.min = ms;
        h.max = ms;
    } else {
        h.min = std::min(h.min, ms);
        h.max = std::max(h.max, ms);
    }
    h.count++;
    h.sum += ms;
}

int64_t Telemetry::counter_value(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second;
}

int64_t Telemetry::gauge_value(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_gauges.find(name);
    return it == m_gauges.end() ? 0 : it->second;
}

void Telemetry::append_to_file_(const std::string& line) const {
    std::string path;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        path = m_file_path;
    }
    if (path.empty()) return;

    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Telemetry: failed to open " + path + " for append");
        return;
    }
    out << line << "\n";
}

} // namespace peerlink
