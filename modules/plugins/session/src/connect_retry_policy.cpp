#include "connect_retry_policy.h"

#include <algorithm>

namespace peerlink {

ConnectRetryPolicy::ConnectRetryPolicy(int max_attempts, std::chrono::milliseconds backoff_base)
    : m_max_attempts(std::max(1, max_attempts)),
      m_backoff_base(std::max(std::chrono::milliseconds(0), backoff_base)) {}

ConnectRetryPolicy::Verdict ConnectRetryPolicy::evaluate(const std::string& peer_id, Clock::time_point now) const {
    auto it = m_records.find(peer_id);
    if (it == m_records.end() || it->second.attempts == 0) {
        return Verdict{Decision::INVITE_NOW, std::chrono::milliseconds(0), 0};
    }

    const RetryRecord& rec = it->second;
    if (rec.attempts >= m_max_attempts) {
        return Verdict{Decision::CAPPED, std::chrono::milliseconds(0), rec.attempts};
    }

    const auto ready_at = rec.last_attempt + backoff_for(rec.attempts);
    if (now < ready_at) {
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(ready_at - now);
        if (wait.count() == 0) wait = std::chrono::milliseconds(1);
        return Verdict{Decision::DEFER, wait, rec.attempts};
    }
    return Verdict{Decision::INVITE_NOW, std::chrono::milliseconds(0), rec.attempts};
}

int ConnectRetryPolicy::record_attempt(const std::string& peer_id, Clock::time_point now) {
    RetryRecord& rec = m_records[peer_id];
    rec.attempts++;
    rec.last_attempt = now;
    return rec.attempts;
}

void ConnectRetryPolicy::clear(const std::string& peer_id) {
    m_records.erase(peer_id);
}

void ConnectRetryPolicy::clear_all() {
    m_records.clear();
}

int ConnectRetryPolicy::attempts(const std::string& peer_id) const {
    auto it = m_records.find(peer_id);
    return it == m_records.end() ? 0 : it->second.attempts;
}

bool ConnectRetryPolicy::is_capped(const std::string& peer_id) const {
    return attempts(peer_id) >= m_max_attempts;
}

std::vector<std::string> ConnectRetryPolicy::tracked_peers() const {
    std::vector<std::string> out;
    out.reserve(m_records.size());
    for (const auto& kv : m_records) {
        out.push_back(kv.first);
    }
    return out;
}

std::chrono::milliseconds ConnectRetryPolicy::backoff_for(int attempts) const {
    if (attempts <= 0) return std::chrono::milliseconds(0);
    const int shift = std::min(attempts - 1, 16);
    return m_backoff_base * (int64_t(1) << shift);
}

} // namespace peerlink
