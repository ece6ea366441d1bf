#ifndef PEERLINK_CONNECT_RETRY_POLICY_H
#define PEERLINK_CONNECT_RETRY_POLICY_H

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace peerlink {

/**
 * Per-peer bookkeeping for discovery-triggered connection attempts.
 *
 * - attempts are capped at max_attempts; a capped peer is ignored until
 *   clear() (successful connection, sweep or identity rebind)
 * - after the Nth attempt the next one waits backoff_base * 2^(N-1)
 *
 * Not thread-safe; the coordinator only touches it from its event thread.
 */
class ConnectRetryPolicy {
public:
    using Clock = std::chrono::steady_clock;

    struct RetryRecord {
        int attempts = 0;
        Clock::time_point last_attempt;
    };

    enum class Decision {
        INVITE_NOW,
        DEFER,      // inside the backoff window; retry after `wait`
        CAPPED
    };

    struct Verdict {
        Decision decision;
        std::chrono::milliseconds wait{0};
        int attempts = 0;
    };

    ConnectRetryPolicy(int max_attempts, std::chrono::milliseconds backoff_base);

    Verdict evaluate(const std::string& peer_id, Clock::time_point now) const;

    // Returns the attempt count including this one.
    int record_attempt(const std::string& peer_id, Clock::time_point now);

    void clear(const std::string& peer_id);
    void clear_all();

    int attempts(const std::string& peer_id) const;
    bool is_capped(const std::string& peer_id) const;
    std::vector<std::string> tracked_peers() const;

    // Delay required after `attempts` attempts (0 for none).
    std::chrono::milliseconds backoff_for(int attempts) const;

    int max_attempts() const { return m_max_attempts; }

private:
    int m_max_attempts;
    std::chrono::milliseconds m_backoff_base;
    std::map<std::string, RetryRecord> m_records;
};

} // namespace peerlink

#endif // PEERLINK_CONNECT_RETRY_POLICY_H
