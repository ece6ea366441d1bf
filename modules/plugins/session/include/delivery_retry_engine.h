#ifndef PEERLINK_DELIVERY_RETRY_ENGINE_H
#define PEERLINK_DELIVERY_RETRY_ENGINE_H

#include "envelope.h"
#include "peer_identity.h"
#include "scheduler.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerlink {

class EventThreadPool;
class Telemetry;
class TransportAdapter;

/**
 * @brief Bounded exponential-backoff wrapper around TransportAdapter::send.
 *
 * A job is encoded once and its target set is fixed at the first call. The
 * transmission runs on the sender pool (or inline when no pool is given);
 * the result is handled on the scheduler's context. After a failed attempt
 * N (0-based) the next one is scheduled base_interval * 2^N later, while
 * N < max_retry_attempts. Then the job is abandoned and its completion is
 * called with false. TransmitError never leaves this class.
 */
class DeliveryRetryEngine {
public:
    using Completion = std::function<void(bool delivered)>;

    struct Config {
        int max_retry_attempts = 5;
        std::chrono::milliseconds base_interval{2000};
    };

    DeliveryRetryEngine(TransportAdapter& transport, Scheduler& scheduler, EventThreadPool* pool,
                        Telemetry* telemetry, const Config& config);
    ~DeliveryRetryEngine();

    DeliveryRetryEngine(const DeliveryRetryEngine&) = delete;
    DeliveryRetryEngine& operator=(const DeliveryRetryEngine&) = delete;

    // No-op when targets is empty.
    void sendWithRetry(const Envelope& envelope, const std::vector<PeerIdentity>& targets,
                       Completion completion = {});

    // Drops every job without calling its completion.
    void cancelAll();

    size_t inFlight() const;
    std::chrono::milliseconds backoffFor(int attempt) const;
    const Config& config() const { return m_config; }

private:
    struct Job {
        uint64_t id = 0;
        std::string kind;
        std::string data;
        std::vector<PeerIdentity> targets;
        Completion completion;
        int attempt = 0;
        std::chrono::steady_clock::time_point started;
    };

    void transmit(const std::shared_ptr<Job>& job);
    void onResult(const std::shared_ptr<Job>& job, bool delivered, const std::string& error);
    bool isActive(uint64_t id) const;
    void finish(const std::shared_ptr<Job>& job, bool delivered);
    static std::string timerId(uint64_t id) { return "dre:" + std::to_string(id); }

    TransportAdapter& m_transport;
    Scheduler& m_scheduler;
    EventThreadPool* m_pool;
    Telemetry* m_telemetry;
    Config m_config;

    mutable std::mutex m_mutex;
    std::map<uint64_t, std::shared_ptr<Job>> m_jobs;
    std::atomic<uint64_t> m_next_id{1};
};

} // namespace peerlink

#endif // PEERLINK_DELIVERY_RETRY_ENGINE_H
