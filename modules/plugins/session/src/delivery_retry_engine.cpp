#include "delivery_retry_engine.h"
#include "envelope_codec.h"
#include "event_thread_pool.h"
#include "logger.h"
#include "telemetry.h"
#include "transport_adapter.h"

#include <algorithm>

namespace peerlink {

DeliveryRetryEngine::DeliveryRetryEngine(TransportAdapter& transport, Scheduler& scheduler, EventThreadPool* pool,
                                         Telemetry* telemetry, const Config& config)
    : m_transport(transport),
      m_scheduler(scheduler),
      m_pool(pool),
      m_telemetry(telemetry),
      m_config(config) {
    m_config.max_retry_attempts = std::max(0, m_config.max_retry_attempts);
}

DeliveryRetryEngine::~DeliveryRetryEngine() {
    cancelAll();
}

void DeliveryRetryEngine::sendWithRetry(const Envelope& envelope, const std::vector<PeerIdentity>& targets,
                                        Completion completion) {
    if (targets.empty()) {
        LOG_DEBUG("DRE: no targets, nothing to send");
        return;
    }

    auto job = std::make_shared<Job>();
    job->id = m_next_id.fetch_add(1);
    job->kind = envelope_kind_to_string(envelope.kind());
    job->data = EnvelopeCodec::encode(envelope);
    job->targets = targets;
    job->completion = std::move(completion);
    job->started = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs[job->id] = job;
    }
    transmit(job);
}

void DeliveryRetryEngine::transmit(const std::shared_ptr<Job>& job) {
    auto task = [this, job] {
        if (m_telemetry) m_telemetry->inc_counter("send_attempts");

        bool delivered = false;
        std::string error;
        try {
            m_transport.send(job->data, job->targets);
            delivered = true;
        } catch (const TransmitError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("unexpected transport error: ") + e.what();
        }
        m_scheduler.post([this, job, delivered, error] { onResult(job, delivered, error); });
    };

    if (!m_pool) {
        task();
        return;
    }
    // Same target set -> same worker, so sends to a peer keep their order.
    std::string key;
    for (const auto& peer : job->targets) {
        key += peer.id;
        key += ',';
    }
    if (!m_pool->submit(key, task)) {
        LOG_WARN("DRE: sender pool stopped, dropping " + job->kind + " envelope");
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.erase(job->id);
    }
}

void DeliveryRetryEngine::onResult(const std::shared_ptr<Job>& job, bool delivered, const std::string& error) {
    if (!isActive(job->id)) {
        return;  // cancelled while the attempt was in flight
    }

    if (delivered) {
        if (m_telemetry) {
            m_telemetry->inc_counter("sends_delivered");
            m_telemetry->observe_hist_ms(
                "send_latency_ms",
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - job->started)
                    .count());
        }
        if (job->attempt > 0) {
            LOG_INFO("DRE: " + job->kind + " delivered on retry " + std::to_string(job->attempt));
        }
        finish(job, true);
        return;
    }

    if (m_telemetry) m_telemetry->inc_counter("send_failures");
    LOG_WARN("DRE: " + job->kind + " send failed (attempt " + std::to_string(job->attempt + 1) + "): " + error);

    if (job->attempt < m_config.max_retry_attempts) {
        const auto delay = backoffFor(job->attempt);
        job->attempt++;
        LOG_DEBUG("DRE: retry " + std::to_string(job->attempt) + " in " + std::to_string(delay.count()) + "ms");
        m_scheduler.schedule(timerId(job->id), delay, [this, job] {
            if (isActive(job->id)) transmit(job);
        });
        return;
    }

    if (m_telemetry) m_telemetry->inc_counter("sends_abandoned");
    LOG_WARN("DRE: giving up on " + job->kind + " after " + std::to_string(job->attempt + 1) + " attempt(s)");
    finish(job, false);
}

void DeliveryRetryEngine::finish(const std::shared_ptr<Job>& job, bool delivered) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.erase(job->id);
    }
    if (job->completion) {
        job->completion(delivered);
    }
}

bool DeliveryRetryEngine::isActive(uint64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.count(id) > 0;
}

void DeliveryRetryEngine::cancelAll() {
    std::map<uint64_t, std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        jobs.swap(m_jobs);
    }
    for (const auto& kv : jobs) {
        m_scheduler.cancel(timerId(kv.first));
    }
    if (!jobs.empty()) {
        LOG_DEBUG("DRE: cancelled " + std::to_string(jobs.size()) + " job(s)");
    }
}

size_t DeliveryRetryEngine::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

std::chrono::milliseconds DeliveryRetryEngine::backoffFor(int attempt) const {
    const int shift = std::min(std::max(attempt, 0), 20);
    return m_config.base_interval * (int64_t(1) << shift);
}

} // namespace peerlink
