#include "event_thread_pool.h"
#include "logger.h"

namespace peerlink {

EventThreadPool::EventThreadPool(size_t num_workers)
    : m_running(true),
      m_round_robin_counter(0) {
    size_t count = num_workers > 0 ? num_workers : std::thread::hardware_concurrency();
    if (count == 0) {
        count = 1;
    }

    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        m_workers.push_back(std::make_unique<Worker>());
    }
    // Start threads only after every Worker exists; worker_loop never touches siblings.
    for (auto& worker : m_workers) {
        Worker* w = worker.get();
        w->thread = std::thread([this, w] { worker_loop(*w); });
    }
}

EventThreadPool::~EventThreadPool() {
    shutdown(true);
}

bool EventThreadPool::submit(const std::string& key, Task task) {
    return enqueue(get_worker_id(key), std::move(task));
}

bool EventThreadPool::submit_any(Task task) {
    const size_t worker_id = m_round_robin_counter.fetch_add(1) % m_workers.size();
    return enqueue(worker_id, std::move(task));
}

bool EventThreadPool::enqueue(size_t worker_id, Task task) {
    if (!m_running) return false;

    Worker& worker = *m_workers[worker_id];
    {
        std::lock_guard<std::mutex> lock(worker.mutex);
        worker.queue.push_back(std::move(task));
    }
    worker.cv.notify_one();
    return true;
}

void EventThreadPool::shutdown(bool blocking) {
    std::lock_guard<std::mutex> guard(m_shutdown_mutex);
    const bool was_running = m_running.exchange(false);

    if (was_running) {
        size_t dropped = 0;
        for (auto& worker : m_workers) {
            std::lock_guard<std::mutex> lock(worker->mutex);
            dropped += worker->queue.size();
            worker->queue.clear();
            worker->cv.notify_all();
        }
        if (dropped > 0) {
            LOG_DEBUG("EventThreadPool: dropped " + std::to_string(dropped) + " queued task(s) on shutdown");
        }
    }

    // Non-blocking callers leave the join to the destructor.
    if (!blocking) return;
    for (auto& worker : m_workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

size_t EventThreadPool::pending_tasks() const {
    size_t total = 0;
    for (const auto& worker : m_workers) {
        std::lock_guard<std::mutex> lock(worker->mutex);
        total += worker->queue.size();
    }
    return total;
}

void EventThreadPool::worker_loop(Worker& worker) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(worker.mutex);
            worker.cv.wait(lock, [this, &worker] {
                return !worker.queue.empty() || !m_running;
            });
            if (!m_running) {
                break;
            }
            task = std::move(worker.queue.front());
            worker.queue.pop_front();
        }

        // A throwing task must not take the worker down with it.
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("EventThreadPool: task threw: ") + e.what());
        }
    }
}

size_t EventThreadPool::get_worker_id(const std::string& key) const {
    size_t hash_val = 0;
    for (char c : key) {
        hash_val = hash_val * 31 + static_cast<unsigned char>(c);
    }
    return hash_val % m_workers.size();
}

} // namespace peerlink
