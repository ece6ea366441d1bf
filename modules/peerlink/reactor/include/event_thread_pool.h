#ifndef PEERLINK_EVENT_THREAD_POOL_H
#define PEERLINK_EVENT_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {

/**
 * Worker pool used for blocking work that must stay off the coordinator thread
 * (transport writes). Each worker owns its queue; tasks submitted with the
 * same key always land on the same worker so their order is preserved.
 */
class EventThreadPool {
public:
    using Task = std::function<void()>;

    /**
     * num_workers: worker thread count (0 = hardware concurrency)
     */
    explicit EventThreadPool(size_t num_workers = 0);
    ~EventThreadPool();

    EventThreadPool(const EventThreadPool&) = delete;
    EventThreadPool& operator=(const EventThreadPool&) = delete;

    /**
     * Tasks with the same key run sequentially; different keys may run in parallel.
     * Returns false once the pool is shut down.
     */
    bool submit(const std::string& key, Task task);

    /**
     * Round-robin submission for tasks with no ordering requirement.
     */
    bool submit_any(Task task);

    /**
     * Stops accepting work. Queued tasks that have not started are dropped;
     * with blocking=true the call waits for running tasks to finish.
     */
    void shutdown(bool blocking = true);

    size_t worker_count() const { return m_workers.size(); }
    size_t pending_tasks() const;
    bool is_running() const { return m_running.load(); }

private:
    struct Worker {
        std::deque<Task> queue;
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
    };

    void worker_loop(Worker& worker);
    bool enqueue(size_t worker_id, Task task);
    size_t get_worker_id(const std::string& key) const;

    std::vector<std::unique_ptr<Worker>> m_workers;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_round_robin_counter;
    std::mutex m_shutdown_mutex;
};

} // namespace peerlink

#endif // PEERLINK_EVENT_THREAD_POOL_H
