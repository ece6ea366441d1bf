#ifndef PEERLINK_COORDINATOR_EVENT_LOOP_H
#define PEERLINK_COORDINATOR_EVENT_LOOP_H

#include "coordinator_events.h"
#include "scheduler.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {

/**
 * @brief Single event thread that owns every coordinator state mutation.
 *
 * Events pushed from any thread are handled in FIFO order. Scheduled events
 * are keyed by id (re-adding an id replaces the earlier entry) and fire on
 * the same thread once due. DeferredTaskEvent is run directly; every other
 * event goes to the handler passed to start().
 */
class CoordinatorEventLoop : public Scheduler {
public:
    using EventHandler = std::function<void(const CoordinatorEvent&)>;
    using Clock = std::chrono::steady_clock;

    CoordinatorEventLoop() = default;
    ~CoordinatorEventLoop() override;

    CoordinatorEventLoop(const CoordinatorEventLoop&) = delete;
    CoordinatorEventLoop& operator=(const CoordinatorEventLoop&) = delete;

    // Spawns the event thread.
    void start(EventHandler handler);
    // Drops queued and scheduled events and joins the thread (unless called on it).
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    bool isLoopThread() const;

    void pushEvent(CoordinatorEvent event);

    void addScheduledEvent(const std::string& id, CoordinatorEvent event, Clock::time_point due_time);
    void removeScheduledEvent(const std::string& id);
    void clearScheduledEvents();
    bool hasScheduledEvent(const std::string& id) const;
    size_t scheduledCount() const;

    // Scheduler
    void post(Task task) override;
    void schedule(const std::string& id, std::chrono::milliseconds delay, Task task) override;
    void cancel(const std::string& id) override;

private:
    struct ScheduledEvent {
        std::string id;
        CoordinatorEvent event;
        Clock::time_point due_time;
    };

    void runLoop();
    void dispatch(const CoordinatorEvent& event);

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::thread m_thread;
    std::atomic<std::thread::id> m_thread_id{};

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<CoordinatorEvent> m_event_queue;
    std::vector<ScheduledEvent> m_scheduled_events;  // sorted by due time

    EventHandler m_event_handler;
};

} // namespace peerlink

#endif // PEERLINK_COORDINATOR_EVENT_LOOP_H
