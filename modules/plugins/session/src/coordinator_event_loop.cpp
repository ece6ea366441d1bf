#include "coordinator_event_loop.h"
#include "logger.h"

#include <algorithm>
#include <exception>

namespace peerlink {

CoordinatorEventLoop::~CoordinatorEventLoop() {
    stop();
    if (m_thread.joinable()) {
        if (isLoopThread()) {
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
}

void CoordinatorEventLoop::start(EventHandler handler) {
    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("CEL: already running");
        return;
    }
    if (m_thread.joinable()) {
        // A previous stop() ran on the loop thread itself.
        m_thread.join();
    }

    m_event_handler = std::move(handler);
    m_stopping.store(false, std::memory_order_release);
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&CoordinatorEventLoop::runLoop, this);
    LOG_DEBUG("CEL: started");
}

void CoordinatorEventLoop::stop() {
    if (!m_running.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping.store(true, std::memory_order_release);
        m_running.store(false, std::memory_order_release);
        m_event_queue.clear();
        m_scheduled_events.clear();
    }
    m_cv.notify_all();

    if (m_thread.joinable() && !isLoopThread()) {
        m_thread.join();
    }
    LOG_DEBUG("CEL: stopped");
}

bool CoordinatorEventLoop::isLoopThread() const {
    return std::this_thread::get_id() == m_thread_id.load(std::memory_order_acquire);
}

void CoordinatorEventLoop::pushEvent(CoordinatorEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping.load(std::memory_order_acquire)) {
            return;
        }
        m_event_queue.push_back(std::move(event));
    }
    m_cv.notify_one();
}

void CoordinatorEventLoop::addScheduledEvent(const std::string& id, CoordinatorEvent event,
                                             Clock::time_point due_time) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping.load(std::memory_order_acquire)) {
            return;
        }

        m_scheduled_events.erase(
            std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                           [&id](const ScheduledEvent& e) { return e.id == id; }),
            m_scheduled_events.end());

        // Keep sorted; equal due times stay in insertion order.
        auto pos = std::upper_bound(m_scheduled_events.begin(), m_scheduled_events.end(), due_time,
                                    [](Clock::time_point t, const ScheduledEvent& e) { return t < e.due_time; });
        m_scheduled_events.insert(pos, ScheduledEvent{id, std::move(event), due_time});
    }
    m_cv.notify_one();
}

void CoordinatorEventLoop::removeScheduledEvent(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scheduled_events.erase(
        std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; }),
        m_scheduled_events.end());
}

void CoordinatorEventLoop::clearScheduledEvents() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scheduled_events.clear();
}

bool CoordinatorEventLoop::hasScheduledEvent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; });
}

size_t CoordinatorEventLoop::scheduledCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scheduled_events.size();
}

void CoordinatorEventLoop::post(Task task) {
    pushEvent(DeferredTaskEvent{std::move(task)});
}

void CoordinatorEventLoop::schedule(const std::string& id, std::chrono::milliseconds delay, Task task) {
    addScheduledEvent(id, DeferredTaskEvent{std::move(task)}, Clock::now() + delay);
}

void CoordinatorEventLoop::cancel(const std::string& id) {
    removeScheduledEvent(id);
}

void CoordinatorEventLoop::runLoop() {
    m_thread_id.store(std::this_thread::get_id(), std::memory_order_release);

    while (!m_stopping.load(std::memory_order_acquire)) {
        std::deque<CoordinatorEvent> ready;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            auto has_work = [this] {
                return m_stopping.load(std::memory_order_acquire) || !m_event_queue.empty() ||
                       (!m_scheduled_events.empty() && m_scheduled_events.front().due_time <= Clock::now());
            };
            while (!has_work()) {
                if (m_scheduled_events.empty()) {
                    m_cv.wait(lock);
                } else {
                    m_cv.wait_until(lock, m_scheduled_events.front().due_time);
                }
            }
            if (m_stopping.load(std::memory_order_acquire)) {
                break;
            }

            ready.swap(m_event_queue);

            const auto now = Clock::now();
            size_t due = 0;
            while (due < m_scheduled_events.size() && m_scheduled_events[due].due_time <= now) {
                ready.push_back(std::move(m_scheduled_events[due].event));
                ++due;
            }
            m_scheduled_events.erase(m_scheduled_events.begin(), m_scheduled_events.begin() + due);
        }

        for (const auto& event : ready) {
            if (m_stopping.load(std::memory_order_acquire)) {
                break;
            }
            dispatch(event);
        }
    }

    LOG_DEBUG("CEL: exited main loop");
}

void CoordinatorEventLoop::dispatch(const CoordinatorEvent& event) {
    try {
        if (auto* deferred = std::get_if<DeferredTaskEvent>(&event)) {
            if (deferred->task) deferred->task();
        } else if (m_event_handler) {
            m_event_handler(event);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("CEL: event handler threw: ") + e.what());
    }
}

} // namespace peerlink
