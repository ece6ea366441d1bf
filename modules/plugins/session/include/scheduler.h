#ifndef PEERLINK_SCHEDULER_H
#define PEERLINK_SCHEDULER_H

#include <chrono>
#include <functional>
#include <string>

namespace peerlink {

// Deferred execution on one serial context. Tasks scheduled under an id
// replace any earlier task with the same id.
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    virtual void schedule(const std::string& id, std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancel(const std::string& id) = 0;
};

} // namespace peerlink

#endif // PEERLINK_SCHEDULER_H
