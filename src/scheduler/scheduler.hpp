#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace blindlink {
namespace scheduler {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Handle to a delayed call. cancel() before firing guarantees the task
// never starts; cancelling after it started has no effect.
class TimerHandle {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

// Handle to a spawned task. Cancellation is cooperative: the task polls
// isCancelled() between blocking steps.
class TaskHandle {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_; }

    // Block until the task body has returned
    void wait();
    bool isDone() const;

    // Called by the scheduler when the body returns
    void markDone();

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
};

/**
 * Scheduling Port
 *
 * Delayed calls (idle disconnect) and spawned tasks (connection attempts).
 * The device picks one implementation at construction: a host-supplied
 * scheduler, or the built-in ThreadScheduler. Tasks must not run inline
 * inside scheduleAfter(); spawn() may run the body on any thread.
 */
class Scheduler {
public:
    using Task = std::function<void()>;
    using SpawnedTask = std::function<void(const TaskHandle& self)>;

    virtual ~Scheduler() = default;

    virtual TimePoint now() const = 0;
    virtual std::shared_ptr<TimerHandle> scheduleAfter(Duration delay, Task task) = 0;
    virtual std::shared_ptr<TaskHandle> spawn(SpawnedTask task) = 0;
};

} // namespace scheduler
} // namespace blindlink
