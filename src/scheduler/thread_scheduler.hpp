#pragma once

#include "scheduler.hpp"

#include <list>
#include <queue>
#include <thread>
#include <vector>

namespace blindlink {
namespace scheduler {

/**
 * ThreadScheduler
 *
 * Default Scheduling Port. One timer thread services a deadline-ordered
 * queue; each spawned task gets its own thread. Timer callbacks run on the
 * timer thread with no scheduler lock held, so they may arm or cancel
 * other timers.
 */
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TimePoint now() const override;
    std::shared_ptr<TimerHandle> scheduleAfter(Duration delay, Task task) override;
    std::shared_ptr<TaskHandle> spawn(SpawnedTask task) override;

    // Stop the timer thread (pending timers are dropped) and join all
    // spawned tasks. Safe to call more than once.
    void shutdown();

    size_t pendingTimers() const;

private:
    struct TimerEntry {
        TimePoint deadline;
        uint64_t seq;
        std::shared_ptr<TimerHandle> handle;
        Task task;
    };

    struct LaterFirst {
        bool operator()(const TimerEntry& a, const TimerEntry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<TaskHandle> handle;
    };

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::priority_queue<TimerEntry, std::vector<TimerEntry>, LaterFirst> timers_;
    uint64_t next_seq_ = 0;
    bool running_ = true;
    std::thread timer_thread_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    void timerLoop();
    void reapFinishedWorkers();
};

} // namespace scheduler
} // namespace blindlink
