#include "thread_scheduler.hpp"
#include "blindlink/logging.hpp"

namespace blindlink {
namespace scheduler {

// =============================================================================
// TASK HANDLE
// =============================================================================

void TaskHandle::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

bool TaskHandle::isDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

void TaskHandle::markDone() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

// =============================================================================
// THREAD SCHEDULER
// =============================================================================

ThreadScheduler::ThreadScheduler() {
    timer_thread_ = std::thread(&ThreadScheduler::timerLoop, this);
}

ThreadScheduler::~ThreadScheduler() {
    shutdown();
}

TimePoint ThreadScheduler::now() const {
    return Clock::now();
}

std::shared_ptr<TimerHandle> ThreadScheduler::scheduleAfter(Duration delay, Task task) {
    auto handle = std::make_shared<TimerHandle>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            LOG_LINK(WARN, "ThreadScheduler: scheduleAfter after shutdown, timer dropped");
            handle->cancel();
            return handle;
        }
        timers_.push(TimerEntry{Clock::now() + delay, next_seq_++, handle, std::move(task)});
    }
    timer_cv_.notify_all();
    return handle;
}

std::shared_ptr<TaskHandle> ThreadScheduler::spawn(SpawnedTask task) {
    auto handle = std::make_shared<TaskHandle>();

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reapFinishedWorkers();

    Worker worker;
    worker.handle = handle;
    worker.thread = std::thread([handle, task = std::move(task)]() {
        task(*handle);
        handle->markDone();
    });
    workers_.push_back(std::move(worker));
    return handle;
}

void ThreadScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        while (!timers_.empty()) {
            timers_.top().handle->cancel();
            timers_.pop();
        }
    }
    timer_cv_.notify_all();

    if (timer_thread_.joinable() && timer_thread_.get_id() != std::this_thread::get_id()) {
        timer_thread_.join();
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            if (worker.thread.get_id() == std::this_thread::get_id()) {
                worker.thread.detach();
            } else {
                worker.thread.join();
            }
        }
    }
}

size_t ThreadScheduler::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void ThreadScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (timers_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }

        TimePoint deadline = timers_.top().deadline;
        if (Clock::now() < deadline) {
            timer_cv_.wait_until(lock, deadline);
            continue;
        }

        TimerEntry entry = timers_.top();
        timers_.pop();
        if (entry.handle->isCancelled()) {
            continue;
        }

        lock.unlock();
        entry.task();
        lock.lock();
    }
}

// Caller holds workers_mutex_
void ThreadScheduler::reapFinishedWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->handle->isDone()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace scheduler
} // namespace blindlink
