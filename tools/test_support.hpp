// test_support.hpp - Shared helpers for the blindlink test programs
//
// - TestCounter: [PASS]/[FAIL] bookkeeping and the RESULTS summary
// - ManualScheduler: timers fire only when the test advances the clock;
//   spawned tasks run on real threads so callers can block on them
// - waitUntil: poll a condition with a wall-clock bound

#pragma once

#include "blindlink/logging.hpp"
#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace blindlink {
namespace test {

struct TestCounter {
    int pass = 0;
    int fail = 0;

    void check(bool ok, const std::string& what) {
        if (ok) {
            std::cout << "  [PASS] " << what << "\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << what << "\n";
            fail++;
        }
    }

    int summary(const char* suite) const {
        std::cout << "\n========================================\n";
        std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
        std::cout << "========================================\n";

        if (fail == 0) {
            std::cout << "\n[SUCCESS] All " << suite << " tests passed!\n";
            return 0;
        }
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
};

inline bool waitUntil(const std::function<bool()>& cond,
                      std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

class ManualScheduler : public scheduler::Scheduler {
public:
    ~ManualScheduler() override { joinAll(); }

    scheduler::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    std::shared_ptr<scheduler::TimerHandle> scheduleAfter(scheduler::Duration delay,
                                                          Task task) override {
        auto handle = std::make_shared<scheduler::TimerHandle>();
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.push_back(Timer{now_ + delay, next_seq_++, handle, std::move(task)});
        return handle;
    }

    std::shared_ptr<scheduler::TaskHandle> spawn(SpawnedTask task) override {
        auto handle = std::make_shared<scheduler::TaskHandle>();
        std::lock_guard<std::mutex> lock(threads_mutex_);
        spawned_++;
        threads_.emplace_back([handle, task = std::move(task)]() {
            task(*handle);
            handle->markDone();
        });
        return handle;
    }

    // Move the clock forward and run every timer that came due, in order
    void advance(scheduler::Duration delta) {
        scheduler::TimePoint target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ + delta;
        }

        for (;;) {
            Timer due;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = std::min_element(timers_.begin(), timers_.end(),
                                           [](const Timer& a, const Timer& b) {
                                               if (a.deadline != b.deadline) return a.deadline < b.deadline;
                                               return a.seq < b.seq;
                                           });
                if (it == timers_.end() || it->deadline > target) {
                    now_ = target;
                    return;
                }
                due = std::move(*it);
                timers_.erase(it);
                now_ = due.deadline;
            }
            if (!due.handle->isCancelled()) {
                due.task();
            }
        }
    }

    // Timers scheduled and not yet cancelled or fired
    size_t liveTimers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(timers_.begin(), timers_.end(),
                                                 [](const Timer& t) { return !t.handle->isCancelled(); }));
    }

    int spawnedTasks() const {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        return spawned_;
    }

    void joinAll() {
        std::list<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(threads_mutex_);
            threads.swap(threads_);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

private:
    struct Timer {
        scheduler::TimePoint deadline;
        uint64_t seq = 0;
        std::shared_ptr<scheduler::TimerHandle> handle;
        Task task;
    };

    mutable std::mutex mutex_;
    scheduler::TimePoint now_{};
    std::vector<Timer> timers_;
    uint64_t next_seq_ = 0;

    mutable std::mutex threads_mutex_;
    std::list<std::thread> threads_;
    int spawned_ = 0;
};

} // namespace test
} // namespace blindlink
