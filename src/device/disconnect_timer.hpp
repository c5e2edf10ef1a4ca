#pragma once

#include "scheduler/scheduler.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace blindlink {
namespace device {

/**
 * Idle-disconnect timer
 *
 * refresh() only ever pushes the deadline later unless forced; an armed
 * timer with a later deadline than now+timeout is left alone. Expiry calls
 * the callback exactly once per armed deadline, on the scheduler's thread,
 * with no internal lock held.
 */
class DisconnectTimer {
public:
    using ExpiredCallback = std::function<void()>;

    DisconnectTimer(scheduler::Scheduler& sched, ExpiredCallback on_expired);
    ~DisconnectTimer();

    DisconnectTimer(const DisconnectTimer&) = delete;
    DisconnectTimer& operator=(const DisconnectTimer&) = delete;

    void refresh(scheduler::Duration timeout, bool force = false);
    void cancel();

    bool isArmed() const;
    std::optional<scheduler::TimePoint> deadline() const;

private:
    scheduler::Scheduler& sched_;
    ExpiredCallback on_expired_;

    mutable std::mutex mutex_;
    std::shared_ptr<scheduler::TimerHandle> handle_;
    scheduler::TimePoint deadline_{};
    uint64_t generation_ = 0;

    void onTimer(uint64_t generation);
};

} // namespace device
} // namespace blindlink
