#include "disconnect_timer.hpp"
#include "blindlink/logging.hpp"

namespace blindlink {
namespace device {

DisconnectTimer::DisconnectTimer(scheduler::Scheduler& sched, ExpiredCallback on_expired)
    : sched_(sched)
    , on_expired_(std::move(on_expired))
{
}

DisconnectTimer::~DisconnectTimer() {
    cancel();
}

void DisconnectTimer::refresh(scheduler::Duration timeout, bool force) {
    scheduler::TimePoint candidate = sched_.now() + timeout;

    std::lock_guard<std::mutex> lock(mutex_);

    // Never shorten an armed window unless asked to
    if (!force && handle_ && deadline_ > candidate) {
        LOG_LINK(DEBUG, "DisconnectTimer: keeping later deadline (refresh %lld ms ignored)",
                 static_cast<long long>(timeout.count()));
        return;
    }

    if (handle_) {
        handle_->cancel();
    }

    uint64_t generation = ++generation_;
    deadline_ = candidate;
    handle_ = sched_.scheduleAfter(timeout, [this, generation]() { onTimer(generation); });

    LOG_LINK(INFO, "DisconnectTimer: disconnect in %lld ms%s",
             static_cast<long long>(timeout.count()), force ? " (forced)" : "");
}

void DisconnectTimer::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) return;

    handle_->cancel();
    handle_.reset();
    ++generation_;
    LOG_LINK(DEBUG, "DisconnectTimer: cancelled");
}

bool DisconnectTimer::isArmed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

std::optional<scheduler::TimePoint> DisconnectTimer::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) return std::nullopt;
    return deadline_;
}

void DisconnectTimer::onTimer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Stale: replaced or cancelled after the scheduler dequeued it
        if (generation != generation_ || !handle_) {
            return;
        }
        handle_.reset();
    }

    LOG_LINK(INFO, "DisconnectTimer: idle timeout, disconnecting");
    if (on_expired_) {
        on_expired_();
    }
}

} // namespace device
} // namespace blindlink
