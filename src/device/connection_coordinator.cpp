// Connection lifecycle and request coalescing

#include "connection_coordinator.hpp"
#include "blindlink/logging.hpp"

#include <algorithm>

namespace blindlink {
namespace device {

// =============================================================================
// CONSTRUCTOR
// =============================================================================

ConnectionCoordinator::ConnectionCoordinator(transport::TransportPort& transport,
                                             scheduler::Scheduler& sched,
                                             const CoordinatorConfig& config)
    : transport_(transport)
    , sched_(sched)
    , config_(config)
    , timer_(sched, [this]() { disconnect(); })
{
}

ConnectionCoordinator::~ConnectionCoordinator() {
    timer_.cancel();

    std::vector<std::shared_ptr<scheduler::TaskHandle>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_) {
            resolveLocked(pending_, Outcome::CANCELLED);
        }
        tasks.swap(tasks_);
    }
    // Attempts capture `this`, cancelled ones included
    for (auto& task : tasks) {
        task->cancel();
        task->wait();
    }
}

// =============================================================================
// CONFIGURATION
// =============================================================================

void ConnectionCoordinator::setTarget(const LinkTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    target_ = target;
}

LinkTarget ConnectionCoordinator::getTarget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_;
}

void ConnectionCoordinator::setStateChangedCallback(StateChangedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_state_changed_ = std::move(cb);
}

void ConnectionCoordinator::setNotificationCallback(NotificationCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_notification_ = std::move(cb);
}

void ConnectionCoordinator::setLinkUpCallback(LinkUpCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_link_up_ = std::move(cb);
}

// =============================================================================
// CONNECTION CONTROL
// =============================================================================

bool ConnectionCoordinator::ensureReady(bool use_notification_delay) {
    std::shared_ptr<PendingConnection> attempt;
    uint64_t token = 0;
    bool first_caller = false;

    {
        std::unique_lock<std::mutex> lock(mutex_);

        // Fast path: live link and nobody mid-initialization
        if (!pending_ && linkAliveLocked()) {
            timer_.refresh(config_.idle_timeout);
            return true;
        }

        if (!pending_ && link_) {
            LOG_LINK(WARN, "Coordinator: stale link %u dropped before reconnecting", *link_);
            link_.reset();
            timer_.cancel();
        }

        token = ++last_caller_token_;

        if (!pending_) {
            pending_ = std::make_shared<PendingConnection>();
            pending_->use_notification_delay = use_notification_delay;
            first_caller = true;
            stats_.attempts_started++;
            setStateLocked(ConnectionState::CONNECTING);
            LOG_LINK(INFO, "Coordinator: first caller (token %llu) connecting to %s",
                     static_cast<unsigned long long>(token), target_.displayName().c_str());
        } else {
            stats_.callers_coalesced++;
            LOG_LINK(INFO, "Coordinator: already connecting, caller %llu waits",
                     static_cast<unsigned long long>(token));
        }

        attempt = pending_;
        attempt->waiters++;
    }
    deliverStateEvents();

    if (first_caller) {
        auto task = sched_.spawn([this, attempt](const scheduler::TaskHandle& self) {
            runAttempt(attempt, self);
        });

        std::lock_guard<std::mutex> lock(mutex_);
        attempt->task = task;
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                    [](const std::shared_ptr<scheduler::TaskHandle>& t) {
                                        return t->isDone();
                                    }),
                     tasks_.end());
        tasks_.push_back(task);
        if (attempt->outcome == Outcome::CANCELLED) {
            task->cancel();
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    attempt->cv.wait(lock, [&attempt] { return attempt->outcome != Outcome::WAITING; });
    attempt->waiters--;

    if (attempt->outcome == Outcome::FAILED) {
        std::exception_ptr error = attempt->error;
        lock.unlock();
        std::rethrow_exception(error);
    }

    if (attempt->outcome == Outcome::CANCELLED) {
        LOG_LINK(INFO, "Coordinator: caller %llu released, connecting cancelled",
                 static_cast<unsigned long long>(token));
        return false;
    }

    bool is_last_caller = token == last_caller_token_;
    LOG_LINK(DEBUG, "Coordinator: caller %llu ready=%d (last caller %llu)",
             static_cast<unsigned long long>(token), is_last_caller ? 1 : 0,
             static_cast<unsigned long long>(last_caller_token_));
    return is_last_caller;
}

void ConnectionCoordinator::disconnect() {
    std::optional<LinkHandle> link;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        setStateLocked(ConnectionState::DISCONNECTING);

        if (pending_) {
            LOG_LINK(INFO, "Coordinator: cancelling connection to %s",
                     target_.displayName().c_str());
            if (pending_->task) {
                pending_->task->cancel();
            }
            stats_.attempts_cancelled++;
            resolveLocked(pending_, Outcome::CANCELLED);
        }

        timer_.cancel();

        if (link_) {
            link = link_;
            link_.reset();
            stats_.disconnects++;
        }
    }
    deliverStateEvents();

    if (link) {
        LOG_LINK(INFO, "Coordinator: disconnecting %s (link %u)",
                 getTarget().displayName().c_str(), *link);
        closeLink(*link);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A new attempt may have started while the link was closing
        if (state_ == ConnectionState::DISCONNECTING) {
            setStateLocked(ConnectionState::DISCONNECTED);
        }
    }
    deliverStateEvents();
}

void ConnectionCoordinator::refreshIdleTimer(std::optional<scheduler::Duration> timeout, bool force) {
    timer_.refresh(timeout ? *timeout : config_.idle_timeout, force);
}

// =============================================================================
// CONNECT ATTEMPT (runs on a spawned task)
// =============================================================================

void ConnectionCoordinator::runAttempt(const std::shared_ptr<PendingConnection>& attempt,
                                       const scheduler::TaskHandle& self) {
    LinkTarget target;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        // A cancelled attempt may still be inside transport_.connect()
        if (connect_in_flight_) {
            LOG_LINK(DEBUG, "Coordinator: waiting for the previous connect to finish");
        }
        connect_done_cv_.wait(lock, [this, &attempt] {
            return !connect_in_flight_ || attempt->outcome != Outcome::WAITING;
        });
        if (attempt->outcome != Outcome::WAITING) return;
        connect_in_flight_ = true;
        target = target_;
    }

    LinkHandle handle = 0;
    try {
        LOG_LINK(INFO, "Coordinator: establishing connection to %s", target.displayName().c_str());
        handle = transport_.connect(target, config_.max_connect_attempts);
    } catch (const std::exception& e) {
        releaseConnectSlot();
        failAttempt(attempt, std::current_exception(), e.what());
        return;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (attempt->outcome != Outcome::WAITING || self.isCancelled()) {
            lock.unlock();
            LOG_LINK(INFO, "Coordinator: link %u arrived after cancel, closing", handle);
            closeLink(handle);
            releaseConnectSlot();
            return;
        }
        link_ = handle;
        connect_in_flight_ = false;
        connect_done_cv_.notify_all();
        setStateLocked(ConnectionState::CONNECTED);
    }
    deliverStateEvents();
    LOG_LINK(INFO, "Coordinator: connected to %s (link %u)", target.displayName().c_str(), handle);

    LinkUpCallback on_link_up;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_link_up = on_link_up_;
    }

    try {
        transport_.subscribe(handle, transport::NOTIFICATION_CHARACTERISTIC,
                             [this](const Bytes& raw) { forwardNotification(raw); });
        transport_.onUnsolicitedDisconnect(handle,
                                           [this](LinkHandle h) { onPeerDisconnect(h); });

        if (on_link_up && !self.isCancelled()) {
            on_link_up(attempt->use_notification_delay);
        }
    } catch (const std::exception& e) {
        failAttempt(attempt, std::current_exception(), e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt->outcome != Outcome::WAITING) {
        // disconnect() already resolved the waiters and closed the link
        return;
    }

    if (!link_ || *link_ != handle) {
        LOG_LINK(WARN, "Coordinator: link %u lost during initialization", handle);
        resolveLocked(attempt, Outcome::CANCELLED);
        return;
    }

    timer_.refresh(config_.idle_timeout);
    resolveLocked(attempt, Outcome::READY);
}

void ConnectionCoordinator::releaseConnectSlot() {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_in_flight_ = false;
    connect_done_cv_.notify_all();
}

void ConnectionCoordinator::failAttempt(const std::shared_ptr<PendingConnection>& attempt,
                                        std::exception_ptr error, const char* what) {
    std::optional<LinkHandle> link;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt->outcome != Outcome::WAITING) {
            LOG_LINK(WARN, "Coordinator: attempt failed after it was resolved: %s", what);
            return;
        }

        LOG_LINK(ERROR, "Coordinator: connecting to %s failed: %s",
                 target_.displayName().c_str(), what);
        stats_.attempts_failed++;
        timer_.cancel();
        link = link_;
        link_.reset();
        setStateLocked(ConnectionState::DISCONNECTED);
        attempt->error = error;
        resolveLocked(attempt, Outcome::FAILED);
    }
    deliverStateEvents();

    if (link) {
        closeLink(*link);
    }
}

// =============================================================================
// TRANSPORT CALLBACKS
// =============================================================================

void ConnectionCoordinator::onPeerDisconnect(LinkHandle handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!link_ || *link_ != handle) {
            LOG_LINK(DEBUG, "Coordinator: ignoring disconnect of stale link %u", handle);
            return;
        }

        LOG_LINK(INFO, "Coordinator: %s disconnected by peer", target_.displayName().c_str());
        link_.reset();
        timer_.cancel();
        stats_.unsolicited_drops++;
        setStateLocked(ConnectionState::DISCONNECTED);
    }
    deliverStateEvents();
}

void ConnectionCoordinator::forwardNotification(const Bytes& raw) {
    NotificationCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_notification_;
    }
    if (cb) {
        cb(raw);
    }
}

// =============================================================================
// STATE
// =============================================================================

ConnectionState ConnectionCoordinator::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionCoordinator::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return linkAliveLocked();
}

std::optional<LinkHandle> ConnectionCoordinator::getLink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_;
}

size_t ConnectionCoordinator::waitingCallers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ ? pending_->waiters : 0;
}

bool ConnectionCoordinator::isAttemptInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ != nullptr;
}

CoordinatorStats ConnectionCoordinator::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ConnectionCoordinator::setStateLocked(ConnectionState state) {
    if (state != state_) {
        LOG_LINK(DEBUG, "Coordinator: %s -> %s",
                 connectionStateToString(state_), connectionStateToString(state));
    }
    state_ = state;
    state_events_.push_back(state);
}

bool ConnectionCoordinator::linkAliveLocked() const {
    return link_.has_value() && transport_.isConnected(*link_);
}

void ConnectionCoordinator::resolveLocked(std::shared_ptr<PendingConnection> attempt,
                                          Outcome outcome) {
    attempt->outcome = outcome;
    if (pending_ == attempt) {
        pending_.reset();
    }
    attempt->cv.notify_all();
    connect_done_cv_.notify_all();
}

void ConnectionCoordinator::deliverStateEvents() {
    // Serializes delivery so observers see transitions in order
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

    for (;;) {
        ConnectionState state;
        StateChangedCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_events_.empty()) return;
            state = state_events_.front();
            state_events_.pop_front();
            cb = on_state_changed_;
        }
        if (cb) {
            cb(state);
        }
    }
}

void ConnectionCoordinator::closeLink(LinkHandle handle) {
    try {
        transport_.disconnect(handle);
    } catch (const std::exception& e) {
        LOG_LINK(WARN, "Coordinator: transport disconnect of link %u failed: %s",
                 handle, e.what());
    }
}

} // namespace device
} // namespace blindlink
