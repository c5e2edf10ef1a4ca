#pragma once

#include "disconnect_timer.hpp"
#include "scheduler/scheduler.hpp"
#include "transport/transport_port.hpp"
#include "blindlink/types.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace blindlink {
namespace device {

struct CoordinatorConfig {
    scheduler::Duration idle_timeout{15000};   // Disconnect after this much inactivity
    int max_connect_attempts = 5;              // Passed to the transport's connect
};

struct CoordinatorStats {
    int attempts_started = 0;     // Physical connect attempts issued
    int callers_coalesced = 0;    // Callers that joined an attempt already in flight
    int attempts_failed = 0;
    int attempts_cancelled = 0;
    int unsolicited_drops = 0;    // Peer-initiated disconnects
    int disconnects = 0;          // Links we closed ourselves
};

/**
 * Connection Coordinator
 *
 * Owns the link lifecycle of one peripheral:
 *
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTING -> DISCONNECTED
 *   CONNECTING -> DISCONNECTED        (failure or cancellation)
 *   any -> DISCONNECTED                (peer dropped the link)
 *
 * ensureReady() may be called from many threads at once. The first caller
 * spawns the single physical connection attempt; later callers wait on it.
 * When it completes every waiter sees the same outcome, but only the most
 * recent caller gets true: the first caller connects, the last caller's
 * command proceeds.
 *
 * No user callback and no transport call runs while the state mutex is
 * held. State-change events are delivered in transition order.
 */
class ConnectionCoordinator {
public:
    using StateChangedCallback = std::function<void(ConnectionState state)>;
    using NotificationCallback = std::function<void(const Bytes& raw)>;
    // Runs on the connect task after the link is up and subscribed.
    // Sends the initialization commands; may throw TransportError.
    using LinkUpCallback = std::function<void(bool use_notification_delay)>;

    ConnectionCoordinator(transport::TransportPort& transport,
                          scheduler::Scheduler& sched,
                          const CoordinatorConfig& config = CoordinatorConfig{});
    ~ConnectionCoordinator();

    ConnectionCoordinator(const ConnectionCoordinator&) = delete;
    ConnectionCoordinator& operator=(const ConnectionCoordinator&) = delete;

    // --- Configuration ---

    void setTarget(const LinkTarget& target);
    LinkTarget getTarget() const;

    void setStateChangedCallback(StateChangedCallback cb);
    void setNotificationCallback(NotificationCallback cb);
    void setLinkUpCallback(LinkUpCallback cb);

    // --- Connection Control ---

    // True when a command may be sent now by this caller.
    // Throws TransportError when the attempt failed at the transport.
    bool ensureReady(bool use_notification_delay = false);

    // Cancel an attempt in flight, close a live link. Never throws.
    void disconnect();

    // Push the idle deadline out (never shortens it unless forced)
    void refreshIdleTimer(std::optional<scheduler::Duration> timeout = std::nullopt,
                          bool force = false);

    // --- State ---

    ConnectionState getState() const;
    bool isConnected() const;
    std::optional<LinkHandle> getLink() const;
    size_t waitingCallers() const;
    bool isAttemptInFlight() const;
    CoordinatorStats getStats() const;
    const DisconnectTimer& idleTimer() const { return timer_; }

private:
    struct PendingConnection {
        enum class Outcome { WAITING, READY, FAILED, CANCELLED };

        Outcome outcome = Outcome::WAITING;
        std::exception_ptr error;
        std::condition_variable cv;     // Waits on the coordinator mutex
        size_t waiters = 0;
        bool use_notification_delay = false;
        std::shared_ptr<scheduler::TaskHandle> task;
    };
    using Outcome = PendingConnection::Outcome;

    transport::TransportPort& transport_;
    scheduler::Scheduler& sched_;
    CoordinatorConfig config_;
    DisconnectTimer timer_;

    mutable std::mutex mutex_;
    LinkTarget target_;
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    std::optional<LinkHandle> link_;
    std::shared_ptr<PendingConnection> pending_;
    // Spawned attempts not yet known to be finished
    std::vector<std::shared_ptr<scheduler::TaskHandle>> tasks_;
    // One transport_.connect() at a time, even across cancelled attempts
    bool connect_in_flight_ = false;
    std::condition_variable connect_done_cv_;
    uint64_t last_caller_token_ = 0;
    CoordinatorStats stats_;

    StateChangedCallback on_state_changed_;
    NotificationCallback on_notification_;
    LinkUpCallback on_link_up_;

    // State events queued under mutex_, delivered outside it
    std::deque<ConnectionState> state_events_;
    std::recursive_mutex delivery_mutex_;

    void runAttempt(const std::shared_ptr<PendingConnection>& attempt,
                    const scheduler::TaskHandle& self);
    void failAttempt(const std::shared_ptr<PendingConnection>& attempt,
                     std::exception_ptr error, const char* what);
    void releaseConnectSlot();
    void onPeerDisconnect(LinkHandle handle);
    void forwardNotification(const Bytes& raw);

    // Caller holds mutex_
    void setStateLocked(ConnectionState state);
    bool linkAliveLocked() const;
    // Takes the attempt by value: callers may pass pending_ itself
    void resolveLocked(std::shared_ptr<PendingConnection> attempt, Outcome outcome);

    void deliverStateEvents();
    void closeLink(LinkHandle handle);
};

} // namespace device
} // namespace blindlink
