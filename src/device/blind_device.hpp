#pragma once

#include "command_dispatcher.hpp"
#include "connection_coordinator.hpp"
#include "device_config.hpp"
#include "precondition_guard.hpp"
#include "crypto/crypt_port.hpp"
#include "protocol/command_frame.hpp"
#include "protocol/notification_decoder.hpp"
#include "scheduler/thread_scheduler.hpp"
#include "transport/transport_port.hpp"
#include "blindlink/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace blindlink {
namespace device {

// Outcome of a public command
enum class CommandResult : uint8_t {
    SENT,                   // Written and acknowledged
    NOT_READY,              // Superseded by a later caller, or connecting was cancelled
    NOT_SENT,               // Link vanished between connect and write
    CALIBRATION_REQUIRED,   // End-position guard refused
    FAVORITE_NOT_SET,       // Favorite guard refused
};

const char* commandResultToString(CommandResult result);

/**
 * BlindDevice
 *
 * Public face of one motorized blind. Every command runs
 * guard -> ensureReady -> build frame -> send; a refused guard never opens
 * a connection. Transport failures (NOT_FOUND, SLOTS_EXHAUSTED, exhausted
 * write retries) surface as transport::TransportError.
 *
 * Callbacks run synchronously on the thread that produced the event
 * (transport notification thread, scheduler thread or caller thread).
 * They must not destroy the device.
 */
class BlindDevice {
public:
    using PositionCallback = std::function<void(uint8_t position_percent, uint8_t tilt_percent,
                                                const EndPositionInfo& end_positions)>;
    using RunningCallback = std::function<void(bool opening)>;
    using StatusCallback = std::function<void(uint8_t position_percent, uint8_t tilt_percent,
                                              uint8_t battery_percent,
                                              std::optional<SpeedLevel> speed,
                                              const EndPositionInfo& end_positions)>;
    using ConnectionCallback = std::function<void(ConnectionState state)>;

    // Uses the built-in ThreadScheduler
    BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                crypto::CryptPort& crypt);

    // Uses a host-supplied scheduler (must outlive the device)
    BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                crypto::CryptPort& crypt, scheduler::Scheduler& host_scheduler);

    ~BlindDevice();

    BlindDevice(const BlindDevice&) = delete;
    BlindDevice& operator=(const BlindDevice&) = delete;

    // --- Configuration ---

    void setLinkTarget(const LinkTarget& target);
    LinkTarget getLinkTarget() const { return coordinator_.getTarget(); }
    const DeviceConfig& getConfig() const { return config_; }

    // --- Connection Control ---

    // True when this caller may send a command now
    bool connect(bool use_notification_delay = false);
    void disconnect();
    void refreshDisconnectTimer(std::optional<scheduler::Duration> timeout = std::nullopt,
                                bool force = false);

    // --- Movement (end-position guarded) ---

    CommandResult open(bool ignore_end_positions = false);
    CommandResult close(bool ignore_end_positions = false);
    CommandResult stop(bool ignore_end_positions = false);
    CommandResult percentage(int percent, bool ignore_end_positions = false);
    CommandResult tiltPercentage(int percent, bool ignore_end_positions = false);
    CommandResult openTilt(bool ignore_end_positions = false);
    CommandResult closeTilt(bool ignore_end_positions = false);

    // --- Favorite (favorite guarded) ---

    CommandResult favorite();

    // --- Settings and queries (unguarded) ---

    CommandResult speed(SpeedLevel level);
    CommandResult statusQuery();
    CommandResult pointSetQuery();
    CommandResult userQuery();
    CommandResult setKey();

    // --- Callbacks (one per category, last registration wins) ---

    void registerPositionCallback(PositionCallback cb);
    void registerRunningCallback(RunningCallback cb);
    void registerStatusCallback(StatusCallback cb);
    void registerConnectionCallback(ConnectionCallback cb);

    // --- State ---

    std::optional<EndPositionInfo> getEndPositionInfo() const;
    ConnectionState getConnectionState() const { return coordinator_.getState(); }
    bool isConnected() const { return coordinator_.isConnected(); }

    const ConnectionCoordinator& coordinator() const { return coordinator_; }
    const CommandDispatcher& dispatcher() const { return dispatcher_; }

private:
    BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                crypto::CryptPort& crypt, scheduler::Scheduler* host_scheduler);

    DeviceConfig config_;
    crypto::CryptPort& crypt_;
    std::unique_ptr<scheduler::ThreadScheduler> owned_scheduler_;
    scheduler::Scheduler& sched_;

    mutable std::mutex callbacks_mutex_;
    PositionCallback on_position_;
    RunningCallback on_running_;
    StatusCallback on_status_;
    ConnectionCallback on_connection_;

    mutable std::mutex end_positions_mutex_;
    std::optional<EndPositionInfo> end_positions_;

    CommandDispatcher dispatcher_;
    ConnectionCoordinator coordinator_;   // Last: torn down first

    CommandResult execute(GuardResult guard, const protocol::CommandFrame& frame);
    void initializeLink(bool use_notification_delay);
    void handleNotification(const Bytes& raw);
    void dispatchEvent(const protocol::NotificationEvent& event);
};

} // namespace device
} // namespace blindlink
