/**
 * SimulatedBlind - In-process blind motor for tests and the CLI demo
 *
 * Implements the Transport Port against a modelled peripheral that speaks
 * the clear-text frame format (pair it with crypto::ClearTextCrypt):
 * - Acknowledged writes are parsed by command prefix
 * - Movement commands answer with a running frame then a position frame
 * - Status queries answer with a full status frame
 * - Notifications are delivered synchronously from inside write()
 *
 * Fault injection covers the transport failures the device must survive:
 * connect errors, connects that block until released, radio-level connect
 * retries, failing writes and peer-initiated drops.
 *
 * Usage:
 *   sim::SimulatedBlind blind;
 *   crypto::ClearTextCrypt crypt;
 *   device::BlindDevice dev(config, blind, crypt);
 *
 *   blind.failNextWrites(2);   // next two writes are not acknowledged
 *   dev.open();                // succeeds on the third write
 */

#pragma once

#include "transport/transport_port.hpp"
#include "protocol/command_frame.hpp"
#include "blindlink/types.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blindlink {
namespace sim {

// Modelled motor state
struct BlindModel {
    uint8_t position_percent = 0;     // 0 = open, 100 = closed
    uint8_t angle_deg = 0;            // 0-180
    uint8_t favorite_percent = 50;
    uint8_t battery_percent = 80;
    uint8_t speed_code = 2;
    bool up_set = true;               // Upper end position calibrated
    bool down_set = true;
};

class SimulatedBlind : public transport::TransportPort {
public:
    SimulatedBlind() = default;
    ~SimulatedBlind() override;

    // ========================================================================
    // TRANSPORT PORT
    // ========================================================================

    LinkHandle connect(const LinkTarget& target, int max_attempts) override;
    void disconnect(LinkHandle handle) override;
    bool isConnected(LinkHandle handle) const override;
    void subscribe(LinkHandle handle, const std::string& characteristic,
                   NotifyCallback on_notify) override;
    void write(LinkHandle handle, const std::string& characteristic,
               const Bytes& data, bool with_response) override;
    void onUnsolicitedDisconnect(LinkHandle handle, DisconnectCallback cb) override;

    // ========================================================================
    // PERIPHERAL MODEL
    // ========================================================================

    void setModel(const BlindModel& model);
    BlindModel getModel() const;

    // Factory state: no end positions, parked fully open (favorite reads unset)
    void setUncalibrated();

    // Push a decrypted frame to the subscriber as if the motor sent it
    void injectNotification(const Bytes& frame);

    // ========================================================================
    // FAULT INJECTION
    // ========================================================================

    // Every connect() fails with this kind until cleared
    void setConnectError(std::optional<transport::TransportErrorKind> kind);

    // Radio-level connect failures before a slot is found. connect()
    // retries internally up to max_attempts, then reports SLOTS_EXHAUSTED.
    void setBusySlots(int failures);

    // connect() blocks until releaseConnects()
    void holdConnects();
    void releaseConnects();
    int connectsWaiting() const;

    // The next `count` writes are not acknowledged
    void failNextWrites(int count);

    // Peer drops the current link
    void dropLink();

    // ========================================================================
    // COUNTERS
    // ========================================================================

    int connectCalls() const;
    int disconnectCalls() const;
    // Most connect() calls ever running at the same time
    int peakConnectsInFlight() const;
    int writeCalls() const;
    int radioAttempts() const;

    // Plaintext hex of every acknowledged write, in order
    std::vector<std::string> commandLog() const;
    std::vector<protocol::CommandType> commandTypes() const;

private:
    struct Link {
        bool connected = true;
        NotifyCallback on_notify;
        DisconnectCallback on_disconnect;
    };

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool gate_closed_ = false;
    bool closing_ = false;
    int connects_waiting_ = 0;

    BlindModel model_;
    std::map<LinkHandle, Link> links_;
    LinkHandle next_handle_ = 1;
    std::optional<LinkHandle> active_;

    std::optional<transport::TransportErrorKind> connect_error_;
    int busy_slots_ = 0;
    int failing_writes_ = 0;

    int connects_in_flight_ = 0;
    int peak_connects_in_flight_ = 0;
    int connect_calls_ = 0;
    int disconnect_calls_ = 0;
    int write_calls_ = 0;
    int radio_attempts_ = 0;
    std::vector<std::string> command_log_;
    std::vector<protocol::CommandType> command_types_;

    // Apply one command to the model; returns the frames to notify
    std::vector<Bytes> applyCommandLocked(protocol::CommandType type, const Bytes& payload);

    Bytes positionFrameLocked() const;
    Bytes runningFrameLocked(bool opening) const;
    Bytes statusFrameLocked() const;
    uint8_t endPositionsByteLocked() const;
};

} // namespace sim
} // namespace blindlink
