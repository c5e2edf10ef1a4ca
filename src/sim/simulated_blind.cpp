#include "simulated_blind.hpp"
#include "crypto/hex.hpp"
#include "blindlink/logging.hpp"

#include <algorithm>
#include <cstring>

namespace blindlink {
namespace sim {

using protocol::CommandType;
using transport::TransportError;
using transport::TransportErrorKind;

namespace {

constexpr CommandType ALL_COMMANDS[] = {
    CommandType::OPEN,          CommandType::CLOSE,        CommandType::STOP,
    CommandType::FAVORITE,      CommandType::OPEN_TILT,    CommandType::CLOSE_TILT,
    CommandType::PERCENT,       CommandType::ANGLE,        CommandType::SPEED,
    CommandType::SET_KEY,       CommandType::STATUS_QUERY, CommandType::POINT_SET_QUERY,
    CommandType::USER_QUERY,
};

constexpr uint8_t TILT_STEP_DEG = 18;

std::optional<CommandType> matchCommand(const std::string& hex) {
    for (CommandType type : ALL_COMMANDS) {
        const char* prefix = protocol::commandPrefixHex(type);
        if (hex.compare(0, std::strlen(prefix), prefix) == 0) {
            return type;
        }
    }
    return std::nullopt;
}

size_t payloadLength(CommandType type) {
    switch (type) {
        case CommandType::PERCENT:
        case CommandType::ANGLE:
            return 2;
        case CommandType::SPEED:
            return 1;
        default:
            return 0;
    }
}

} // namespace

SimulatedBlind::~SimulatedBlind() {
    std::unique_lock<std::mutex> lock(mutex_);
    closing_ = true;
    gate_cv_.notify_all();
    gate_cv_.wait(lock, [this] { return connects_waiting_ == 0; });
}

// ============================================================================
// TRANSPORT PORT
// ============================================================================

LinkHandle SimulatedBlind::connect(const LinkTarget& target, int max_attempts) {
    std::unique_lock<std::mutex> lock(mutex_);
    connect_calls_++;
    connects_in_flight_++;
    peak_connects_in_flight_ = std::max(peak_connects_in_flight_, connects_in_flight_);

    // Runs on every exit while `lock` is still held
    struct InFlight {
        int& count;
        ~InFlight() { count--; }
    } in_flight{connects_in_flight_};

    if (gate_closed_) {
        LOG_SIM(DEBUG, "Sim: connect to %s held", target.displayName().c_str());
        connects_waiting_++;
        gate_cv_.wait(lock, [this] { return !gate_closed_ || closing_; });
        connects_waiting_--;
        gate_cv_.notify_all();
        if (closing_) {
            throw TransportError(TransportErrorKind::TRANSIENT, "simulator shutting down");
        }
    }

    if (connect_error_) {
        LOG_SIM(INFO, "Sim: connect to %s fails with %s", target.displayName().c_str(),
                transport::transportErrorKindToString(*connect_error_));
        throw TransportError(*connect_error_, std::string("simulated ") +
                             transport::transportErrorKindToString(*connect_error_) +
                             " for " + target.displayName());
    }

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        radio_attempts_++;
        if (busy_slots_ > 0) {
            busy_slots_--;
            LOG_SIM(DEBUG, "Sim: no free connection slot (attempt %d/%d)", attempt, max_attempts);
            continue;
        }

        if (active_) {
            links_[*active_].connected = false;
        }
        LinkHandle handle = next_handle_++;
        links_[handle] = Link{};
        active_ = handle;
        LOG_SIM(INFO, "Sim: %s connected as link %u", target.displayName().c_str(), handle);
        return handle;
    }

    throw TransportError(TransportErrorKind::SLOTS_EXHAUSTED,
                         "no free connection slot after " + std::to_string(max_attempts) +
                         " attempts");
}

void SimulatedBlind::disconnect(LinkHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_calls_++;

    auto it = links_.find(handle);
    if (it == links_.end() || !it->second.connected) {
        LOG_SIM(DEBUG, "Sim: disconnect of inactive link %u", handle);
        return;
    }
    it->second.connected = false;
    if (active_ == handle) {
        active_.reset();
    }
    LOG_SIM(INFO, "Sim: link %u closed", handle);
}

bool SimulatedBlind::isConnected(LinkHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(handle);
    return it != links_.end() && it->second.connected;
}

void SimulatedBlind::subscribe(LinkHandle handle, const std::string& characteristic,
                               NotifyCallback on_notify) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(handle);
    if (it == links_.end() || !it->second.connected) {
        throw TransportError(TransportErrorKind::TRANSIENT, "subscribe on a closed link");
    }
    if (characteristic != transport::NOTIFICATION_CHARACTERISTIC) {
        LOG_SIM(WARN, "Sim: ignoring subscription to %s", characteristic.c_str());
        return;
    }
    it->second.on_notify = std::move(on_notify);
}

void SimulatedBlind::write(LinkHandle handle, const std::string& characteristic,
                           const Bytes& data, bool /*with_response*/) {
    std::vector<Bytes> frames;
    NotifyCallback notify;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        write_calls_++;

        auto it = links_.find(handle);
        if (it == links_.end() || !it->second.connected) {
            throw TransportError(TransportErrorKind::TRANSIENT, "write on a closed link");
        }
        if (characteristic != transport::COMMAND_CHARACTERISTIC) {
            throw TransportError(TransportErrorKind::TRANSIENT,
                                 "write to unknown characteristic " + characteristic);
        }
        if (failing_writes_ > 0) {
            failing_writes_--;
            throw TransportError(TransportErrorKind::TRANSIENT, "write not acknowledged");
        }

        std::string hex = crypto::bytesToHex(data);
        command_log_.push_back(hex);

        std::optional<CommandType> type = matchCommand(hex);
        if (!type) {
            LOG_SIM(WARN, "Sim: unknown command %s", hex.c_str());
            return;
        }
        command_types_.push_back(*type);

        size_t prefix_len = std::strlen(protocol::commandPrefixHex(*type));
        size_t payload_hex_len = payloadLength(*type) * 2;
        Bytes payload;
        if (hex.size() >= prefix_len + payload_hex_len) {
            payload = crypto::hexToBytes(hex.substr(prefix_len, payload_hex_len));
        }

        LOG_SIM(DEBUG, "Sim: link %u <- %s", handle, protocol::commandTypeToString(*type));
        frames = applyCommandLocked(*type, payload);
        notify = it->second.on_notify;
    }

    if (notify) {
        for (const auto& frame : frames) {
            notify(frame);
        }
    }
}

void SimulatedBlind::onUnsolicitedDisconnect(LinkHandle handle, DisconnectCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(handle);
    if (it != links_.end()) {
        it->second.on_disconnect = std::move(cb);
    }
}

// ============================================================================
// PERIPHERAL MODEL
// ============================================================================

void SimulatedBlind::setModel(const BlindModel& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = model;
}

BlindModel SimulatedBlind::getModel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

void SimulatedBlind::setUncalibrated() {
    std::lock_guard<std::mutex> lock(mutex_);
    model_.up_set = false;
    model_.down_set = false;
    model_.position_percent = 0;
    model_.angle_deg = 0;
}

void SimulatedBlind::injectNotification(const Bytes& frame) {
    NotifyCallback notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        notify = links_[*active_].on_notify;
    }
    if (notify) {
        notify(frame);
    }
}

std::vector<Bytes> SimulatedBlind::applyCommandLocked(CommandType type, const Bytes& payload) {
    switch (type) {
        case CommandType::OPEN:
            model_.position_percent = 0;
            return {runningFrameLocked(true), positionFrameLocked()};

        case CommandType::CLOSE:
            model_.position_percent = 100;
            return {runningFrameLocked(false), positionFrameLocked()};

        case CommandType::STOP:
            return {positionFrameLocked()};

        case CommandType::FAVORITE: {
            bool opening = model_.favorite_percent < model_.position_percent;
            model_.position_percent = model_.favorite_percent;
            return {runningFrameLocked(opening), positionFrameLocked()};
        }

        case CommandType::OPEN_TILT:
            model_.angle_deg = static_cast<uint8_t>(
                model_.angle_deg > TILT_STEP_DEG ? model_.angle_deg - TILT_STEP_DEG : 0);
            return {positionFrameLocked()};

        case CommandType::CLOSE_TILT:
            model_.angle_deg = static_cast<uint8_t>(std::min(180, model_.angle_deg + TILT_STEP_DEG));
            return {positionFrameLocked()};

        case CommandType::PERCENT: {
            if (payload.size() < 2) return {};
            uint8_t target = std::min<uint8_t>(payload[0], 100);
            bool opening = target < model_.position_percent;
            model_.position_percent = target;
            return {runningFrameLocked(opening), positionFrameLocked()};
        }

        case CommandType::ANGLE:
            if (payload.size() < 2) return {};
            model_.angle_deg = std::min<uint8_t>(payload[1], 180);
            return {positionFrameLocked()};

        case CommandType::SPEED:
            if (payload.empty()) return {};
            model_.speed_code = payload[0];
            return {};

        case CommandType::STATUS_QUERY:
            return {statusFrameLocked()};

        case CommandType::POINT_SET_QUERY:
            return {positionFrameLocked()};

        case CommandType::SET_KEY:
        case CommandType::USER_QUERY:
        default:
            return {};
    }
}

uint8_t SimulatedBlind::endPositionsByteLocked() const {
    uint8_t value = 0;
    if (model_.up_set) value |= EndPositionInfo::UP_MASK;
    if (model_.down_set) value |= EndPositionInfo::DOWN_MASK;
    return value;
}

// [12 04 0f 21][end positions][00][position][angle]
Bytes SimulatedBlind::positionFrameLocked() const {
    return {0x12, 0x04, 0x0f, 0x21, endPositionsByteLocked(), 0x00,
            model_.position_percent, model_.angle_deg};
}

// [12 04 0f 23][end positions][running type]
Bytes SimulatedBlind::runningFrameLocked(bool opening) const {
    uint8_t running = static_cast<uint8_t>(opening ? RunningType::OPENING : RunningType::CLOSING);
    return {0x12, 0x04, 0x0f, 0x23, endPositionsByteLocked(), running};
}

// [1f 05 0f 02][end positions][00][position][angle][4 x 00][speed][4 x 00][battery]
Bytes SimulatedBlind::statusFrameLocked() const {
    Bytes frame(18, 0x00);
    frame[0] = 0x1f;
    frame[1] = 0x05;
    frame[2] = 0x0f;
    frame[3] = 0x02;
    frame[4] = endPositionsByteLocked();
    frame[6] = model_.position_percent;
    frame[7] = model_.angle_deg;
    frame[12] = model_.speed_code;
    frame[17] = model_.battery_percent;
    return frame;
}

// ============================================================================
// FAULT INJECTION
// ============================================================================

void SimulatedBlind::setConnectError(std::optional<TransportErrorKind> kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_error_ = kind;
}

void SimulatedBlind::setBusySlots(int failures) {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_slots_ = failures;
}

void SimulatedBlind::holdConnects() {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_closed_ = true;
}

void SimulatedBlind::releaseConnects() {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_closed_ = false;
    gate_cv_.notify_all();
}

int SimulatedBlind::connectsWaiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connects_waiting_;
}

void SimulatedBlind::failNextWrites(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_writes_ = count;
}

void SimulatedBlind::dropLink() {
    LinkHandle handle = 0;
    DisconnectCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        handle = *active_;
        Link& link = links_[handle];
        link.connected = false;
        cb = link.on_disconnect;
        active_.reset();
    }

    LOG_SIM(INFO, "Sim: peer dropped link %u", handle);
    if (cb) {
        cb(handle);
    }
}

// ============================================================================
// COUNTERS
// ============================================================================

int SimulatedBlind::connectCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_calls_;
}

int SimulatedBlind::peakConnectsInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_connects_in_flight_;
}

int SimulatedBlind::disconnectCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnect_calls_;
}

int SimulatedBlind::writeCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_calls_;
}

int SimulatedBlind::radioAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return radio_attempts_;
}

std::vector<std::string> SimulatedBlind::commandLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return command_log_;
}

std::vector<CommandType> SimulatedBlind::commandTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return command_types_;
}

} // namespace sim
} // namespace blindlink
