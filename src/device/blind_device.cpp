#include "blind_device.hpp"
#include "crypto/hex.hpp"
#include "blindlink/logging.hpp"

#include <stdexcept>
#include <string>
#include <thread>

namespace blindlink {
namespace device {

using protocol::CommandFrame;
using protocol::CommandType;

namespace {

CoordinatorConfig coordinatorConfigFrom(const DeviceConfig& config) {
    CoordinatorConfig cc;
    cc.idle_timeout = std::chrono::seconds(config.disconnect_time_s);
    cc.max_connect_attempts = config.max_connect_attempts;
    return cc;
}

void requirePercent(const char* what, int percent) {
    if (percent < 0 || percent > 100) {
        throw std::invalid_argument(std::string(what) + ": percentage " +
                                    std::to_string(percent) + " outside 0-100");
    }
}

} // namespace

const char* commandResultToString(CommandResult result) {
    switch (result) {
        case CommandResult::SENT:                 return "SENT";
        case CommandResult::NOT_READY:            return "NOT_READY";
        case CommandResult::NOT_SENT:             return "NOT_SENT";
        case CommandResult::CALIBRATION_REQUIRED: return "CALIBRATION_REQUIRED";
        case CommandResult::FAVORITE_NOT_SET:     return "FAVORITE_NOT_SET";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// CONSTRUCTOR
// =============================================================================

BlindDevice::BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                         crypto::CryptPort& crypt)
    : BlindDevice(config, transport, crypt, nullptr)
{
}

BlindDevice::BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                         crypto::CryptPort& crypt, scheduler::Scheduler& host_scheduler)
    : BlindDevice(config, transport, crypt, &host_scheduler)
{
}

BlindDevice::BlindDevice(const DeviceConfig& config, transport::TransportPort& transport,
                         crypto::CryptPort& crypt, scheduler::Scheduler* host_scheduler)
    : config_(config)
    , crypt_(crypt)
    , owned_scheduler_(host_scheduler ? nullptr : std::make_unique<scheduler::ThreadScheduler>())
    , sched_(host_scheduler ? *host_scheduler : *owned_scheduler_)
    , dispatcher_(transport, crypt, config.max_command_attempts)
    , coordinator_(transport, sched_, coordinatorConfigFrom(config))
{
    if (config_.address.empty()) {
        LOG_LINK(WARN, "BlindDevice: no address configured");
    }
    coordinator_.setTarget(LinkTarget{config_.address, config_.name});

    dispatcher_.setLinkProvider([this]() { return coordinator_.getLink(); });
    dispatcher_.setLinkFailedCallback([this]() { coordinator_.disconnect(); });

    coordinator_.setLinkUpCallback([this](bool use_notification_delay) {
        initializeLink(use_notification_delay);
    });
    coordinator_.setNotificationCallback([this](const Bytes& raw) {
        handleNotification(raw);
    });
    coordinator_.setStateChangedCallback([this](ConnectionState state) {
        ConnectionCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_connection_;
        }
        if (cb) {
            cb(state);
        }
    });
}

BlindDevice::~BlindDevice() {
    coordinator_.disconnect();
    if (owned_scheduler_) {
        owned_scheduler_->shutdown();
    }
}

// =============================================================================
// CONFIGURATION
// =============================================================================

void BlindDevice::setLinkTarget(const LinkTarget& target) {
    coordinator_.setTarget(target);
}

// =============================================================================
// CONNECTION CONTROL
// =============================================================================

bool BlindDevice::connect(bool use_notification_delay) {
    return coordinator_.ensureReady(use_notification_delay || config_.use_notification_delay);
}

void BlindDevice::disconnect() {
    coordinator_.disconnect();
}

void BlindDevice::refreshDisconnectTimer(std::optional<scheduler::Duration> timeout, bool force) {
    coordinator_.refreshIdleTimer(timeout, force);
}

// =============================================================================
// COMMANDS
// =============================================================================

CommandResult BlindDevice::open(bool ignore_end_positions) {
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame(CommandType::OPEN));
}

CommandResult BlindDevice::close(bool ignore_end_positions) {
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame(CommandType::CLOSE));
}

CommandResult BlindDevice::stop(bool ignore_end_positions) {
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame(CommandType::STOP));
}

CommandResult BlindDevice::percentage(int percent, bool ignore_end_positions) {
    requirePercent("percentage", percent);
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame::makePercent(static_cast<uint8_t>(percent)));
}

CommandResult BlindDevice::tiltPercentage(int percent, bool ignore_end_positions) {
    requirePercent("tiltPercentage", percent);
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame::makeAngle(protocol::tiltPercentToAngle(percent)));
}

// Full tilt via the angle command rather than the step commands
CommandResult BlindDevice::openTilt(bool ignore_end_positions) {
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame::makeAngle(0));
}

CommandResult BlindDevice::closeTilt(bool ignore_end_positions) {
    return execute(checkEndPositions(getEndPositionInfo(), ignore_end_positions),
                   CommandFrame::makeAngle(180));
}

CommandResult BlindDevice::favorite() {
    return execute(checkFavorite(getEndPositionInfo()), CommandFrame(CommandType::FAVORITE));
}

CommandResult BlindDevice::speed(SpeedLevel level) {
    return execute(GuardResult::PASS, CommandFrame::makeSpeed(level));
}

CommandResult BlindDevice::statusQuery() {
    return execute(GuardResult::PASS, CommandFrame(CommandType::STATUS_QUERY));
}

CommandResult BlindDevice::pointSetQuery() {
    return execute(GuardResult::PASS, CommandFrame(CommandType::POINT_SET_QUERY));
}

CommandResult BlindDevice::userQuery() {
    return execute(GuardResult::PASS, CommandFrame(CommandType::USER_QUERY));
}

CommandResult BlindDevice::setKey() {
    return execute(GuardResult::PASS, CommandFrame(CommandType::SET_KEY));
}

CommandResult BlindDevice::execute(GuardResult guard, const CommandFrame& frame) {
    if (guard != GuardResult::PASS) {
        LOG_CMD(WARN, "%s refused for %s: %s", protocol::commandTypeToString(frame.type()),
                getLinkTarget().displayName().c_str(), guardResultToString(guard));
        return guard == GuardResult::CALIBRATION_REQUIRED ? CommandResult::CALIBRATION_REQUIRED
                                                          : CommandResult::FAVORITE_NOT_SET;
    }

    if (!coordinator_.ensureReady(config_.use_notification_delay)) {
        LOG_CMD(DEBUG, "%s not sent: superseded or cancelled",
                protocol::commandTypeToString(frame.type()));
        return CommandResult::NOT_READY;
    }

    return dispatcher_.send(frame) ? CommandResult::SENT : CommandResult::NOT_SENT;
}

// Runs on the connect task once the link is subscribed
void BlindDevice::initializeLink(bool use_notification_delay) {
    if (!dispatcher_.send(CommandFrame(CommandType::SET_KEY))) {
        LOG_LINK(WARN, "BlindDevice: set-key not sent to %s, link gone",
                 getLinkTarget().displayName().c_str());
        return;
    }

    if (use_notification_delay && config_.notification_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.notification_delay_ms));
    }

    if (!dispatcher_.send(CommandFrame(CommandType::STATUS_QUERY))) {
        LOG_LINK(WARN, "BlindDevice: status query not sent to %s, link gone",
                 getLinkTarget().displayName().c_str());
    }
}

// =============================================================================
// NOTIFICATIONS
// =============================================================================

void BlindDevice::handleNotification(const Bytes& raw) {
    std::string plaintext;
    Bytes frame;
    try {
        plaintext = crypt_.decrypt(crypto::bytesToHex(raw));
        frame = crypto::hexToBytes(plaintext);
    } catch (const std::invalid_argument& e) {
        LOG_NOTIFY(WARN, "Dropping undecodable notification (%zu bytes): %s", raw.size(), e.what());
        return;
    }

    LOG_NOTIFY(INFO, "Received message: %s", plaintext.c_str());

    protocol::NotificationEvent event = protocol::decodeNotification(frame);

    if (auto info = protocol::endPositionsOf(event)) {
        std::lock_guard<std::mutex> lock(end_positions_mutex_);
        end_positions_ = *info;
    }

    dispatchEvent(event);
}

void BlindDevice::dispatchEvent(const protocol::NotificationEvent& event) {
    if (const auto* pos = std::get_if<protocol::PositionEvent>(&event)) {
        PositionCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_position_;
        }
        LOG_NOTIFY(DEBUG, "Position %u%% tilt %u%%", pos->position_percent, pos->tilt_percent);
        if (cb) {
            cb(pos->position_percent, pos->tilt_percent, pos->end_positions);
        }
    } else if (const auto* running = std::get_if<protocol::RunningEvent>(&event)) {
        if (!config_.emit_running_events) {
            LOG_NOTIFY(DEBUG, "Running notification (opening=%d), not dispatched",
                       running->opening ? 1 : 0);
            return;
        }
        RunningCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_running_;
        }
        if (cb) {
            cb(running->opening);
        }
    } else if (const auto* status = std::get_if<protocol::StatusEvent>(&event)) {
        StatusCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_status_;
        }
        LOG_NOTIFY(DEBUG, "Status %u%% tilt %u%% battery %u%% speed %s",
                   status->position_percent, status->tilt_percent, status->battery_percent,
                   speedLevelToString(status->speed));
        if (cb) {
            cb(status->position_percent, status->tilt_percent, status->battery_percent,
               status->speed, status->end_positions);
        }
    } else {
        LOG_NOTIFY(DEBUG, "Ignoring unrecognized notification");
    }
}

// =============================================================================
// CALLBACKS
// =============================================================================

void BlindDevice::registerPositionCallback(PositionCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_position_ = std::move(cb);
}

void BlindDevice::registerRunningCallback(RunningCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_running_ = std::move(cb);
}

void BlindDevice::registerStatusCallback(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_status_ = std::move(cb);
}

void BlindDevice::registerConnectionCallback(ConnectionCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_connection_ = std::move(cb);
}

// =============================================================================
// STATE
// =============================================================================

std::optional<EndPositionInfo> BlindDevice::getEndPositionInfo() const {
    std::lock_guard<std::mutex> lock(end_positions_mutex_);
    return end_positions_;
}

} // namespace device
} // namespace blindlink
