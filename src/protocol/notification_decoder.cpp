#include "notification_decoder.hpp"
#include "command_frame.hpp"
#include "blindlink/logging.hpp"
#include <algorithm>

namespace blindlink {
namespace protocol {

namespace {

bool hasMarker(ByteSpan frame, const uint8_t (&marker)[notification::MARKER_LEN]) {
    return frame.size() >= notification::MARKER_LEN &&
           std::equal(std::begin(marker), std::end(marker), frame.begin());
}

EndPositionInfo endPositionsFromFrame(ByteSpan frame) {
    uint16_t favorite_field = static_cast<uint16_t>(
        (frame[notification::FAVORITE_OFFSET] << 8) | frame[notification::FAVORITE_OFFSET + 1]);
    return EndPositionInfo::fromFrame(frame[notification::END_POSITIONS_OFFSET], favorite_field);
}

bool tooShort(ByteSpan frame, size_t needed, NotificationType type) {
    if (frame.size() >= needed) return false;
    LOG_NOTIFY(WARN, "%s notification truncated: %zu bytes, need %zu",
               notificationTypeToString(type), frame.size(), needed);
    return true;
}

} // namespace

const char* notificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::POSITION: return "POSITION";
        case NotificationType::RUNNING:  return "RUNNING";
        case NotificationType::STATUS:   return "STATUS";
        default: return "UNKNOWN";
    }
}

NotificationType classifyNotification(ByteSpan frame) {
    if (hasMarker(frame, notification::POSITION_MARKER)) return NotificationType::POSITION;
    if (hasMarker(frame, notification::RUNNING_MARKER)) return NotificationType::RUNNING;
    if (hasMarker(frame, notification::STATUS_MARKER)) return NotificationType::STATUS;
    return NotificationType::UNKNOWN;
}

NotificationEvent decodeNotification(ByteSpan frame) {
    NotificationType type = classifyNotification(frame);

    switch (type) {
        case NotificationType::POSITION: {
            if (tooShort(frame, notification::POSITION_FRAME_LEN, type)) break;
            PositionEvent ev;
            ev.position_percent = frame[notification::POSITION_OFFSET];
            ev.tilt_percent = angleToTiltPercent(frame[notification::ANGLE_OFFSET]);
            ev.end_positions = endPositionsFromFrame(frame);
            return ev;
        }

        case NotificationType::RUNNING: {
            if (tooShort(frame, notification::RUNNING_FRAME_LEN, type)) break;
            RunningEvent ev;
            ev.running = static_cast<RunningType>(frame[notification::RUNNING_OFFSET]);
            ev.opening = ev.running == RunningType::OPENING;
            return ev;
        }

        case NotificationType::STATUS: {
            if (tooShort(frame, notification::STATUS_FRAME_LEN, type)) break;
            StatusEvent ev;
            ev.position_percent = frame[notification::POSITION_OFFSET];
            ev.tilt_percent = angleToTiltPercent(frame[notification::ANGLE_OFFSET]);
            ev.battery_percent = frame[notification::BATTERY_OFFSET];
            ev.speed = speedLevelFromCode(frame[notification::SPEED_OFFSET]);
            ev.end_positions = endPositionsFromFrame(frame);
            return ev;
        }

        default:
            break;
    }

    return std::monostate{};
}

std::optional<EndPositionInfo> endPositionsOf(const NotificationEvent& event) {
    if (const auto* pos = std::get_if<PositionEvent>(&event)) return pos->end_positions;
    if (const auto* status = std::get_if<StatusEvent>(&event)) return status->end_positions;
    return std::nullopt;
}

} // namespace protocol
} // namespace blindlink
