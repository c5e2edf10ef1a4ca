#pragma once

#include "blindlink/types.hpp"
#include <optional>
#include <variant>

namespace blindlink {
namespace protocol {

// Decrypted notification layout (byte offsets)
namespace notification {
constexpr size_t MARKER_LEN = 4;
constexpr size_t END_POSITIONS_OFFSET = 4;
constexpr size_t RUNNING_OFFSET = 5;
constexpr size_t POSITION_OFFSET = 6;
constexpr size_t ANGLE_OFFSET = 7;
constexpr size_t FAVORITE_OFFSET = 6;   // 16-bit field, big endian
constexpr size_t SPEED_OFFSET = 12;
constexpr size_t BATTERY_OFFSET = 17;

constexpr uint8_t POSITION_MARKER[MARKER_LEN] = {0x12, 0x04, 0x0f, 0x21};
constexpr uint8_t RUNNING_MARKER[MARKER_LEN] = {0x12, 0x04, 0x0f, 0x23};
constexpr uint8_t STATUS_MARKER[MARKER_LEN] = {0x1f, 0x05, 0x0f, 0x02};

constexpr size_t POSITION_FRAME_LEN = ANGLE_OFFSET + 1;
constexpr size_t RUNNING_FRAME_LEN = RUNNING_OFFSET + 1;
constexpr size_t STATUS_FRAME_LEN = BATTERY_OFFSET + 1;
} // namespace notification

enum class NotificationType : uint8_t {
    POSITION,
    RUNNING,
    STATUS,
    UNKNOWN,
};

const char* notificationTypeToString(NotificationType type);

struct PositionEvent {
    uint8_t position_percent = 0;
    uint8_t tilt_percent = 0;
    EndPositionInfo end_positions;
};

struct RunningEvent {
    RunningType running = RunningType::STILL;
    bool opening = false;
};

struct StatusEvent {
    uint8_t position_percent = 0;
    uint8_t tilt_percent = 0;
    uint8_t battery_percent = 0;
    std::optional<SpeedLevel> speed;   // empty for codes we do not know
    EndPositionInfo end_positions;
};

// monostate = nothing to report (unknown type or truncated frame)
using NotificationEvent = std::variant<std::monostate, PositionEvent, RunningEvent, StatusEvent>;

// Classify by the 4-byte type marker
NotificationType classifyNotification(ByteSpan frame);

/**
 * Decode one decrypted notification frame.
 *
 * Pure: no state is read or written. Unknown markers yield monostate so
 * firmware message types we do not model pass through harmlessly. A known
 * marker on a frame too short for its layout also yields monostate (logged).
 */
NotificationEvent decodeNotification(ByteSpan frame);

// End-position info carried by an event, if the event has one
std::optional<EndPositionInfo> endPositionsOf(const NotificationEvent& event);

} // namespace protocol
} // namespace blindlink
