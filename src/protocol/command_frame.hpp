#pragma once

#include "blindlink/types.hpp"
#include <array>
#include <string>

namespace blindlink {
namespace protocol {

// Command identifiers (leading bytes of the plaintext frame)
enum class CommandType : uint8_t {
    OPEN,
    CLOSE,
    STOP,
    FAVORITE,
    OPEN_TILT,
    CLOSE_TILT,
    PERCENT,
    ANGLE,
    SPEED,
    SET_KEY,
    STATUS_QUERY,
    POINT_SET_QUERY,
    USER_QUERY,
};

const char* commandTypeToString(CommandType type);

// Hex prefix sent on the wire for a command type
const char* commandPrefixHex(CommandType type);

// Maximum payload carried after the prefix
constexpr size_t MAX_COMMAND_PAYLOAD = 2;

/**
 * CommandFrame
 *
 * Command identifier plus up to two payload bytes. toHex() renders the
 * fixed-width plaintext without the freshness timestamp, which the
 * dispatcher appends at send time.
 *
 * Payload layouts:
 *   PERCENT  [percent 0-100][0x00]
 *   ANGLE    [0x00][angle 0-180]
 *   SPEED    [level 1-3]
 */
class CommandFrame {
public:
    explicit CommandFrame(CommandType type) : type_(type) {}

    static CommandFrame makePercent(uint8_t percent);
    static CommandFrame makeAngle(uint8_t angle_deg);
    static CommandFrame makeSpeed(SpeedLevel level);

    CommandType type() const { return type_; }
    size_t payloadSize() const { return payload_len_; }
    uint8_t payloadAt(size_t i) const { return payload_[i]; }

    std::string toHex() const;

private:
    CommandType type_;
    std::array<uint8_t, MAX_COMMAND_PAYLOAD> payload_{};
    size_t payload_len_ = 0;
};

// Tilt percentage (0-100) to motor angle (0-180 degrees)
uint8_t tiltPercentToAngle(int percent);

// Motor angle (0-180 degrees) to tilt percentage (0-100)
uint8_t angleToTiltPercent(uint8_t angle_deg);

} // namespace protocol
} // namespace blindlink
