#include "command_frame.hpp"
#include "crypto/hex.hpp"
#include <cmath>

namespace blindlink {
namespace protocol {

const char* commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::OPEN:            return "OPEN";
        case CommandType::CLOSE:           return "CLOSE";
        case CommandType::STOP:            return "STOP";
        case CommandType::FAVORITE:        return "FAVORITE";
        case CommandType::OPEN_TILT:       return "OPEN_TILT";
        case CommandType::CLOSE_TILT:      return "CLOSE_TILT";
        case CommandType::PERCENT:         return "PERCENT";
        case CommandType::ANGLE:           return "ANGLE";
        case CommandType::SPEED:           return "SPEED";
        case CommandType::SET_KEY:         return "SET_KEY";
        case CommandType::STATUS_QUERY:    return "STATUS_QUERY";
        case CommandType::POINT_SET_QUERY: return "POINT_SET_QUERY";
        case CommandType::USER_QUERY:      return "USER_QUERY";
        default: return "UNKNOWN";
    }
}

const char* commandPrefixHex(CommandType type) {
    switch (type) {
        case CommandType::OPEN:            return "03020301";
        case CommandType::CLOSE:           return "03020302";
        case CommandType::STOP:            return "03020303";
        case CommandType::FAVORITE:        return "03020306";
        case CommandType::OPEN_TILT:       return "03020309";
        case CommandType::CLOSE_TILT:      return "0302030a";
        case CommandType::PERCENT:         return "05020440";
        case CommandType::ANGLE:           return "05020420";
        case CommandType::SPEED:           return "0403010a";
        case CommandType::SET_KEY:         return "02c001";
        case CommandType::STATUS_QUERY:    return "03050f02";
        case CommandType::POINT_SET_QUERY: return "03050120";
        case CommandType::USER_QUERY:      return "02c005";
        default: return "";
    }
}

CommandFrame CommandFrame::makePercent(uint8_t percent) {
    CommandFrame frame(CommandType::PERCENT);
    frame.payload_ = {percent, 0x00};
    frame.payload_len_ = 2;
    return frame;
}

CommandFrame CommandFrame::makeAngle(uint8_t angle_deg) {
    CommandFrame frame(CommandType::ANGLE);
    frame.payload_ = {0x00, angle_deg};
    frame.payload_len_ = 2;
    return frame;
}

CommandFrame CommandFrame::makeSpeed(SpeedLevel level) {
    CommandFrame frame(CommandType::SPEED);
    frame.payload_[0] = static_cast<uint8_t>(level);
    frame.payload_len_ = 1;
    return frame;
}

std::string CommandFrame::toHex() const {
    std::string hex = commandPrefixHex(type_);
    for (size_t i = 0; i < payload_len_; i++) {
        hex += crypto::byteToHex(payload_[i]);
    }
    return hex;
}

uint8_t tiltPercentToAngle(int percent) {
    return static_cast<uint8_t>(std::lround(180.0 * percent / 100.0));
}

uint8_t angleToTiltPercent(uint8_t angle_deg) {
    return static_cast<uint8_t>(std::lround(100.0 * angle_deg / 180.0));
}

} // namespace protocol
} // namespace blindlink
