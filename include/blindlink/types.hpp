#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blindlink {

// Core types
using Bytes = std::vector<uint8_t>;            // Raw frame bytes
using ByteSpan = std::span<const uint8_t>;
using LinkHandle = uint32_t;                   // Transport-assigned connection handle

// Link lifecycle of a single peripheral
enum class ConnectionState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DISCONNECTING,
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:  return "DISCONNECTED";
        case ConnectionState::CONNECTING:    return "CONNECTING";
        case ConnectionState::CONNECTED:     return "CONNECTED";
        case ConnectionState::DISCONNECTING: return "DISCONNECTING";
        default: return "UNKNOWN";
    }
}

// Motor speed levels, as carried in the speed command and status frames
enum class SpeedLevel : uint8_t {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
};

// Map a raw speed code; codes the firmware may add later come back empty
inline std::optional<SpeedLevel> speedLevelFromCode(uint8_t code) {
    switch (code) {
        case 1: return SpeedLevel::LOW;
        case 2: return SpeedLevel::MEDIUM;
        case 3: return SpeedLevel::HIGH;
        default: return std::nullopt;
    }
}

inline const char* speedLevelToString(std::optional<SpeedLevel> level) {
    if (!level) return "UNKNOWN";
    switch (*level) {
        case SpeedLevel::LOW:    return "LOW";
        case SpeedLevel::MEDIUM: return "MEDIUM";
        case SpeedLevel::HIGH:   return "HIGH";
        default: return "UNKNOWN";
    }
}

// Motion byte of a running notification
enum class RunningType : uint8_t {
    STILL = 0,
    OPENING = 1,
    CLOSING = 2,
};

// Calibrated travel limits reported by the peripheral.
// Replaced as a whole on every position/status frame, never patched.
struct EndPositionInfo {
    bool up = false;
    bool down = false;
    bool favorite = false;

    static constexpr uint8_t UP_MASK = 0x08;
    static constexpr uint8_t DOWN_MASK = 0x04;

    static EndPositionInfo fromFrame(uint8_t end_positions, uint16_t favorite_field) {
        EndPositionInfo info;
        info.up = (end_positions & UP_MASK) != 0;
        info.down = (end_positions & DOWN_MASK) != 0;
        info.favorite = (favorite_field & 0xFF00) != 0 || (favorite_field & 0x00FF) != 0;
        return info;
    }

    bool operator==(const EndPositionInfo& other) const {
        return up == other.up && down == other.down && favorite == other.favorite;
    }
};

// Identity of the peripheral to connect to
struct LinkTarget {
    std::string address;
    std::string name;   // Display name; falls back to the address

    const std::string& displayName() const { return name.empty() ? address : name; }
};

} // namespace blindlink
