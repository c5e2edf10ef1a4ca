#pragma once

#include "blindlink/logging.hpp"
#include <string>

namespace blindlink {
namespace device {

// Settings for one blind, persisted as an INI file
struct DeviceConfig {
    // Save/load to file
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // Device
    std::string address;                  // Peripheral address (e.g. "AA:BB:CC:DD:EE:FF")
    std::string name;                     // Display name, defaults to address

    // Timing
    int disconnect_time_s = 15;           // Idle time before the link is closed
    int max_connect_attempts = 5;         // Radio-level connect attempts per connection
    int max_command_attempts = 5;         // Write attempts per command before giving up
    int notification_delay_ms = 500;      // Pause between set-key and status query

    // Behavior
    bool use_notification_delay = false;  // Apply notification_delay_ms on every connect
    bool emit_running_events = false;     // Dispatch running notifications to the callback

    // Logging
    LogLevel log_level = LogLevel::INFO;
};

} // namespace device
} // namespace blindlink
