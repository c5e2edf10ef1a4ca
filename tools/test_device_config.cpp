// test_device_config.cpp - INI persistence of device settings
//
// Tests:
// 1. Save/load round trip of every field
// 2. Invalid values keep their defaults
// 3. Missing file

#include "test_support.hpp"
#include "device/device_config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace blindlink;
using namespace blindlink::device;

int main() {
    std::cout << "=== Device Config Unit Test ===\n\n";

    setLogLevel(LogLevel::ERROR);

    test::TestCounter t;
    std::string path = (std::filesystem::temp_directory_path() / "blindlink_test_config.ini").string();

    // ========================================================================
    // TEST 1: Round trip
    // ========================================================================
    std::cout << "TEST 1: Save/load round trip\n";
    {
        DeviceConfig out;
        out.address = "11:22:33:44:55:66";
        out.name = "Bedroom";
        out.disconnect_time_s = 45;
        out.max_connect_attempts = 3;
        out.max_command_attempts = 7;
        out.notification_delay_ms = 250;
        out.use_notification_delay = true;
        out.emit_running_events = true;
        out.log_level = LogLevel::DEBUG;

        t.check(out.save(path), "save() succeeds");

        DeviceConfig in;
        t.check(in.load(path), "load() succeeds");
        t.check(in.address == out.address && in.name == out.name, "address and name");
        t.check(in.disconnect_time_s == 45 && in.max_connect_attempts == 3 &&
                in.max_command_attempts == 7 && in.notification_delay_ms == 250, "timing fields");
        t.check(in.use_notification_delay && in.emit_running_events, "behavior flags");
        t.check(in.log_level == LogLevel::DEBUG, "log level");
    }

    // ========================================================================
    // TEST 2: Invalid values
    // ========================================================================
    std::cout << "\nTEST 2: Invalid values keep defaults\n";
    {
        {
            std::ofstream file(path);
            file << "# hand-edited\n";
            file << "[Device]\n";
            file << "  address = AA:BB:CC:DD:EE:FF  \n";
            file << "[Timing]\n";
            file << "disconnect_time_s=abc\n";
            file << "max_command_attempts=0\n";
            file << "max_connect_attempts=4x\n";
            file << "notification_delay_ms=-5\n";
            file << "no equals sign here\n";
            file << "[Behavior]\n";
            file << "emit_running_events=yes\n";
            file << "use_notification_delay=nope\n";
            file << "[Logging]\n";
            file << "log_level=warning\n";
        }

        DeviceConfig in;
        DeviceConfig defaults;
        t.check(in.load(path), "load() succeeds");
        t.check(in.address == "AA:BB:CC:DD:EE:FF", "whitespace trimmed around key and value");
        t.check(in.disconnect_time_s == defaults.disconnect_time_s, "non-numeric value ignored");
        t.check(in.max_command_attempts == defaults.max_command_attempts, "zero attempts rejected");
        t.check(in.max_connect_attempts == defaults.max_connect_attempts, "trailing garbage rejected");
        t.check(in.notification_delay_ms == defaults.notification_delay_ms, "negative delay rejected");
        t.check(in.emit_running_events, "'yes' parses as true");
        t.check(!in.use_notification_delay, "unknown word parses as false");
        t.check(in.log_level == LogLevel::WARN, "'warning' parses as WARN");
    }

    std::remove(path.c_str());

    // ========================================================================
    // TEST 3: Missing file
    // ========================================================================
    std::cout << "\nTEST 3: Missing file\n";
    {
        DeviceConfig in;
        t.check(!in.load(path), "load() of a missing file fails");
        t.check(in.disconnect_time_s == 15 && in.max_command_attempts == 5, "defaults untouched");
    }

    return t.summary("device config");
}
