#include "device_config.hpp"

#include <fstream>
#include <stdexcept>

namespace blindlink {
namespace device {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void parseInt(const std::string& key, const std::string& value, int& out, int min_value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < min_value) {
            LOG_LINK(WARN, "Config: %s=%s out of range, keeping %d", key.c_str(), value.c_str(), out);
            return;
        }
        out = parsed;
    } catch (const std::invalid_argument&) {
        LOG_LINK(WARN, "Config: %s=%s is not a number, keeping %d", key.c_str(), value.c_str(), out);
    } catch (const std::out_of_range&) {
        LOG_LINK(WARN, "Config: %s=%s out of range, keeping %d", key.c_str(), value.c_str(), out);
    }
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

// Save settings to INI file
bool DeviceConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "[Device]\n";
    file << "address=" << address << "\n";
    file << "name=" << name << "\n";

    file << "\n[Timing]\n";
    file << "disconnect_time_s=" << disconnect_time_s << "\n";
    file << "max_connect_attempts=" << max_connect_attempts << "\n";
    file << "max_command_attempts=" << max_command_attempts << "\n";
    file << "notification_delay_ms=" << notification_delay_ms << "\n";

    file << "\n[Behavior]\n";
    file << "use_notification_delay=" << (use_notification_delay ? "1" : "0") << "\n";
    file << "emit_running_events=" << (emit_running_events ? "1" : "0") << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << logLevelToString(log_level) << "\n";

    return file.good();
}

// Load settings from INI file
bool DeviceConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Device
        if (key == "address") {
            address = value;
        } else if (key == "name") {
            name = value;
        }
        // Timing
        else if (key == "disconnect_time_s") {
            parseInt(key, value, disconnect_time_s, 1);
        } else if (key == "max_connect_attempts") {
            parseInt(key, value, max_connect_attempts, 1);
        } else if (key == "max_command_attempts") {
            parseInt(key, value, max_command_attempts, 1);
        } else if (key == "notification_delay_ms") {
            parseInt(key, value, notification_delay_ms, 0);
        }
        // Behavior
        else if (key == "use_notification_delay") {
            use_notification_delay = parseBool(value);
        } else if (key == "emit_running_events") {
            emit_running_events = parseBool(value);
        }
        // Logging
        else if (key == "log_level") {
            log_level = stringToLogLevel(value);
        }
    }

    return true;
}

} // namespace device
} // namespace blindlink
