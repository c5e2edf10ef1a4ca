/**
 * Blind CLI - Drive a BlindDevice against the simulated motor
 *
 * Runs one command (or the demo sequence) through the full device stack:
 * guard -> coordinator -> dispatcher -> transport, printing every
 * position/status/connection callback as it arrives.
 *
 *   blind_cli status
 *   blind_cli -u open            # uncalibrated motor: refused
 *   blind_cli -u -f open         # ...unless the guard is bypassed
 *   blind_cli -c bedroom.ini position 40
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>

#include "blindlink/logging.hpp"
#include "crypto/clear_text_crypt.hpp"
#include "device/blind_device.hpp"
#include "device/device_config.hpp"
#include "sim/simulated_blind.hpp"

using namespace blindlink;
using namespace blindlink::device;

namespace {

void printUsage() {
    std::cout << "Blind CLI - motorized blind client against a simulated motor\n\n";
    std::cout << "Usage: blind_cli [options] <command> [value]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  open | close | stop       Move the blind\n";
    std::cout << "  favorite                  Move to the favorite position\n";
    std::cout << "  position <0-100>          Move to a percentage\n";
    std::cout << "  tilt <0-100>              Tilt to a percentage\n";
    std::cout << "  open-tilt | close-tilt    Tilt fully open / closed\n";
    std::cout << "  speed <1-3>               Set motor speed\n";
    std::cout << "  status                    Query position, battery and speed\n";
    std::cout << "  demo                      Run a scripted session incl. concurrent commands\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config, -c <FILE>   Load device settings (INI)\n";
    std::cout << "  --address, -a <ADDR>  Peripheral address (overrides config)\n";
    std::cout << "  --force, -f           Ignore unset end positions\n";
    std::cout << "  --uncalibrated, -u    Simulated motor has no end positions\n";
    std::cout << "  --verbose, -v         Debug logging\n";
    std::cout << "  --help, -h            This help\n";
}

void attachPrinters(BlindDevice& dev) {
    dev.registerConnectionCallback([](ConnectionState state) {
        std::cout << "  connection: " << connectionStateToString(state) << "\n";
    });
    dev.registerPositionCallback([](uint8_t pos, uint8_t tilt, const EndPositionInfo& info) {
        std::cout << "  position: " << static_cast<int>(pos) << "%  tilt: " << static_cast<int>(tilt)
                  << "%  up=" << info.up << " down=" << info.down << " favorite=" << info.favorite << "\n";
    });
    dev.registerStatusCallback([](uint8_t pos, uint8_t tilt, uint8_t battery,
                                  std::optional<SpeedLevel> speed, const EndPositionInfo& info) {
        std::cout << "  status: position " << static_cast<int>(pos) << "%  tilt "
                  << static_cast<int>(tilt) << "%  battery " << static_cast<int>(battery)
                  << "%  speed " << speedLevelToString(speed)
                  << "  up=" << info.up << " down=" << info.down << " favorite=" << info.favorite << "\n";
    });
    dev.registerRunningCallback([](bool opening) {
        std::cout << "  running: " << (opening ? "opening" : "closing") << "\n";
    });
}

bool parseNumber(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

CommandResult runCommand(BlindDevice& dev, const std::string& cmd, const std::string& value,
                         bool force) {
    int n = 0;
    if (cmd == "open") return dev.open(force);
    if (cmd == "close") return dev.close(force);
    if (cmd == "stop") return dev.stop(force);
    if (cmd == "favorite") return dev.favorite();
    if (cmd == "open-tilt") return dev.openTilt(force);
    if (cmd == "close-tilt") return dev.closeTilt(force);
    if (cmd == "status") return dev.statusQuery();
    if (cmd == "position" || cmd == "tilt") {
        if (!parseNumber(value, n)) {
            throw std::invalid_argument(cmd + " needs a number, got '" + value + "'");
        }
        return cmd == "position" ? dev.percentage(n, force) : dev.tiltPercentage(n, force);
    }
    if (cmd == "speed") {
        std::optional<SpeedLevel> level;
        if (parseNumber(value, n) && n >= 0 && n <= 255) {
            level = speedLevelFromCode(static_cast<uint8_t>(n));
        }
        if (!level) {
            throw std::invalid_argument("speed must be 1, 2 or 3");
        }
        return dev.speed(*level);
    }
    throw std::invalid_argument("unknown command '" + cmd + "'");
}

int runDemo(BlindDevice& dev, sim::SimulatedBlind& blind, bool force) {
    std::cout << "\n--- status ---\n";
    dev.statusQuery();

    std::cout << "\n--- close, position 40, tilt 50 ---\n";
    dev.close(force);
    dev.percentage(40, force);
    dev.tiltPercentage(50, force);

    std::cout << "\n--- peer drops the link ---\n";
    blind.dropLink();

    if (checkEndPositions(dev.getEndPositionInfo(), force) != GuardResult::PASS) {
        std::cout << "\nEnd positions not set, skipping movement (use --force)\n";
        dev.disconnect();
        return 1;
    }

    std::cout << "\n--- three concurrent commands while reconnecting ---\n";
    blind.holdConnects();
    const int targets[] = {10, 60, 90};
    std::vector<CommandResult> results(3, CommandResult::NOT_SENT);
    std::vector<std::thread> callers;
    for (size_t i = 0; i < 3; i++) {
        callers.emplace_back([&dev, &results, &targets, i, force] {
            results[i] = dev.percentage(targets[i], force);
        });
        // Register in order so the last caller is deterministic
        while (dev.coordinator().waitingCallers() < i + 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    blind.releaseConnects();
    for (auto& th : callers) th.join();

    for (size_t i = 0; i < 3; i++) {
        std::cout << "  percentage(" << targets[i] << ") -> " << commandResultToString(results[i]) << "\n";
    }

    std::cout << "\n--- disconnect ---\n";
    dev.disconnect();

    CoordinatorStats cs = dev.coordinator().getStats();
    DispatcherStats ds = dev.dispatcher().getStats();
    std::cout << "\nConnect attempts: " << cs.attempts_started
              << "  coalesced callers: " << cs.callers_coalesced
              << "  peer drops: " << cs.unsolicited_drops << "\n";
    std::cout << "Commands sent: " << ds.commands_sent
              << "  write retries: " << ds.write_retries << "\n";
    return results[2] == CommandResult::SENT ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        DeviceConfig config;
        config.address = "AA:BB:CC:DD:EE:FF";
        config.name = "Simulated blind";

        std::string address_override;
        bool force = false;
        bool uncalibrated = false;
        bool verbose = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                std::string path = argv[++i];
                if (!config.load(path)) {
                    std::cerr << "Cannot read config file: " << path << "\n";
                    return 2;
                }
            } else if ((arg == "--address" || arg == "-a") && i + 1 < argc) {
                address_override = argv[++i];
            } else if (arg == "--force" || arg == "-f") {
                force = true;
            } else if (arg == "--uncalibrated" || arg == "-u") {
                uncalibrated = true;
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            printUsage();
            return 2;
        }
        if (!address_override.empty()) {
            config.address = address_override;
        }

        setLogLevel(verbose ? LogLevel::DEBUG : config.log_level);

        sim::SimulatedBlind blind;
        if (uncalibrated) {
            blind.setUncalibrated();
        }
        crypto::ClearTextCrypt crypt;
        BlindDevice dev(config, blind, crypt);
        attachPrinters(dev);

        const std::string& cmd = positional[0];
        std::cout << "Device: " << dev.getLinkTarget().displayName() << "\n";

        if (cmd == "demo") {
            return runDemo(dev, blind, force);
        }

        CommandResult result = runCommand(dev, cmd, positional.size() > 1 ? positional[1] : "", force);
        std::cout << cmd << ": " << commandResultToString(result) << "\n";
        return result == CommandResult::SENT ? 0 : 1;
    } catch (const transport::TransportError& e) {
        std::cerr << "Transport error (" << transport::transportErrorKindToString(e.kind())
                  << "): " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error in blind_cli: " << e.what() << "\n";
        return 2;
    }
}
