#include "command_dispatcher.hpp"
#include "crypto/hex.hpp"
#include "blindlink/logging.hpp"

#include <chrono>

namespace blindlink {
namespace device {

using transport::TransportError;

CommandDispatcher::CommandDispatcher(transport::TransportPort& transport,
                                     crypto::CryptPort& crypt, int max_attempts)
    : transport_(transport)
    , crypt_(crypt)
    , max_attempts_(max_attempts < 1 ? 1 : max_attempts)
{
}

bool CommandDispatcher::send(const protocol::CommandFrame& frame) {
    // Timestamp is part of the protocol's freshness check: build right before writing
    std::string plaintext = frame.toHex() + crypt_.timestamp();
    Bytes payload = crypto::hexToBytes(crypt_.encrypt(plaintext));

    LOG_CMD(INFO, "Sending %s: %s", protocol::commandTypeToString(frame.type()), plaintext.c_str());

    for (int attempt = 1;; attempt++) {
        std::optional<LinkHandle> link = link_provider_ ? link_provider_() : std::nullopt;
        if (!link) {
            LOG_CMD(WARN, "Dropping %s: no link", protocol::commandTypeToString(frame.type()));
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.commands_no_link++;
            return false;
        }

        try {
            auto start = std::chrono::steady_clock::now();
            transport_.write(*link, transport::COMMAND_CHARACTERISTIC, payload, true);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            LOG_CMD(DEBUG, "%s acknowledged in %lld ms",
                    protocol::commandTypeToString(frame.type()), static_cast<long long>(elapsed));
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.commands_sent++;
            return true;
        } catch (const TransportError& e) {
            if (attempt >= max_attempts_) {
                LOG_CMD(ERROR, "%s failed after %d attempts: %s",
                        protocol::commandTypeToString(frame.type()), attempt, e.what());
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.commands_failed++;
                }
                // Peripheral is blocked or out of range; do not leave a dead link open
                if (on_link_failed_) {
                    on_link_failed_();
                }
                throw;
            }

            LOG_CMD(WARN, "Error sending %s (try %d/%d): %s",
                    protocol::commandTypeToString(frame.type()), attempt, max_attempts_, e.what());
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.write_retries++;
        }
    }
}

DispatcherStats CommandDispatcher::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace device
} // namespace blindlink
