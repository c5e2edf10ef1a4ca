#pragma once

#include "crypto/crypt_port.hpp"
#include "protocol/command_frame.hpp"
#include "transport/transport_port.hpp"
#include "blindlink/types.hpp"

#include <functional>
#include <mutex>
#include <optional>

namespace blindlink {
namespace device {

struct DispatcherStats {
    int commands_sent = 0;
    int write_retries = 0;
    int commands_failed = 0;    // Gave up after the attempt ceiling
    int commands_no_link = 0;
};

/**
 * Command Dispatcher
 *
 * Appends a fresh timestamp to the frame, encrypts it and writes it to the
 * command characteristic with acknowledgement. Transient write failures are
 * retried; after max_attempts failed writes the link is assumed dead, the
 * link-failed callback forces a disconnect and the last error is rethrown.
 */
class CommandDispatcher {
public:
    using LinkProvider = std::function<std::optional<LinkHandle>()>;
    using LinkFailedCallback = std::function<void()>;

    CommandDispatcher(transport::TransportPort& transport, crypto::CryptPort& crypt,
                      int max_attempts = 5);

    void setLinkProvider(LinkProvider provider) { link_provider_ = std::move(provider); }
    void setLinkFailedCallback(LinkFailedCallback cb) { on_link_failed_ = std::move(cb); }

    // False when there is no link. Throws TransportError when every
    // attempt failed.
    bool send(const protocol::CommandFrame& frame);

    int getMaxAttempts() const { return max_attempts_; }
    DispatcherStats getStats() const;

private:
    transport::TransportPort& transport_;
    crypto::CryptPort& crypt_;
    int max_attempts_;

    LinkProvider link_provider_;
    LinkFailedCallback on_link_failed_;

    mutable std::mutex stats_mutex_;
    DispatcherStats stats_;
};

} // namespace device
} // namespace blindlink
