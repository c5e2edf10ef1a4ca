#pragma once

#include "blindlink/types.hpp"
#include <functional>
#include <stdexcept>
#include <string>

namespace blindlink {
namespace transport {

// GATT characteristics of the blind motor
constexpr const char* COMMAND_CHARACTERISTIC = "d973f2e2-b19e-11e2-9e96-0800200c9a66";
constexpr const char* NOTIFICATION_CHARACTERISTIC = "d973f2e1-b19e-11e2-9e96-0800200c9a66";

// Transport failure categories
enum class TransportErrorKind {
    NOT_FOUND,         // Peripheral not advertising / unknown address
    SLOTS_EXHAUSTED,   // Adapter has no free connection slots
    TRANSIENT,         // Write or link hiccup, worth retrying
};

const char* transportErrorKindToString(TransportErrorKind kind);

class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    TransportErrorKind kind() const { return kind_; }

private:
    TransportErrorKind kind_;
};

/**
 * Transport Port
 *
 * Wireless link to one peripheral. Connect/disconnect/write may block the
 * calling thread; notifications and unsolicited-disconnect callbacks arrive
 * on a thread owned by the transport. Radio-level retries (connection slots,
 * backoff) happen below this interface, bounded by max_attempts.
 */
class TransportPort {
public:
    using NotifyCallback = std::function<void(const Bytes& data)>;
    using DisconnectCallback = std::function<void(LinkHandle handle)>;

    virtual ~TransportPort() = default;

    // Throws TransportError (NOT_FOUND, SLOTS_EXHAUSTED or TRANSIENT)
    virtual LinkHandle connect(const LinkTarget& target, int max_attempts) = 0;
    virtual void disconnect(LinkHandle handle) = 0;
    virtual bool isConnected(LinkHandle handle) const = 0;

    virtual void subscribe(LinkHandle handle, const std::string& characteristic,
                           NotifyCallback on_notify) = 0;

    // Throws TransportError(TRANSIENT) when the write is not acknowledged
    virtual void write(LinkHandle handle, const std::string& characteristic,
                       const Bytes& data, bool with_response) = 0;

    // Called once when the peer drops the link without us asking
    virtual void onUnsolicitedDisconnect(LinkHandle handle, DisconnectCallback cb) = 0;
};

} // namespace transport
} // namespace blindlink
