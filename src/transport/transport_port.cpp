#include "transport_port.hpp"

namespace blindlink {
namespace transport {

const char* transportErrorKindToString(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::NOT_FOUND:       return "NOT_FOUND";
        case TransportErrorKind::SLOTS_EXHAUSTED: return "SLOTS_EXHAUSTED";
        case TransportErrorKind::TRANSIENT:       return "TRANSIENT";
        default: return "UNKNOWN";
    }
}

} // namespace transport
} // namespace blindlink
