// Cipher seam between the command/notification path and the peripheral's
// payload obfuscation.

#pragma once

#include <string>

namespace blindlink {
namespace crypto {

/**
 * Cryptography Port
 *
 * Frames cross this interface as hex strings. The cipher algorithm is
 * supplied by the integrator; nothing in the engine depends on its layout.
 * Implementations must be safe to call from the caller threads and the
 * transport's notification thread at the same time.
 */
class CryptPort {
public:
    virtual ~CryptPort() = default;

    virtual std::string encrypt(const std::string& hex_plaintext) = 0;
    virtual std::string decrypt(const std::string& hex_ciphertext) = 0;

    // Freshness stamp appended to every command, hex encoded.
    // Must be produced at send time, never cached.
    virtual std::string timestamp() = 0;
};

} // namespace crypto
} // namespace blindlink
