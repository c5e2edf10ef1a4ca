// Identity cipher for the simulator and for replaying decrypted captures

#pragma once

#include "crypt_port.hpp"
#include <functional>
#include <mutex>

namespace blindlink {
namespace crypto {

/**
 * ClearTextCrypt
 *
 * encrypt/decrypt only normalize the hex to lowercase. The timestamp is the
 * local wall clock packed as [yy][mm][dd][hh][mi][ss][ms:2] (8 bytes).
 */
class ClearTextCrypt : public CryptPort {
public:
    using TimestampSource = std::function<std::string()>;

    ClearTextCrypt() = default;

    std::string encrypt(const std::string& hex_plaintext) override;
    std::string decrypt(const std::string& hex_ciphertext) override;
    std::string timestamp() override;

    // Replace the wall-clock stamp (tests use a fixed value)
    void setTimestampSource(TimestampSource source);

    // Number of hex characters timestamp() appends by default
    static constexpr size_t TIMESTAMP_HEX_LEN = 16;

private:
    std::mutex mutex_;
    TimestampSource timestamp_source_;
};

} // namespace crypto
} // namespace blindlink
