#include "clear_text_crypt.hpp"
#include "hex.hpp"

#include <chrono>
#include <ctime>

namespace blindlink {
namespace crypto {

namespace {

std::string normalize(const std::string& hex) {
    // Round-trip through the codec so malformed input is rejected here
    Bytes bytes = hexToBytes(hex);
    return bytesToHex(bytes);
}

std::string wallClockStamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    Bytes stamp = {
        static_cast<uint8_t>(local.tm_year % 100),
        static_cast<uint8_t>(local.tm_mon + 1),
        static_cast<uint8_t>(local.tm_mday),
        static_cast<uint8_t>(local.tm_hour),
        static_cast<uint8_t>(local.tm_min),
        static_cast<uint8_t>(local.tm_sec),
        static_cast<uint8_t>((ms >> 8) & 0xFF),
        static_cast<uint8_t>(ms & 0xFF),
    };
    return bytesToHex(stamp);
}

} // namespace

std::string ClearTextCrypt::encrypt(const std::string& hex_plaintext) {
    return normalize(hex_plaintext);
}

std::string ClearTextCrypt::decrypt(const std::string& hex_ciphertext) {
    return normalize(hex_ciphertext);
}

std::string ClearTextCrypt::timestamp() {
    TimestampSource source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = timestamp_source_;
    }
    return source ? source() : wallClockStamp();
}

void ClearTextCrypt::setTimestampSource(TimestampSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamp_source_ = std::move(source);
}

} // namespace crypto
} // namespace blindlink
