#include "hex.hpp"
#include <stdexcept>

namespace blindlink {
namespace crypto {

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string bytesToHex(ByteSpan data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

Bytes hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hexToBytes: odd length " + std::to_string(hex.size()));
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("hexToBytes: invalid character at offset " +
                                        std::to_string(hi < 0 ? i : i + 1));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string byteToHex(uint8_t value) {
    std::string out(2, '0');
    out[0] = HEX_DIGITS[value >> 4];
    out[1] = HEX_DIGITS[value & 0x0F];
    return out;
}

} // namespace crypto
} // namespace blindlink
