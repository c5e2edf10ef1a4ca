// Hex string <-> byte conversion for frames

#pragma once

#include "blindlink/types.hpp"
#include <string>

namespace blindlink {
namespace crypto {

// Lowercase, two characters per byte, no separators
std::string bytesToHex(ByteSpan data);

// Accepts upper or lower case. Throws std::invalid_argument on odd length
// or non-hex characters.
Bytes hexToBytes(const std::string& hex);

// Single byte as two lowercase hex digits
std::string byteToHex(uint8_t value);

} // namespace crypto
} // namespace blindlink
