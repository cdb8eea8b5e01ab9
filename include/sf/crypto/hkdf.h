#pragma once

#include <cstdint>
#include <span>

namespace sf::crypto {

// RFC 5869 extract-and-expand over SHA-512; fills `out` (at most 255 * 64 bytes).
void HKDF_SHA512(std::span<const uint8_t> ikm,
                 std::span<const uint8_t> salt,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> out);

}  // namespace sf::crypto
