#pragma once
#include <cstdint>
#include <span>

#include "sf/security/secure_buffer.h"

namespace sf::crypto {

// SHAKE256 extendable output of exactly `out.size()` bytes.
void SHAKE256_Expand(std::span<const uint8_t> data, std::span<uint8_t> out);

security::SecureBuffer<uint8_t> SHAKE256_Expand(std::span<const uint8_t> data, size_t length);

} // namespace sf::crypto
