#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace sf::crypto {
std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
} // namespace sf::crypto
