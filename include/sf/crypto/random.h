#pragma once

#include <cstdint>
#include <span>

namespace sf::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace sf::crypto
