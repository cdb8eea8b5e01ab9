#include "sf/crypto/shake256.h"

#include "sf/crypto/provider.h"

namespace sf::crypto {

void SHAKE256_Expand(std::span<const uint8_t> data, std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  auto provider = GetCryptoProviderShared();
  provider->SHAKE256(data, out);
}

security::SecureBuffer<uint8_t> SHAKE256_Expand(std::span<const uint8_t> data, size_t length) {
  security::SecureBuffer<uint8_t> out(length);
  SHAKE256_Expand(data, out.AsSpan());
  return out;
}

} // namespace sf::crypto
