#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace sf::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  // Extendable-output hash: fills `out` entirely with SHAKE256(data).
  virtual void SHAKE256(std::span<const uint8_t> data, std::span<uint8_t> out) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  void SHAKE256(std::span<const uint8_t> data, std::span<uint8_t> out) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the known-answer self-tests once

}  // namespace sf::crypto
