#pragma once

#include <array>
#include <memory>
#include <span>
#include <string>

#include "sf/sources/source.h"

namespace sf::sources {

// HMAC-SHA1 challenge-response token (for example a YubiKey OTP slot).
class ChallengeResponder {
public:
  static constexpr size_t kResponseBytes = 20;

  virtual ~ChallengeResponder() = default;
  virtual bool Present() const = 0;
  virtual std::array<uint8_t, kResponseBytes> Respond(std::span<const uint8_t> challenge) = 0;
  virtual std::string Serial() const = 0;
  virtual int Slot() const { return 2; }
};

class HardwareChallengeSource final : public EntropySource {
public:
  static constexpr size_t kChallengeBytes = 32;

  explicit HardwareChallengeSource(std::shared_ptr<ChallengeResponder> responder);

  SourceKind kind() const noexcept override { return SourceKind::kHardwareChallenge; }
  std::string name() const override { return "hardware_challenge"; }
  double BitsPerUnit() const noexcept override { return 8.0 * ChallengeResponder::kResponseBytes; }
  bool Available() const override;
  CollectionResult Collect(uint64_t target_bits, const CancellationToken& cancel) override;

private:
  std::shared_ptr<ChallengeResponder> responder_;
};

} // namespace sf::sources
