#include "sf/sources/hardware_challenge.h"

#include <cstring>
#include <exception>

#include "sf/crypto/random.h"
#include "sf/error.h"
#include "sf/errors.h"
#include "sf/security/zeroizer.h"

namespace sf::sources {

HardwareChallengeSource::HardwareChallengeSource(std::shared_ptr<ChallengeResponder> responder)
    : responder_(std::move(responder)) {}

bool HardwareChallengeSource::Available() const {
  return responder_ && responder_->Present();
}

CollectionResult HardwareChallengeSource::Collect(uint64_t target_bits, const CancellationToken& cancel) {
  RequirePositiveTarget(target_bits);
  if (!Available()) {
    ThrowHardwareUnavailable(kind(), "challenge-response token not present");
  }
  constexpr uint64_t kUnitBits = 8 * ChallengeResponder::kResponseBytes;
  const uint64_t units = (target_bits + kUnitBits - 1) / kUnitBits;

  CollectionResult result;
  result.bytes = security::SecureBuffer<uint8_t>(static_cast<size_t>(units) * ChallengeResponder::kResponseBytes);
  std::array<uint8_t, kChallengeBytes> challenge{};
  security::Zeroizer::ScopeWiper<uint8_t> challenge_guard(challenge.data(), challenge.size());

  for (uint64_t unit = 0; unit < units; ++unit) {
    if (cancel.IsCancelled()) {
      result.bytes.Clear();
      ThrowCollectionAborted(kind(), unit * kUnitBits);
    }
    crypto::SystemRandomBytes(challenge);
    std::array<uint8_t, ChallengeResponder::kResponseBytes> response{};
    try {
      response = responder_->Respond(challenge);
    } catch (const Error&) {
      result.bytes.Clear();
      throw;
    } catch (const std::exception& ex) {
      result.bytes.Clear();
      ThrowHardwareUnavailable(kind(), std::string(errors::msg::kChallengeResponseFailed) + ": " + ex.what());
    }
    std::memcpy(result.bytes.data() + unit * ChallengeResponder::kResponseBytes, response.data(),
                response.size());
    security::Zeroizer::Wipe(response);
  }

  result.actual_bits = static_cast<uint64_t>(result.bytes.size()) * 8;
  result.device_info["device"] = "hmac-sha1-token";
  result.device_info["serial"] = responder_->Serial();
  result.device_info["slot"] = std::to_string(responder_->Slot());
  return result;
}

} // namespace sf::sources
