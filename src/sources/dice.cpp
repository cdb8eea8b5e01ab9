#include "sf/sources/dice.h"

#include <cmath>

#include "sf/error.h"
#include "sf/errors.h"
#include "sf/security/zeroizer.h"

namespace sf::sources {

namespace {

const double kBitsPerDie = std::log2(6.0);

[[noreturn]] void ThrowEncoding(std::string_view message, uint64_t position) {
  throw Error{ErrorDomain::Validation, errors::entropy::kEncoding, std::string(message),
              std::nullopt, Retryability::kFatal, {ContextEntry("roll_index", position)}};
}

uint64_t EncodedBits(uint64_t rolls) {
  return static_cast<uint64_t>(std::floor(static_cast<double>(rolls) * kBitsPerDie));
}

} // namespace

security::SecureBuffer<uint8_t> EncodeDiceRolls(std::span<const uint8_t> rolls) {
  const size_t out_bytes = static_cast<size_t>(EncodedBits(rolls.size()) / 8);
  // room for the whole integer, which may exceed out_bytes by one partial byte
  security::SecureBuffer<uint8_t> value(out_bytes + 2);
  size_t used = 0;
  for (size_t i = 0; i < rolls.size(); ++i) {
    const uint8_t die = rolls[i];
    if (die < 1 || die > 6) {
      ThrowEncoding(errors::msg::kInvalidDieValue, i);
    }
    uint32_t carry = static_cast<uint32_t>(die - 1);
    uint8_t* limbs = value.data();
    for (size_t j = 0; j < used; ++j) {
      const uint32_t v = static_cast<uint32_t>(limbs[j]) * 6U + carry;
      limbs[j] = static_cast<uint8_t>(v & 0xFF);
      carry = v >> 8;
    }
    if (carry != 0 && used < value.size()) {
      limbs[used++] = static_cast<uint8_t>(carry);
    }
  }
  value.Truncate(out_bytes);
  return value;
}

DiceSource::DiceSource(std::shared_ptr<DiceRollReader> reader, uint32_t dice_per_roll)
    : reader_(std::move(reader)), dice_per_roll_(dice_per_roll == 0 ? 1 : dice_per_roll) {}

double DiceSource::BitsPerUnit() const noexcept {
  return static_cast<double>(dice_per_roll_) * kBitsPerDie;
}

uint64_t DiceSource::PromptsFor(uint64_t target_bits) const noexcept {
  const uint64_t rounded = ((target_bits + 7) / 8) * 8;
  uint64_t prompts = static_cast<uint64_t>(std::ceil(static_cast<double>(rounded) / BitsPerUnit()));
  while (EncodedBits(prompts * dice_per_roll_) < rounded) {
    ++prompts;
  }
  return prompts;
}

CollectionResult DiceSource::Collect(uint64_t target_bits, const CancellationToken& cancel) {
  RequirePositiveTarget(target_bits);
  if (!Available()) {
    ThrowHardwareUnavailable(kind(), "no dice reader attached");
  }
  const uint64_t prompts = PromptsFor(target_bits);
  std::vector<uint8_t> rolls;
  rolls.reserve(static_cast<size_t>(prompts * dice_per_roll_));

  for (uint64_t prompt = 0; prompt < prompts; ++prompt) {
    if (cancel.IsCancelled()) {
      const uint64_t partial = EncodedBits(rolls.size());
      security::Zeroizer::WipeVector(rolls);
      ThrowCollectionAborted(kind(), partial);
    }
    auto batch = reader_->ReadRolls(dice_per_roll_);
    if (batch.size() != dice_per_roll_) {
      security::Zeroizer::WipeVector(batch);
      security::Zeroizer::WipeVector(rolls);
      ThrowEncoding(errors::msg::kDiceReaderShortRoll, rolls.size());
    }
    rolls.insert(rolls.end(), batch.begin(), batch.end());
    security::Zeroizer::WipeVector(batch);
  }

  CollectionResult result;
  try {
    result.bytes = EncodeDiceRolls(rolls);
  } catch (const Error&) {
    security::Zeroizer::WipeVector(rolls);
    throw;
  }
  security::Zeroizer::WipeVector(rolls);
  result.actual_bits = static_cast<uint64_t>(result.bytes.size()) * 8;
  result.device_info["device"] = "d6";
  result.device_info["dice_per_roll"] = std::to_string(dice_per_roll_);
  result.device_info["rolls"] = std::to_string(prompts * dice_per_roll_);
  return result;
}

} // namespace sf::sources
