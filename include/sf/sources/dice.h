#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "sf/sources/source.h"

namespace sf::sources {

// Supplies physical d6 rolls, `count` values per prompt.
class DiceRollReader {
public:
  virtual ~DiceRollReader() = default;
  virtual std::vector<uint8_t> ReadRolls(size_t count) = 0;
};

// Encodes rolls as one base-6 integer and emits its low-order bytes.
class DiceSource final : public EntropySource {
public:
  DiceSource(std::shared_ptr<DiceRollReader> reader, uint32_t dice_per_roll);

  SourceKind kind() const noexcept override { return SourceKind::kDice; }
  std::string name() const override { return "dice"; }
  double BitsPerUnit() const noexcept override;
  bool Available() const override { return reader_ != nullptr; }
  CollectionResult Collect(uint64_t target_bits, const CancellationToken& cancel) override;

  uint32_t dice_per_roll() const noexcept { return dice_per_roll_; }
  // Prompts needed for a request of `target_bits`.
  uint64_t PromptsFor(uint64_t target_bits) const noexcept;

private:
  std::shared_ptr<DiceRollReader> reader_;
  uint32_t dice_per_roll_;
};

// Low floor(floor(n * log2 6) / 8) bytes, little-endian, of the base-6 value
// of `rolls` (first roll most significant). Throws Encoding for values outside 1..6.
security::SecureBuffer<uint8_t> EncodeDiceRolls(std::span<const uint8_t> rolls);

} // namespace sf::sources
