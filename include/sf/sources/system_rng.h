#pragma once

#include "sf/sources/source.h"

namespace sf::sources {

// Operating-system CSPRNG, one byte per unit.
class SystemRngSource final : public EntropySource {
public:
  SourceKind kind() const noexcept override { return SourceKind::kSystemRng; }
  std::string name() const override { return "system_rng"; }
  double BitsPerUnit() const noexcept override { return 8.0; }
  bool Available() const override { return true; }
  CollectionResult Collect(uint64_t target_bits, const CancellationToken& cancel) override;

  static constexpr size_t kChunkBytes = 4096;
};

} // namespace sf::sources
