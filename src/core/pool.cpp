#include "sf/core/pool.h"

#include <array>

#include "sf/crypto/random.h"

namespace sf::core {

std::string_view PoolStateName(PoolState state) noexcept {
  switch (state) {
  case PoolState::kCreated:
    return "created";
  case PoolState::kConsumed:
    return "consumed";
  case PoolState::kExpired:
    return "expired";
  }
  return "created";
}

EntropyPool EntropyPool::MetadataCopy() const {
  EntropyPool copy;
  copy.id = id;
  copy.kind = kind;
  copy.size_bits = size_bits;
  copy.entropy_bits = entropy_bits;
  copy.created_at = created_at;
  copy.expires_at = expires_at;
  copy.consumed = consumed;
  copy.quality = quality;
  copy.quality_rejected = quality_rejected;
  copy.lineage = lineage;
  copy.device_info = device_info;
  copy.label = label;
  return copy;
}

std::string GeneratePoolId() {
  std::array<uint8_t, 16> id{};
  crypto::SystemRandomBytes(id);
  return "pool-" + HexEncode(id);
}

} // namespace sf::core
