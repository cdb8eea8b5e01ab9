#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sf/common.h"
#include "sf/core/label.h"
#include "sf/core/validator.h"
#include "sf/security/secure_buffer.h"
#include "sf/sources/source.h"

namespace sf::core {

enum class PoolState { kCreated, kConsumed, kExpired };

std::string_view PoolStateName(PoolState state) noexcept;

// One unit of collected or combined entropy. Stored pools are immutable
// snapshots; consumption replaces the snapshot with a copy whose raw_bytes
// are empty. size_bits == 8 * raw_bytes.size() until then.
struct EntropyPool {
  std::string id;
  sources::SourceKind kind{sources::SourceKind::kSystemRng};
  uint64_t size_bits{0};
  uint64_t entropy_bits{0}; // claimed by the source or combiner
  security::SecureBuffer<uint8_t> raw_bytes;
  TimePoint created_at{};
  TimePoint expires_at{};
  bool consumed{false};
  std::optional<QualityMetrics> quality;
  bool quality_rejected{false};
  std::vector<std::string> lineage; // contributing pool ids; empty for leaf pools
  sources::DeviceInfo device_info;
  Label label;

  // Copy of every field except the raw bytes.
  EntropyPool MetadataCopy() const;
};

// "pool-" followed by 32 lowercase hex characters from the system RNG.
std::string GeneratePoolId();

} // namespace sf::core
