#include "sf/sources/system_rng.h"

#include <algorithm>

#include "sf/crypto/random.h"

namespace sf::sources {

CollectionResult SystemRngSource::Collect(uint64_t target_bits, const CancellationToken& cancel) {
  RequirePositiveTarget(target_bits);
  const size_t total = static_cast<size_t>((target_bits + 7) / 8);
  CollectionResult result;
  result.bytes = security::SecureBuffer<uint8_t>(total);
  size_t offset = 0;
  while (offset < total) {
    if (cancel.IsCancelled()) {
      result.bytes.Clear();
      ThrowCollectionAborted(kind(), static_cast<uint64_t>(offset) * 8);
    }
    const size_t chunk = std::min(kChunkBytes, total - offset);
    crypto::SystemRandomBytes(result.bytes.AsSpan().subspan(offset, chunk));
    offset += chunk;
  }
  result.actual_bits = static_cast<uint64_t>(total) * 8;
  result.device_info["device"] = "os-csprng";
  return result;
}

} // namespace sf::sources
