#include "sf/core/combiner.h"

#include <algorithm>
#include <cstring>
#include <limits>

#include "sf/common.h"
#include "sf/crypto/shake256.h"
#include "sf/error.h"
#include "sf/errors.h"

namespace sf::core {

namespace {

[[noreturn]] void ThrowInvalid(size_t index) {
  throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
              std::string(errors::msg::kEmptyCombineInput), std::nullopt, Retryability::kFatal,
              {ContextEntry("source_index", static_cast<uint64_t>(index))}};
}

} // namespace

security::SecureBuffer<uint8_t> ExtendSource(std::span<const uint8_t> source, uint32_t index,
                                             size_t length) {
  const uint32_t index_be = ToBigEndian32(index);
  const uint64_t size_be = ToBigEndian(static_cast<uint64_t>(source.size()));
  const size_t header = kCombinerDomain.size() + 1 + sizeof(index_be) + sizeof(size_be);

  security::SecureBuffer<uint8_t> input(header + source.size());
  uint8_t* cursor = input.data();
  std::memcpy(cursor, kCombinerDomain.data(), kCombinerDomain.size());
  cursor += kCombinerDomain.size();
  *cursor++ = 0x00;
  std::memcpy(cursor, &index_be, sizeof(index_be));
  cursor += sizeof(index_be);
  std::memcpy(cursor, &size_be, sizeof(size_be));
  cursor += sizeof(size_be);
  if (!source.empty()) {
    std::memcpy(cursor, source.data(), source.size());
  }
  return crypto::SHAKE256_Expand(input.AsSpan(), length);
}

security::SecureBuffer<uint8_t> CombineSources(const std::vector<std::span<const uint8_t>>& sources) {
  if (sources.empty()) {
    ThrowInvalid(0);
  }
  size_t length = 0;
  for (size_t i = 0; i < sources.size(); ++i) {
    if (sources[i].empty()) {
      ThrowInvalid(i);
    }
    length = std::max(length, sources[i].size());
  }
  if (sources.size() > std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument, "Too many combiner sources"};
  }

  security::SecureBuffer<uint8_t> combined(length);
  for (size_t i = 0; i < sources.size(); ++i) {
    auto extended = ExtendSource(sources[i], static_cast<uint32_t>(i), length);
    auto* out = combined.data();
    const auto* in = extended.data();
    for (size_t j = 0; j < length; ++j) {
      out[j] ^= in[j];
    }
  }
  return combined;
}

uint64_t CombinedEntropyBits(std::span<const uint64_t> claimed_bits) noexcept {
  uint64_t best = 0;
  for (uint64_t bits : claimed_bits) {
    best = std::max(best, bits);
  }
  return best;
}

} // namespace sf::core
