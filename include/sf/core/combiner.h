#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "sf/security/secure_buffer.h"

namespace sf::core {

inline constexpr std::string_view kCombinerAlgorithm = "SHAKE256-XOR";
inline constexpr uint32_t kCombinerVersion = 1;
inline constexpr std::string_view kCombinerDomain = "saltforge/combine/v1";

// SHAKE256(domain || 0x00 || u32be(index) || u64be(len(source)) || source)
// truncated to `length` bytes.
security::SecureBuffer<uint8_t> ExtendSource(std::span<const uint8_t> source, uint32_t index,
                                             size_t length);

// XOR of every source extended to the longest source length. Throws
// InvalidArgument for an empty list or an empty source.
security::SecureBuffer<uint8_t> CombineSources(const std::vector<std::span<const uint8_t>>& sources);

// Claimed entropy of a combination: the strongest input.
uint64_t CombinedEntropyBits(std::span<const uint64_t> claimed_bits) noexcept;

} // namespace sf::core
