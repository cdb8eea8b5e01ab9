#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "sf/security/secure_buffer.h"

namespace sf::sources {

enum class SourceKind : uint8_t {
  kHardwareChallenge = 0,
  kDice,
  kHardwareNoise,
  kSystemRng,
  kComposite,
};

inline constexpr SourceKind kAllSourceKinds[] = {SourceKind::kHardwareChallenge, SourceKind::kDice,
                                                 SourceKind::kHardwareNoise, SourceKind::kSystemRng,
                                                 SourceKind::kComposite};

std::string_view SourceKindName(SourceKind kind) noexcept;      // "system_rng", "dice", ...
std::string_view SourceAlgorithmToken(SourceKind kind) noexcept; // label token, e.g. "SYSRNG"
std::optional<SourceKind> ParseSourceKind(std::string_view name) noexcept;

// Free-form device metadata (serial, slot, device type) recorded per pool.
using DeviceInfo = std::map<std::string, std::string>;

struct CollectionResult {
  security::SecureBuffer<uint8_t> bytes;
  uint64_t actual_bits{0}; // always 8 * bytes.size()
  DeviceInfo device_info;
};

// Set from any thread; adapters poll it between collection units.
class CancellationToken {
public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

class EntropySource {
public:
  virtual ~EntropySource() = default;

  virtual SourceKind kind() const noexcept = 0;
  virtual std::string name() const = 0;
  // Entropy credited to one collection unit (a die roll, a response, a read).
  virtual double BitsPerUnit() const noexcept = 0;
  virtual bool Available() const = 0;

  // Collects at least `target_bits`, rounded up to whole units. Throws
  // HardwareUnavailable, CollectionAborted (partial data wiped) or
  // InsufficientEntropy on a short device read.
  virtual CollectionResult Collect(uint64_t target_bits, const CancellationToken& cancel) = 0;
};

// Shared failure helpers for adapters.
[[noreturn]] void ThrowCollectionAborted(SourceKind kind, uint64_t collected_bits);
[[noreturn]] void ThrowHardwareUnavailable(SourceKind kind, std::string_view detail);
void RequirePositiveTarget(uint64_t target_bits);

} // namespace sf::sources
