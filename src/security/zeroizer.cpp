#include "sf/security/zeroizer.h"

#include <openssl/crypto.h>

#include "sf/platform/memory_lock.h"

namespace sf::security {

void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return;
  }
  OPENSSL_cleanse(data.data(), data.size());
}

bool Zeroizer::MemoryLockingSupported() noexcept {
  return platform::MemoryLockSupported();
}

Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return LockStatus::Locked;
  }
  switch (platform::LockMemory(data.data(), data.size())) {
  case platform::MemoryLockStatus::kLocked:
    return LockStatus::Locked;
  case platform::MemoryLockStatus::kBestEffort:
    return LockStatus::BestEffort;
  case platform::MemoryLockStatus::kUnsupported:
    break;
  }
  return LockStatus::Unsupported;
}

// Callers unlock only regions TryLockMemory reported as Locked.
void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
  platform::UnlockMemory(data.data(), data.size());
}

} // namespace sf::security
