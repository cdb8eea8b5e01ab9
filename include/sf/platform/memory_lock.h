#pragma once
// page locking for sensitive buffers

#include <cstddef>

namespace sf::platform {

enum class MemoryLockStatus {
  kLocked,
  kBestEffort, // lock refused (limit or permission); the region stays pageable
  kUnsupported,
};

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept;
void UnlockMemory(void* ptr, std::size_t length) noexcept;
bool MemoryLockSupported() noexcept;

// mlockall(MCL_CURRENT | MCL_FUTURE) where the platform offers it.
MemoryLockStatus LockProcessMemory() noexcept;
void UnlockProcessMemory() noexcept;

// errno of the last failed lock on this thread, 0 if none.
int LastLockError() noexcept;

}  // namespace sf::platform
