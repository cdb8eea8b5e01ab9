#include "sf/platform/memory_lock.h"

#include <cerrno>

#if !defined(_WIN32)
#include <sys/mman.h>
#define SF_POSIX_MLOCK 1
#else
#define SF_POSIX_MLOCK 0
#endif

namespace sf::platform {

namespace {

thread_local int t_last_error = 0;

MemoryLockStatus FromErrno(int rc) noexcept {
  if (rc == 0) {
    t_last_error = 0;
    return MemoryLockStatus::kLocked;
  }
  t_last_error = errno;
  return t_last_error == ENOSYS ? MemoryLockStatus::kUnsupported : MemoryLockStatus::kBestEffort;
}

} // namespace

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return MemoryLockStatus::kBestEffort;
  }
#if SF_POSIX_MLOCK
  return FromErrno(::mlock(ptr, length));
#else
  return MemoryLockStatus::kUnsupported;
#endif
}

void UnlockMemory(void* ptr, std::size_t length) noexcept {
#if SF_POSIX_MLOCK
  if (ptr && length != 0) {
    ::munlock(ptr, length);
  }
#else
  (void)ptr;
  (void)length;
#endif
}

bool MemoryLockSupported() noexcept {
  return SF_POSIX_MLOCK != 0;
}

MemoryLockStatus LockProcessMemory() noexcept {
#if SF_POSIX_MLOCK && defined(MCL_CURRENT) && defined(MCL_FUTURE)
  return FromErrno(::mlockall(MCL_CURRENT | MCL_FUTURE));
#else
  return MemoryLockStatus::kUnsupported;
#endif
}

void UnlockProcessMemory() noexcept {
#if SF_POSIX_MLOCK && defined(MCL_CURRENT)
  ::munlockall();
#endif
}

int LastLockError() noexcept {
  return t_last_error;
}

}  // namespace sf::platform
