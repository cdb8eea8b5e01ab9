#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>
#include <new>
#include <span>
#include <stdexcept>
#include <vector>
#if defined(_WIN32)
#include <malloc.h>
#endif
#include "sf/common.h"
#include "sf/security/zeroizer.h"

namespace sf::security {

// Heap buffer for sensitive material: zeroed on allocation, best-effort locked
// against paging, and wiped before release.
template<typename T>
class SecureBuffer {
  T* ptr_{nullptr};
  size_t size_{0};
  size_t allocation_size_{0}; // padded allocation size for wiping/locking
  bool locked_{false};
  bool lock_capable_{false};
  struct LockRegion {
    uint8_t* begin{nullptr};
    size_t length{0};
    bool locked{false};
  };
  std::vector<LockRegion> lock_regions_;

  void Release() noexcept {
    if (!ptr_) {
      size_ = 0;
      allocation_size_ = 0;
      locked_ = false;
      lock_capable_ = false;
      lock_regions_.clear();
      return;
    }

    if (allocation_size_ > 0) {
      auto bytes_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_);
      Zeroizer::Wipe(bytes_span);
      for (auto& region : lock_regions_) {
        if (region.locked) {
          Zeroizer::UnlockMemory(std::span<uint8_t>(region.begin, region.length));
        }
      }
    }

#if defined(_WIN32)
    _aligned_free(ptr_);
#else
    std::free(ptr_);
#endif

    ptr_ = nullptr;
    size_ = 0;
    allocation_size_ = 0;
    locked_ = false;
    lock_capable_ = false;
    lock_regions_.clear();
  }

  static size_t RoundUpToAlignment(size_t value) {
    const size_t alignment = alignof(T);
    if (alignment <= 1U) {
      return value;
    }
    const size_t remainder = value % alignment;
    if (remainder == 0U) {
      return value;
    }
    const size_t padding = alignment - remainder;
    if (value > (std::numeric_limits<size_t>::max() - padding)) {
      throw std::bad_array_new_length{};
    }
    return value + padding;
  }

public:
  SecureBuffer() noexcept = default;

  explicit SecureBuffer(size_t n) : size_(n) {
    if (n > 0 && n > (std::numeric_limits<size_t>::max() / sizeof(T))) {
      throw std::bad_array_new_length{};
    }
    const size_t bytes = n * sizeof(T);
    if (bytes == 0) {
      return;
    }
    allocation_size_ = RoundUpToAlignment(bytes);
#if defined(_WIN32)
    ptr_ = static_cast<T*>(_aligned_malloc(allocation_size_, alignof(T)));
#else
    ptr_ = static_cast<T*>(std::aligned_alloc(alignof(T), allocation_size_));
#endif
    if (!ptr_)
      throw std::bad_alloc{};
    Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_));
    lock_capable_ = Zeroizer::MemoryLockingSupported();
    if (lock_capable_) {
      auto* raw = reinterpret_cast<uint8_t*>(ptr_);
      const size_t chunk_target = 64U * 1024U; // 64 KiB
      size_t offset = 0;
      bool all_chunks_locked = true;
      while (offset < allocation_size_) {
        const size_t chunk_size = std::min(chunk_target, allocation_size_ - offset);
        const auto status = Zeroizer::TryLockMemory(std::span<uint8_t>(raw + offset, chunk_size));
        const bool chunk_locked = (status == Zeroizer::LockStatus::Locked);
        lock_regions_.push_back(LockRegion{raw + offset, chunk_size, chunk_locked});
        all_chunks_locked = all_chunks_locked && chunk_locked;
        offset += chunk_size;
      }
      locked_ = all_chunks_locked;
      if (!locked_) {
        std::clog << "SecureBuffer warning: unable to lock all sensitive memory chunks; data may page to disk.\n";
      }
    }
  }

  static SecureBuffer CopyOf(std::span<const T> source) {
    SecureBuffer buffer(source.size());
    if (!source.empty()) {
      std::memcpy(buffer.data(), source.data(), source.size_bytes());
    }
    return buffer;
  }

  ~SecureBuffer() {
    Release();
  }
  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& o) noexcept
      : ptr_(o.ptr_), size_(o.size_), allocation_size_(o.allocation_size_), locked_(o.locked_),
        lock_capable_(o.lock_capable_), lock_regions_(std::move(o.lock_regions_)) {
    o.ptr_ = nullptr;
    o.size_ = 0;
    o.allocation_size_ = 0;
    o.locked_ = false;
    o.lock_capable_ = false;
    o.lock_regions_.clear();
  }
  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = o.ptr_;
      size_ = o.size_;
      allocation_size_ = o.allocation_size_;
      locked_ = o.locked_;
      lock_capable_ = o.lock_capable_;
      lock_regions_ = std::move(o.lock_regions_);
      o.ptr_ = nullptr;
      o.size_ = 0;
      o.allocation_size_ = 0;
      o.locked_ = false;
      o.lock_capable_ = false;
      o.lock_regions_.clear();
    }
    return *this;
  }

  // Shrinks the logical size, wiping the discarded tail.
  void Truncate(size_t n) noexcept {
    if (n >= size_) {
      return;
    }
    auto tail = std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_ + n), (size_ - n) * sizeof(T));
    Zeroizer::Wipe(tail);
    size_ = n;
  }

  // Wipes and frees the contents immediately.
  void Clear() noexcept { Release(); }

  T* data() noexcept { return ptr_; }
  const T* data() const noexcept { return ptr_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<T> AsSpan() noexcept { return {ptr_, size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_, size_}; }
  std::span<uint8_t> AsU8Span() noexcept {
    return {reinterpret_cast<uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  std::span<const uint8_t> AsU8Span() const noexcept {
    return {reinterpret_cast<const uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  bool IsLocked() const noexcept { return locked_; }
  bool LockingSupported() const noexcept { return lock_capable_; }

  void RequireLocking() const {
    if (!lock_capable_) {
      throw std::runtime_error("SecureBuffer: memory locking not supported on this platform");
    }
    if (!locked_) {
      throw std::runtime_error(
          "SecureBuffer: memory locking required but one or more chunks are unlocked");
    }
  }
};

} // namespace sf::security
