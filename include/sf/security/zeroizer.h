#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace sf::security {

class Zeroizer {
public:
  // OPENSSL_cleanse; never elided by the optimizer.
  static void Wipe(std::span<uint8_t> data) noexcept;

  static bool MemoryLockingSupported() noexcept;

  enum class LockStatus {
    Locked,
    BestEffort,
    Unsupported,
  };

  static LockStatus TryLockMemory(std::span<uint8_t> data) noexcept;

  static void UnlockMemory(std::span<uint8_t> data) noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    if (vec.empty()) {
      return;
    }
    const std::size_t bytes = vec.size() * sizeof(T);
    auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), bytes);
    Wipe(byte_span);
  }

  // Overwrites the characters in place, then empties the string.
  static void WipeString(std::string& text) noexcept {
    if (!text.empty()) {
      Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    }
    text.clear();
  }

  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}
    ScopeWiper(T* ptr, std::size_t count) noexcept : ScopeWiper(std::span<T>(ptr, count)) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ScopeWiper(ScopeWiper&&) = delete;
    ScopeWiper& operator=(ScopeWiper&&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      const std::size_t bytes = span_.size_bytes();
      auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()), bytes);
      Zeroizer::Wipe(byte_span);
    }

  private:
    std::span<T> span_;
  };
};

} // namespace sf::security
