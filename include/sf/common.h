#pragma once
#include <array>
#include <bit>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace sf {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint32_t ByteSwap32(std::uint32_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ulong(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap32(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint64_t ByteSwap64(std::uint64_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_uint64(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap64(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint32_t ToBigEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? detail::ByteSwap32(value) : value;
}

inline constexpr std::uint64_t ToBigEndian(std::uint64_t value) noexcept {
  return kIsLittleEndian ? detail::ByteSwap64(value) : value;
}

template <class T>
  requires std::is_trivially_copyable_v<T>
inline std::span<const std::uint8_t> AsBytesConst(const T& object) noexcept {
  const auto* data = reinterpret_cast<const std::uint8_t*>(std::addressof(object));
  return {data, sizeof(T)};
}

inline std::span<const std::uint8_t> AsBytesConst(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (std::uint8_t byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// YYYY-MM-DD in UTC.
std::string FormatIsoDate(TimePoint tp);

} // namespace sf
