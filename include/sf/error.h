#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sf {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace entropy {
      inline constexpr int kHardwareUnavailable = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kCollectionAborted = Make(ErrorDomain::State, 0x01);
      inline constexpr int kPoolConsumed = Make(ErrorDomain::State, 0x02);
      inline constexpr int kPoolExpired = Make(ErrorDomain::State, 0x03);
      inline constexpr int kInsufficientEntropy = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kEncoding = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidArgument = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kQualityRejected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kPoolNotFound = Make(ErrorDomain::IO, 0x01);
    } // namespace entropy

    namespace config {
      inline constexpr int kMalformedValue = Make(ErrorDomain::Config, 0x01);
    } // namespace config

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context; // key=value pairs
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Failure kinds surfaced by the entropy core.
  enum class ErrorKind : std::uint8_t {
    kNone = 0,
    kHardwareUnavailable,
    kCollectionAborted,
    kInsufficientEntropy,
    kQualityRejected,
    kPoolConsumed,
    kPoolExpired,
    kEncoding,
    kPoolNotFound,
    kInvalidArgument,
    kOther,
  };

  ErrorKind ClassifyError(const Error& error) noexcept;
  std::string_view ErrorKindName(ErrorKind kind) noexcept;

  // Returns the value of the first "key=value" context entry with the given key.
  std::optional<std::string> ContextValue(const Error& error, std::string_view key);

  std::string ContextEntry(std::string_view key, std::string_view value);
  std::string ContextEntry(std::string_view key, std::uint64_t value);
} // namespace sf
