#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "sf/common.h"
#include "sf/core/label.h"
#include "sf/security/secure_buffer.h"

namespace sf::core {

inline constexpr std::string_view kSaltAlgorithm = "HKDF-SHA512";
inline constexpr uint32_t kSaltVersion = 1;
inline constexpr size_t kSaltBytes = 64;
inline constexpr size_t kMinRestoredSaltBytes = 16;
inline constexpr std::string_view kSaltExtractContext = "saltforge/salt-extract/v1";
inline constexpr std::string_view kSaltInfoContext = "saltforge/salt/v1";

inline constexpr std::string_view kUsernameAlgorithm = "HMAC-SHA256";
inline constexpr uint32_t kUsernameVersion = 1;
inline constexpr std::string_view kUsernameContext = "saltforge/username/v1";
inline constexpr std::string_view kUsernameAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
inline constexpr size_t kMinIdentifierLength = 1;
inline constexpr size_t kMaxIdentifierLength = 128;

// Secret produced once from a consumed pool. Immutable; wiped on destruction.
class DerivationSalt {
public:
  // HKDF-SHA512 over the pool bytes.
  static std::shared_ptr<const DerivationSalt> Derive(std::span<const uint8_t> pool_bytes,
                                                      std::string owner_pool_id, TimePoint created_at);
  // Rebuilds a salt from persisted bytes (at least 16).
  static std::shared_ptr<const DerivationSalt> Restore(std::span<const uint8_t> bytes,
                                                       std::string owner_pool_id,
                                                       TimePoint created_at,
                                                       std::string algorithm = std::string(kSaltAlgorithm),
                                                       uint32_t version = kSaltVersion);

  std::span<const uint8_t> bytes() const noexcept { return bytes_.AsSpan(); }
  const std::string& owner_pool_id() const noexcept { return owner_pool_id_; }
  const std::string& algorithm() const noexcept { return algorithm_; }
  uint32_t version() const noexcept { return version_; }
  TimePoint created_at() const noexcept { return created_at_; }
  const Label& label() const noexcept { return label_; }

  DerivationSalt(const DerivationSalt&) = delete;
  DerivationSalt& operator=(const DerivationSalt&) = delete;

private:
  DerivationSalt(security::SecureBuffer<uint8_t> bytes, std::string owner_pool_id, std::string algorithm,
                 uint32_t version, TimePoint created_at);

  security::SecureBuffer<uint8_t> bytes_;
  std::string owner_pool_id_;
  std::string algorithm_;
  uint32_t version_;
  TimePoint created_at_;
  Label label_;
};

// Explicit handle passed into every derivation call.
class SaltContext {
public:
  SaltContext() = default;
  explicit SaltContext(std::shared_ptr<const DerivationSalt> salt) : salt_(std::move(salt)) {}

  bool valid() const noexcept { return salt_ != nullptr; }
  // Throws InvalidArgument when empty.
  const DerivationSalt& salt() const;
  std::shared_ptr<const DerivationSalt> shared() const noexcept { return salt_; }

private:
  std::shared_ptr<const DerivationSalt> salt_;
};

struct DerivedIdentifier {
  std::string domain; // normalized
  std::string salt_ref; // owner pool id of the salt
  size_t length{0};
  std::string value;
  Label label;
};

// Lowercases and strips scheme, user info, path, query, fragment, port and a
// trailing dot. Throws Encoding when the result is not a plausible host name.
std::string NormalizeDomain(std::string_view domain);

// Pure function of (salt bytes, normalized domain, length).
std::string DeriveUsernameValue(std::span<const uint8_t> salt, std::string_view normalized_domain,
                                size_t length);

DerivedIdentifier DeriveIdentifier(const SaltContext& context, std::string_view domain, size_t length,
                                   TimePoint derived_at);

// Constant-time comparison against a fresh derivation. False for a malformed
// domain or an unsupported candidate length.
bool VerifyIdentifier(const SaltContext& context, std::string_view domain, std::string_view candidate);

} // namespace sf::core
