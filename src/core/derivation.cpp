#include "sf/core/derivation.h"

#include <array>
#include <cstring>
#include <vector>

#include "sf/crypto/ct.h"
#include "sf/crypto/hkdf.h"
#include "sf/crypto/hmac_sha256.h"
#include "sf/error.h"
#include "sf/errors.h"
#include "sf/security/zeroizer.h"

namespace sf::core {

namespace {

[[noreturn]] void ThrowDomain(std::string_view message, std::string_view domain) {
  throw Error{ErrorDomain::Validation, errors::entropy::kEncoding, std::string(message), std::nullopt,
              Retryability::kFatal, {ContextEntry("domain_length", static_cast<uint64_t>(domain.size()))}};
}

void RequireLength(size_t length) {
  if (length < kMinIdentifierLength || length > kMaxIdentifierLength) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                std::string(errors::msg::kInvalidIdentifierLength), std::nullopt, Retryability::kFatal,
                {ContextEntry("length", static_cast<uint64_t>(length))}};
  }
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsHostChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
}

} // namespace

DerivationSalt::DerivationSalt(security::SecureBuffer<uint8_t> bytes, std::string owner_pool_id,
                               std::string algorithm, uint32_t version, TimePoint created_at)
    : bytes_(std::move(bytes)),
      owner_pool_id_(std::move(owner_pool_id)),
      algorithm_(std::move(algorithm)),
      version_(version),
      created_at_(created_at),
      label_(LabelType::kSalt, algorithm_, owner_pool_id_, FormatIsoDate(created_at)) {
  label_.Add("VERSION", version_).Add("BITS", static_cast<uint64_t>(bytes_.size()) * 8);
}

std::shared_ptr<const DerivationSalt> DerivationSalt::Derive(std::span<const uint8_t> pool_bytes,
                                                             std::string owner_pool_id,
                                                             TimePoint created_at) {
  security::SecureBuffer<uint8_t> out(kSaltBytes);
  crypto::HKDF_SHA512(pool_bytes, AsBytesConst(kSaltExtractContext), AsBytesConst(kSaltInfoContext),
                      out.AsSpan());
  return std::shared_ptr<const DerivationSalt>(new DerivationSalt(
      std::move(out), std::move(owner_pool_id), std::string(kSaltAlgorithm), kSaltVersion, created_at));
}

std::shared_ptr<const DerivationSalt> DerivationSalt::Restore(std::span<const uint8_t> bytes,
                                                              std::string owner_pool_id,
                                                              TimePoint created_at, std::string algorithm,
                                                              uint32_t version) {
  if (bytes.size() < kMinRestoredSaltBytes) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                std::string(errors::msg::kSaltTooShort), std::nullopt, Retryability::kFatal,
                {ContextEntry("salt_length", static_cast<uint64_t>(bytes.size()))}};
  }
  return std::shared_ptr<const DerivationSalt>(
      new DerivationSalt(security::SecureBuffer<uint8_t>::CopyOf(bytes), std::move(owner_pool_id),
                         std::move(algorithm), version, created_at));
}

const DerivationSalt& SaltContext::salt() const {
  if (!salt_) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument, "Salt context is empty"};
  }
  return *salt_;
}

std::string NormalizeDomain(std::string_view domain) {
  size_t begin = 0;
  size_t end = domain.size();
  while (begin < end && IsSpace(domain[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(domain[end - 1])) {
    --end;
  }
  std::string host(domain.substr(begin, end - begin));
  for (auto& c : host) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  if (auto scheme = host.find("://"); scheme != std::string::npos) {
    host.erase(0, scheme + 3);
  }
  if (auto cut = host.find_first_of("/?#"); cut != std::string::npos) {
    host.erase(cut);
  }
  if (auto at = host.rfind('@'); at != std::string::npos) {
    host.erase(0, at + 1);
  }
  if (auto colon = host.find(':'); colon != std::string::npos) {
    host.erase(colon);
  }
  if (!host.empty() && host.back() == '.') {
    host.pop_back();
  }

  if (host.empty()) {
    ThrowDomain(errors::msg::kEmptyDomain, domain);
  }
  if (host.size() > 253) {
    ThrowDomain(errors::msg::kDomainTooLong, domain);
  }
  for (char c : host) {
    if (!IsHostChar(c)) {
      ThrowDomain(errors::msg::kDomainInvalidCharacter, domain);
    }
  }
  if (host.front() == '.' || host.find("..") != std::string::npos) {
    ThrowDomain(errors::msg::kDomainEmptyLabel, domain);
  }
  return host;
}

std::string DeriveUsernameValue(std::span<const uint8_t> salt, std::string_view normalized_domain,
                                size_t length) {
  RequireLength(length);
  std::vector<uint8_t> message;
  message.reserve(kUsernameContext.size() + normalized_domain.size() + 6);
  message.insert(message.end(), kUsernameContext.begin(), kUsernameContext.end());
  message.push_back(0x00);
  message.insert(message.end(), normalized_domain.begin(), normalized_domain.end());
  message.push_back(0x00);
  const size_t counter_offset = message.size();
  message.resize(counter_offset + sizeof(uint32_t));

  std::string out;
  out.reserve(length);
  for (uint32_t counter = 0; out.size() < length; ++counter) {
    const uint32_t counter_be = ToBigEndian32(counter);
    std::memcpy(message.data() + counter_offset, &counter_be, sizeof(counter_be));
    auto block = crypto::HMAC_SHA256::Compute(salt, message);
    for (uint8_t b : block) {
      if (out.size() == length) {
        break;
      }
      // 252 = 7 * 36; larger bytes would bias the first symbols
      if (b < 252) {
        out.push_back(kUsernameAlphabet[b % kUsernameAlphabet.size()]);
      }
    }
    security::Zeroizer::Wipe(block);
  }
  return out;
}

DerivedIdentifier DeriveIdentifier(const SaltContext& context, std::string_view domain, size_t length,
                                   TimePoint derived_at) {
  RequireLength(length);
  const auto& salt = context.salt();
  DerivedIdentifier id;
  id.domain = NormalizeDomain(domain);
  id.salt_ref = salt.owner_pool_id();
  id.length = length;
  id.value = DeriveUsernameValue(salt.bytes(), id.domain, length);
  id.label = Label(LabelType::kUser, std::string(kUsernameAlgorithm), id.domain, FormatIsoDate(derived_at));
  id.label.Add("VERSION", kUsernameVersion).Add("LENGTH", static_cast<uint64_t>(length));
  return id;
}

bool VerifyIdentifier(const SaltContext& context, std::string_view domain, std::string_view candidate) {
  if (candidate.size() < kMinIdentifierLength || candidate.size() > kMaxIdentifierLength) {
    return false;
  }
  const auto& salt = context.salt();
  std::string normalized;
  try {
    normalized = NormalizeDomain(domain);
  } catch (const Error& err) {
    if (ClassifyError(err) != ErrorKind::kEncoding) {
      throw;
    }
    return false;
  }
  std::string expected = DeriveUsernameValue(salt.bytes(), normalized, candidate.size());
  const bool match = crypto::ct::StringCompare(expected, candidate);
  security::Zeroizer::WipeString(expected);
  return match;
}

} // namespace sf::core
