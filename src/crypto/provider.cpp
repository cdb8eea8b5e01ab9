#include "sf/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "sf/crypto/ct.h"
#include "sf/error.h"

namespace sf::crypto {

namespace {

void ThrowCryptoError(const std::string& message, int code = 0) {
  throw sf::Error(sf::ErrorDomain::Crypto, code, message);
}

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

std::span<const uint8_t> Ascii(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

void RunKnownAnswerTests() { // SHA-256, HMAC-SHA256 (RFC 4231 case 2), SHAKE256 self-tests
  static constexpr std::array<uint8_t, 32> kSha256Abc{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  static constexpr std::array<uint8_t, 32> kHmacJefe{
      0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24, 0x26, 0x08, 0x95, 0x75, 0xc7,
      0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83, 0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};
  static constexpr std::array<uint8_t, 32> kShake256Empty{
      0x46, 0xb9, 0xdd, 0x2b, 0x0b, 0xa8, 0x8d, 0x13, 0x23, 0x3b, 0x3f, 0xeb, 0x74, 0x3e, 0xeb, 0x24,
      0x3f, 0xcd, 0x52, 0xea, 0x62, 0xb8, 0x1b, 0x82, 0xb5, 0x0c, 0x27, 0x64, 0x6e, 0xd5, 0x76, 0x2f};

  OpenSSLCryptoProvider provider;
  if (!ct::CompareEqual(provider.SHA256(Ascii("abc")), kSha256Abc)) {
    ThrowCryptoError("SHA-256 KAT mismatch");
  }
  if (!ct::CompareEqual(provider.HMACSHA256(Ascii("Jefe"), Ascii("what do ya want for nothing?")),
                        kHmacJefe)) {
    ThrowCryptoError("HMAC-SHA256 KAT mismatch");
  }
  std::array<uint8_t, 32> shake{};
  provider.SHAKE256(std::span<const uint8_t>{}, shake);
  if (!ct::CompareEqual(shake, kShake256Empty)) {
    ThrowCryptoError("SHAKE256 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunKnownAnswerTests();
    state.kat_passed = true;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  static const uint8_t kEmpty = 0;
  const uint8_t* key_data = key.empty() ? &kEmpty : key.data();
  const uint8_t* msg_data = message.empty() ? &kEmpty : message.data();
  if (HMAC(EVP_sha256(), key_data, static_cast<int>(key.size()), msg_data,
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

void OpenSSLCryptoProvider::SHAKE256(std::span<const uint8_t> data, std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate SHAKE256 context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_shake256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex(EVP_shake256)"));
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestUpdate(shake256)"));
  }
  if (EVP_DigestFinalXOF(ctx.get(), out.data(), out.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestFinalXOF"));
  }
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

}  // namespace sf::crypto
