#include "sf/crypto/random.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <span>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#if (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
#define SF_HAVE_X86_SEED 1
#include <immintrin.h>
#else
#define SF_HAVE_X86_SEED 0
#endif

#include "sf/error.h"
#include "sf/security/zeroizer.h"

namespace {

void XorIntoBuffer(std::span<uint8_t> dest, const uint8_t* data, size_t length) {
  if (dest.empty() || data == nullptr || length == 0) {
    return;
  }
  size_t index = 0;
  for (size_t i = 0; i < length; ++i) {
    dest[index] ^= data[i];
    if (++index == dest.size()) {
      index = 0;
    }
  }
}

#if SF_HAVE_X86_SEED
bool CpuSupportsRdseed() {
  return __builtin_cpu_supports("rdseed");
}

__attribute__((target("rdseed"))) bool Rdseed64(uint64_t& value) {
#if defined(__x86_64__)
  return __builtin_ia32_rdseed_di_step(reinterpret_cast<unsigned long long*>(&value)) == 1;
#else
  unsigned int temp = 0;
  if (__builtin_ia32_rdseed_si_step(&temp) == 1) {
    value = temp;
    return true;
  }
  return false;
#endif
}
#endif

// XORs CPU seed output into the OS bytes; never weakens the OS output.
void MixHardwareSeed(std::span<uint8_t> dest) {
#if SF_HAVE_X86_SEED
  if (!CpuSupportsRdseed()) {
    return;
  }
  const size_t words = (dest.size() + sizeof(uint64_t) - 1) / sizeof(uint64_t);
  for (size_t i = 0; i < words && i < 64; ++i) {
    uint64_t value = 0;
    if (!Rdseed64(value)) {
      continue;
    }
    uint8_t buffer[sizeof(value)];
    std::memcpy(buffer, &value, sizeof(buffer));
    const size_t offset = i * sizeof(uint64_t);
    const size_t length = std::min(sizeof(buffer), dest.size() - offset);
    XorIntoBuffer(dest.subspan(offset, length), buffer, length);
    sf::security::Zeroizer::Wipe(std::span<uint8_t>(buffer, sizeof(buffer)));
  }
#else
  (void)dest;
#endif
}

[[maybe_unused]] void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw sf::Error(sf::ErrorDomain::Crypto, errno, "Failed to open /dev/urandom");
  }
  urandom.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw sf::Error(sf::ErrorDomain::Crypto, errno,
                    "Failed to read sufficient entropy from /dev/urandom");
  }
}

}  // namespace

namespace sf::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    throw Error(ErrorDomain::Crypto, static_cast<int>(status), "BCryptGenRandom failed");
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // kernel without getrandom(2); fall back to /dev/urandom
      }
      throw Error(ErrorDomain::Crypto, errno, "getrandom failed");
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
  MixHardwareSeed(out);
}

}  // namespace sf::crypto
