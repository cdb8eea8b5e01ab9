#include "sf/sources/hardware_noise.h"

#include <algorithm>
#include <system_error>

#include "sf/error.h"
#include "sf/errors.h"

namespace sf::sources {

FileNoiseDevice::FileNoiseDevice(std::filesystem::path path) : path_(std::move(path)) {}

bool FileNoiseDevice::Present() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec) && !ec;
}

size_t FileNoiseDevice::Read(std::span<uint8_t> out) {
  if (!stream_.is_open()) {
    stream_.rdbuf()->pubsetbuf(nullptr, 0); // unbuffered: never read ahead of the request
    stream_.open(path_, std::ios::in | std::ios::binary);
    if (!stream_) {
      throw Error{ErrorDomain::Dependency, errors::entropy::kHardwareUnavailable,
                  "Failed to open entropy device " + path_.string()};
    }
  }
  stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  return static_cast<size_t>(stream_.gcount());
}

HardwareNoiseSource::HardwareNoiseSource(std::shared_ptr<NoiseDevice> device)
    : device_(std::move(device)) {}

bool HardwareNoiseSource::Available() const {
  return device_ && device_->Present();
}

CollectionResult HardwareNoiseSource::Collect(uint64_t target_bits, const CancellationToken& cancel) {
  RequirePositiveTarget(target_bits);
  if (!Available()) {
    ThrowHardwareUnavailable(kind(), device_ ? device_->Description() : std::string("no device"));
  }
  const size_t total = static_cast<size_t>((target_bits + 7) / 8);
  CollectionResult result;
  result.bytes = security::SecureBuffer<uint8_t>(total);

  size_t offset = 0;
  while (offset < total) {
    if (cancel.IsCancelled()) {
      result.bytes.Clear();
      ThrowCollectionAborted(kind(), static_cast<uint64_t>(offset) * 8);
    }
    const size_t want = std::min(kUnitBytes, total - offset);
    const size_t got = device_->Read(result.bytes.AsSpan().subspan(offset, want));
    offset += got;
    if (got < want) {
      result.bytes.Clear();
      throw Error{ErrorDomain::Validation, errors::entropy::kInsufficientEntropy,
                  std::string(errors::msg::kShortDeviceRead), std::nullopt, Retryability::kFatal,
                  {ContextEntry("source", SourceKindName(kind())),
                   ContextEntry("required_bits", static_cast<uint64_t>(total) * 8),
                   ContextEntry("actual_bits", static_cast<uint64_t>(offset) * 8)}};
    }
  }

  result.actual_bits = static_cast<uint64_t>(total) * 8;
  result.device_info["device"] = "noise";
  result.device_info["path"] = device_->Description();
  return result;
}

} // namespace sf::sources
