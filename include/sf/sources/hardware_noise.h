#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>

#include "sf/sources/source.h"

namespace sf::sources {

// Raw byte stream from a hardware noise generator.
class NoiseDevice {
public:
  virtual ~NoiseDevice() = default;
  virtual bool Present() const = 0;
  // Reads up to out.size() bytes; returns the count actually read.
  virtual size_t Read(std::span<uint8_t> out) = 0;
  virtual std::string Description() const = 0;
};

// Character device such as /dev/hwrng or an Infinite Noise TRNG node.
class FileNoiseDevice final : public NoiseDevice {
public:
  explicit FileNoiseDevice(std::filesystem::path path);

  bool Present() const override;
  size_t Read(std::span<uint8_t> out) override;
  std::string Description() const override { return path_.string(); }

private:
  std::filesystem::path path_;
  std::ifstream stream_;
};

class HardwareNoiseSource final : public EntropySource {
public:
  static constexpr size_t kUnitBytes = 512;

  explicit HardwareNoiseSource(std::shared_ptr<NoiseDevice> device);

  SourceKind kind() const noexcept override { return SourceKind::kHardwareNoise; }
  std::string name() const override { return "hardware_noise"; }
  double BitsPerUnit() const noexcept override { return 8.0 * kUnitBytes; }
  bool Available() const override;
  CollectionResult Collect(uint64_t target_bits, const CancellationToken& cancel) override;

private:
  std::shared_ptr<NoiseDevice> device_;
};

} // namespace sf::sources
