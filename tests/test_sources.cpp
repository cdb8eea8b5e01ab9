#include "sf/error.h"
#include "sf/sources/dice.h"
#include "sf/sources/hardware_challenge.h"
#include "sf/sources/hardware_noise.h"
#include "sf/sources/registry.h"
#include "sf/sources/system_rng.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class TempDir {
public:
  TempDir() {
    auto base = std::filesystem::temp_directory_path();
    auto name = std::string{"sf_sources_"} +
                std::to_string(static_cast<unsigned long long>(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
    path_ = base / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_{};
};

sf::ErrorKind KindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const sf::Error& err) {
    return sf::ClassifyError(err);
  }
  return sf::ErrorKind::kNone;
}

class FakeResponder final : public sf::sources::ChallengeResponder {
public:
  bool present{true};
  bool fail{false};
  int calls{0};
  std::function<void(int)> on_call;

  bool Present() const override { return present; }
  std::array<uint8_t, kResponseBytes> Respond(std::span<const uint8_t> challenge) override {
    ++calls;
    if (on_call) {
      on_call(calls);
    }
    if (fail) {
      throw std::runtime_error("token removed");
    }
    std::array<uint8_t, kResponseBytes> out{};
    for (size_t i = 0; i < out.size(); ++i) {
      out[i] = static_cast<uint8_t>(challenge[i] ^ 0x5C);
    }
    return out;
  }
  std::string Serial() const override { return "7712345"; }
};

class ScriptedDice final : public sf::sources::DiceRollReader {
public:
  explicit ScriptedDice(std::vector<uint8_t> script) : script_(script.begin(), script.end()) {}
  bool short_batch{false};

  std::vector<uint8_t> ReadRolls(size_t count) override {
    std::vector<uint8_t> out;
    const size_t n = short_batch ? count - 1 : count;
    for (size_t i = 0; i < n; ++i) {
      if (script_.empty()) {
        out.push_back(static_cast<uint8_t>(1 + (counter_++ % 6)));
      } else {
        out.push_back(script_.front());
        script_.pop_front();
      }
    }
    return out;
  }

private:
  std::deque<uint8_t> script_;
  size_t counter_{0};
};

class CompositeImpostor final : public sf::sources::EntropySource {
public:
  sf::sources::SourceKind kind() const noexcept override { return sf::sources::SourceKind::kComposite; }
  std::string name() const override { return "impostor"; }
  double BitsPerUnit() const noexcept override { return 8.0; }
  bool Available() const override { return true; }
  sf::sources::CollectionResult Collect(uint64_t, const sf::sources::CancellationToken&) override {
    return {};
  }
};

void TestSystemRngRoundsToWholeBytes() {
  sf::sources::SystemRngSource source;
  sf::sources::CancellationToken cancel;
  auto result = source.Collect(256, cancel);
  assert(result.bytes.size() == 32 && "256 bits must collect 32 bytes");
  assert(result.actual_bits == 256 && "actual bits must match bytes");

  auto rounded = source.Collect(9, cancel);
  assert(rounded.bytes.size() == 2 && "9 bits rounds up to two bytes");
  assert(rounded.actual_bits == 16 && "actual bits reports the rounded amount");

  assert(KindOf([&] { (void)source.Collect(0, cancel); }) == sf::ErrorKind::kInvalidArgument &&
         "zero-bit request is rejected");
}

void TestSystemRngCancellation() {
  sf::sources::SystemRngSource source;
  sf::sources::CancellationToken cancel;
  cancel.Cancel();
  assert(KindOf([&] { (void)source.Collect(1024, cancel); }) == sf::ErrorKind::kCollectionAborted &&
         "cancelled token aborts collection");
}

void TestChallengeResponseUnits() {
  auto responder = std::make_shared<FakeResponder>();
  sf::sources::HardwareChallengeSource source(responder);
  sf::sources::CancellationToken cancel;
  assert(source.BitsPerUnit() == 160.0 && "one response is 160 bits");

  auto result = source.Collect(161, cancel);
  assert(responder->calls == 2 && "161 bits needs two responses");
  assert(result.bytes.size() == 40 && "two responses are 40 bytes");
  assert(result.actual_bits == 320 && "actual bits reports whole units");
  assert(result.device_info.at("serial") == "7712345" && "serial recorded in device info");
  assert(result.device_info.at("slot") == "2" && "slot recorded in device info");
}

void TestChallengeResponseFailures() {
  sf::sources::CancellationToken cancel;

  auto absent = std::make_shared<FakeResponder>();
  absent->present = false;
  sf::sources::HardwareChallengeSource missing(absent);
  assert(!missing.Available() && "absent token is unavailable");
  assert(KindOf([&] { (void)missing.Collect(160, cancel); }) == sf::ErrorKind::kHardwareUnavailable &&
         "absent token reports HardwareUnavailable");

  auto failing = std::make_shared<FakeResponder>();
  failing->fail = true;
  sf::sources::HardwareChallengeSource broken(failing);
  assert(KindOf([&] { (void)broken.Collect(160, cancel); }) == sf::ErrorKind::kHardwareUnavailable &&
         "responder failure reports HardwareUnavailable");

  auto cancelling = std::make_shared<FakeResponder>();
  sf::sources::CancellationToken mid;
  cancelling->on_call = [&mid](int call) {
    if (call == 2) {
      mid.Cancel();
    }
  };
  sf::sources::HardwareChallengeSource interrupted(cancelling);
  assert(KindOf([&] { (void)interrupted.Collect(160 * 4, mid); }) == sf::ErrorKind::kCollectionAborted &&
         "cancel between units aborts");
  assert(cancelling->calls == 2 && "no further challenges after cancel");

  auto touch_cancelled = std::make_shared<FakeResponder>();
  touch_cancelled->on_call = [](int) {
    throw sf::Error{sf::ErrorDomain::State, sf::errors::entropy::kCollectionAborted, "touch cancelled"};
  };
  sf::sources::HardwareChallengeSource declined(touch_cancelled);
  assert(KindOf([&] { (void)declined.Collect(160, cancel); }) == sf::ErrorKind::kCollectionAborted &&
         "responder errors keep their kind");
}

void TestDiceEncodingVector() {
  const std::vector<uint8_t> rolls{3, 1, 4, 1, 5, 2, 6, 5, 3, 5};
  auto encoded = sf::sources::EncodeDiceRolls(rolls);
  assert(encoded.size() == 3 && "ten rolls carry 25 bits, three whole bytes");
  assert(encoded.data()[0] == 0xE8 && encoded.data()[1] == 0xDF && encoded.data()[2] == 0x40 &&
         "base-6 value must be emitted little-endian");

  const std::vector<uint8_t> bad{1, 7};
  assert(KindOf([&] { (void)sf::sources::EncodeDiceRolls(bad); }) == sf::ErrorKind::kEncoding &&
         "die value 7 is an encoding error");
  const std::vector<uint8_t> zero{0};
  assert(KindOf([&] { (void)sf::sources::EncodeDiceRolls(zero); }) == sf::ErrorKind::kEncoding &&
         "die value 0 is an encoding error");
}

void TestDiceCollection() {
  auto reader = std::make_shared<ScriptedDice>(std::vector<uint8_t>{});
  sf::sources::DiceSource source(reader, 5);
  sf::sources::CancellationToken cancel;

  assert(source.PromptsFor(8) == 1 && "one five-dice prompt covers a byte");
  assert(source.PromptsFor(256) == 20 && "256 bits needs twenty prompts of five dice");

  auto result = source.Collect(256, cancel);
  assert(result.bytes.size() == 32 && "collection yields the requested bytes");
  assert(result.actual_bits == 256 && "actual bits are whole bytes");
  assert(result.device_info.at("rolls") == "100" && "roll count recorded");

  auto short_reader = std::make_shared<ScriptedDice>(std::vector<uint8_t>{});
  short_reader->short_batch = true;
  sf::sources::DiceSource short_source(short_reader, 5);
  assert(KindOf([&] { (void)short_source.Collect(64, cancel); }) == sf::ErrorKind::kEncoding &&
         "reader returning too few dice is rejected");

  sf::sources::CancellationToken cancelled;
  cancelled.Cancel();
  assert(KindOf([&] { (void)source.Collect(64, cancelled); }) == sf::ErrorKind::kCollectionAborted &&
         "dice collection honours cancellation");
}

void TestNoiseDevice() {
  TempDir dir;
  const auto path = dir.path() / "noise.bin";
  std::vector<uint8_t> content(1000);
  for (size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<uint8_t>((i * 131u + 7u) & 0xFF);
  }
  {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
  }
  sf::sources::CancellationToken cancel;

  sf::sources::HardwareNoiseSource source(std::make_shared<sf::sources::FileNoiseDevice>(path));
  assert(source.Available() && "existing device is available");
  auto result = source.Collect(4096, cancel);
  assert(result.bytes.size() == 512 && "512 bytes read");
  assert(std::equal(content.begin(), content.begin() + 512, result.bytes.data()) &&
         "bytes come straight from the device");

  sf::sources::HardwareNoiseSource starved(std::make_shared<sf::sources::FileNoiseDevice>(path));
  try {
    (void)starved.Collect(2000 * 8, cancel);
    assert(false && "short read must throw");
  } catch (const sf::Error& err) {
    assert(sf::ClassifyError(err) == sf::ErrorKind::kInsufficientEntropy && "short read kind");
    assert(sf::ContextValue(err, "required_bits") == std::optional<std::string>("16000") &&
           "required bits in context");
    assert(sf::ContextValue(err, "actual_bits") == std::optional<std::string>("8000") &&
           "actual bits in context");
  }

  sf::sources::HardwareNoiseSource absent(
      std::make_shared<sf::sources::FileNoiseDevice>(dir.path() / "missing"));
  assert(KindOf([&] { (void)absent.Collect(8, cancel); }) == sf::ErrorKind::kHardwareUnavailable &&
         "missing device is unavailable");
}

void TestRegistry() {
  sf::sources::SourceRegistry registry;
  assert(KindOf([&] { (void)registry.Get(sf::sources::SourceKind::kDice); }) ==
             sf::ErrorKind::kHardwareUnavailable &&
         "unregistered kind is unavailable");
  assert(KindOf([&] { registry.Register(std::make_unique<CompositeImpostor>()); }) ==
             sf::ErrorKind::kInvalidArgument &&
         "composite cannot be registered");
  assert(KindOf([&] { (void)registry.Get(sf::sources::SourceKind::kComposite); }) ==
             sf::ErrorKind::kInvalidArgument &&
         "composite cannot be collected");

  registry.Register(std::make_unique<sf::sources::SystemRngSource>());
  auto absent = std::make_shared<FakeResponder>();
  absent->present = false;
  registry.Register(std::make_unique<sf::sources::HardwareChallengeSource>(absent));

  assert(registry.Get(sf::sources::SourceKind::kSystemRng).kind() == sf::sources::SourceKind::kSystemRng &&
         "registered adapter is returned");
  assert(registry.Contains(sf::sources::SourceKind::kHardwareChallenge) && "registered kind is known");
  assert(KindOf([&] { (void)registry.Get(sf::sources::SourceKind::kHardwareChallenge); }) ==
             sf::ErrorKind::kHardwareUnavailable &&
         "registered but absent device is unavailable");
  auto kinds = registry.AvailableKinds();
  assert(kinds.size() == 1 && kinds[0] == sf::sources::SourceKind::kSystemRng && "only available kinds listed");
}

void TestKindNames() {
  using sf::sources::SourceKind;
  for (auto kind : sf::sources::kAllSourceKinds) {
    assert(sf::sources::ParseSourceKind(sf::sources::SourceKindName(kind)) == kind && "name parses back");
  }
  assert(sf::sources::SourceAlgorithmToken(SourceKind::kHardwareChallenge) == "YUBIKEY-HMAC" &&
         "challenge token");
  assert(sf::sources::SourceAlgorithmToken(SourceKind::kHardwareNoise) == "INFNOISE" && "noise token");
}

} // namespace

int main() {
  TestSystemRngRoundsToWholeBytes();
  TestSystemRngCancellation();
  TestChallengeResponseUnits();
  TestChallengeResponseFailures();
  TestDiceEncodingVector();
  TestDiceCollection();
  TestNoiseDevice();
  TestRegistry();
  TestKindNames();
  std::cout << "test_sources completed" << std::endl;
  return 0;
}
