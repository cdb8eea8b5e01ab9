#include "sf/core/label.h"
#include "sf/error.h"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

namespace {

bool ThrowsEncoding(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const sf::Error& err) {
    return sf::ClassifyError(err) == sf::ErrorKind::kEncoding;
  }
  return false;
}

void TestCheckCharacterVectors() {
  assert(sf::core::LuhnMod36CheckChar(
             "Saltforge/SALT/HKDF-SHA512:pool-0123:2026-10-19#VERSION=1&BITS=512") == '4' &&
         "salt label check character");
  assert(sf::core::LuhnMod36CheckChar(
             "Saltforge/ENTROPY/SYSRNG:pool-abc:2026-01-02#VERSION=1&BITS=256") == '8' &&
         "entropy label check character");
  assert(sf::core::LuhnMod36CheckChar(
             "Saltforge/USER/HMAC-SHA256:example.com:2026-10-19#VERSION=1&LENGTH=16") == '4' &&
         "user label check character");
  assert(sf::core::LuhnMod36CheckChar("abc") == sf::core::LuhnMod36CheckChar("ABC") &&
         "check character ignores case");
}

void TestSerializeMatchesVector() {
  sf::core::Label label(sf::core::LabelType::kSalt, "HKDF-SHA512", "pool-0123", "2026-10-19");
  label.Add("VERSION", 1).Add("BITS", 512);
  assert(label.Serialize() ==
             "Saltforge/SALT/HKDF-SHA512:pool-0123:2026-10-19#VERSION=1&BITS=512|4" &&
         "serialized salt label");
  assert(label.Get("BITS") == std::optional<std::string>("512") && "param lookup");
  assert(!label.Get("LENGTH") && "absent param");
}

void TestParseRoundTripAndOrder() {
  sf::core::Label label(sf::core::LabelType::kEntropy, "SYSRNG", "pool-abc", "2026-01-02");
  label.Add("VERSION", 1).Add("BITS", 256);
  const auto text = label.Serialize();
  const auto parsed = sf::core::Label::Parse(text);
  assert(parsed == label && "parsed label equals original");
  assert(parsed.type() == sf::core::LabelType::kEntropy && "type preserved");
  assert(parsed.algorithm() == "SYSRNG" && "algorithm preserved");
  assert(parsed.Serialize() == text && "serialize is stable");

  sf::core::Label reordered(sf::core::LabelType::kEntropy, "SYSRNG", "pool-abc", "2026-01-02");
  reordered.Add("BITS", 256).Add("VERSION", 1);
  assert(reordered == label && "param order does not affect equality");
  assert(reordered.Serialize() != label.Serialize() && "serialization keeps insertion order");

  sf::core::Label other(sf::core::LabelType::kEntropy, "SYSRNG", "pool-abc", "2026-01-02");
  other.Add("VERSION", 2).Add("BITS", 256);
  assert(other != label && "different param value differs");
}

void TestPercentEncodedFields() {
  sf::core::Label label(sf::core::LabelType::kUser, "HMAC-SHA256", "a:b#c&d=e|f%", "2026-10-19");
  label.Add("NOTE", "x y&z");
  const auto text = label.Serialize();
  assert(text.find("a%3Ab%23c%26d%3De%7Cf%25") != std::string::npos && "reserved chars escaped");
  const auto parsed = sf::core::Label::Parse(text);
  assert(parsed.data() == "a:b#c&d=e|f%" && "data decoded");
  assert(parsed.Get("NOTE") == std::optional<std::string>("x y&z") && "value decoded");

  assert(sf::core::PercentDecode("%41%62") == "Ab" && "escape decoding");
  assert(ThrowsEncoding([] { (void)sf::core::PercentDecode("%4"); }) && "truncated escape");
  assert(ThrowsEncoding([] { (void)sf::core::PercentDecode("%GZ"); }) && "bad hex escape");
}

void TestParseRejectsTampering() {
  const std::string good = "Saltforge/SALT/HKDF-SHA512:pool-0123:2026-10-19#VERSION=1&BITS=512|4";
  (void)sf::core::Label::Parse(good);
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(good.substr(0, good.size() - 2)); }) &&
         "missing check character");
  assert(ThrowsEncoding([] {
           (void)sf::core::Label::Parse("Saltforge/SALT/HKDF-SHA512:pool-0123:2026-10-19#VERSION=1&BITS=512|5");
         }) &&
         "wrong check character");
  assert(ThrowsEncoding([] {
           (void)sf::core::Label::Parse("Saltforge/SALT/HKDF-SHA512:pool-0123:2026-10-19#VERSION=1&BITS=513|4");
         }) &&
         "tampered body");

  auto with_check = [](const std::string& body) { return body + "|" + sf::core::LuhnMod36CheckChar(body); };
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/SALT/HKDF-SHA512:p:2026-10-19")); }) &&
         "missing params separator");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Other/SALT/HKDF-SHA512:p:2026-10-19#A=1")); }) &&
         "unknown category");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/KEY/HKDF-SHA512:p:2026-10-19#A=1")); }) &&
         "unknown type");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/SALT:p:2026-10-19#A=1")); }) &&
         "malformed head");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/SALT/HKDF:p:2026-10-19#A=1&A=2")); }) &&
         "duplicate key");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/SALT/HKDF:p:2026-10-19#A")); }) &&
         "param without value");
  assert(ThrowsEncoding([&] { (void)sf::core::Label::Parse(with_check("Saltforge/SALT/HKDF:p:2026-02-30#A=1")); }) &&
         "impossible date");
}

void TestConstructionValidation() {
  assert(ThrowsEncoding([] { (void)sf::core::Label(sf::core::LabelType::kSalt, "hkdf", "p", "2026-10-19"); }) &&
         "algorithm tokens are upper-case");
  assert(ThrowsEncoding([] { (void)sf::core::Label(sf::core::LabelType::kSalt, "HKDF", "p", "2026-13-01"); }) &&
         "month out of range");
  assert(ThrowsEncoding([] {
           sf::core::Label label(sf::core::LabelType::kSalt, "HKDF", "p", "2026-10-19");
           label.Add("A", "1").Add("A", "2");
         }) &&
         "duplicate key on add");

  assert(sf::core::IsValidIsoDate("2024-02-29") && "leap day");
  assert(!sf::core::IsValidIsoDate("2023-02-29") && "non-leap year");
  assert(!sf::core::IsValidIsoDate("2026-1-19") && "short month field");
}

} // namespace

int main() {
  TestCheckCharacterVectors();
  TestSerializeMatchesVector();
  TestParseRoundTripAndOrder();
  TestPercentEncodedFields();
  TestParseRejectsTampering();
  TestConstructionValidation();
  std::cout << "test_label completed" << std::endl;
  return 0;
}
