#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sf/common.h"

namespace sf::core {

enum class LabelType { kEntropy, kSalt, kUser };

std::string_view LabelTypeToken(LabelType type) noexcept;

inline constexpr std::string_view kLabelCategory = "Saltforge";

// Provenance string attached to pools, salts and derived identifiers:
//   Saltforge/<TYPE>/<ALGO>:<data>:<date>#k=v&k=v|CHECK
// data, keys and values are percent-encoded; CHECK is a Luhn mod-36 character
// over the upper-cased body.
class Label {
public:
  using Param = std::pair<std::string, std::string>;

  Label() = default;
  Label(LabelType type, std::string algorithm, std::string data, std::string date = {});

  LabelType type() const noexcept { return type_; }
  const std::string& algorithm() const noexcept { return algorithm_; }
  const std::string& data() const noexcept { return data_; }
  const std::string& date() const noexcept { return date_; }
  const std::vector<Param>& params() const noexcept { return params_; }

  // Appends a parameter; throws Encoding when the key is already present.
  Label& Add(std::string key, std::string value);
  Label& Add(std::string key, uint64_t value) { return Add(std::move(key), std::to_string(value)); }
  std::optional<std::string> Get(std::string_view key) const;

  // Body without the check character.
  std::string Body() const;
  std::string Serialize() const;
  static Label Parse(std::string_view text);

  // Params compare as a set; their serialized order is insertion order.
  bool operator==(const Label& other) const;
  bool operator!=(const Label& other) const { return !(*this == other); }

private:
  LabelType type_{LabelType::kEntropy};
  std::string algorithm_;
  std::string data_;
  std::string date_;
  std::vector<Param> params_;
};

char LuhnMod36CheckChar(std::string_view body);

std::string PercentEncode(std::string_view text);
std::string PercentDecode(std::string_view text); // throws Encoding on a bad escape

bool IsValidIsoDate(std::string_view date) noexcept;

} // namespace sf::core
