#include "sf/core/label.h"

#include <algorithm>
#include <ctime>

#include "sf/error.h"
#include "sf/errors.h"

namespace sf {

std::string FormatIsoDate(TimePoint tp) {
  auto tt = Clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buffer[16] = {0};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
  return buffer;
}

namespace core {

namespace {

constexpr std::string_view kLuhnAlphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr int kLuhnBase = 36;

[[noreturn]] void ThrowEncoding(std::string_view message, std::string_view input = {}) {
  std::vector<std::string> context;
  if (!input.empty()) {
    context.push_back(ContextEntry("label", input));
  }
  throw Error{ErrorDomain::Validation, errors::entropy::kEncoding, std::string(message),
              std::nullopt, Retryability::kFatal, std::move(context)};
}

bool IsUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
         c == '.' || c == '_' || c == '~';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

char ToUpperAscii(char c) {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

bool IsValidAlgorithmToken(std::string_view token) {
  if (token.empty()) {
    return false;
  }
  return std::all_of(token.begin(), token.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
  });
}

std::optional<LabelType> ParseLabelType(std::string_view token) {
  for (auto type : {LabelType::kEntropy, LabelType::kSalt, LabelType::kUser}) {
    if (LabelTypeToken(type) == token) {
      return type;
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

} // namespace

std::string_view LabelTypeToken(LabelType type) noexcept {
  switch (type) {
  case LabelType::kEntropy:
    return "ENTROPY";
  case LabelType::kSalt:
    return "SALT";
  case LabelType::kUser:
    return "USER";
  }
  return "ENTROPY";
}

char LuhnMod36CheckChar(std::string_view body) {
  int total = 0;
  size_t position = 0;
  for (auto it = body.rbegin(); it != body.rend(); ++it, ++position) {
    const char c = ToUpperAscii(*it);
    const auto idx = kLuhnAlphabet.find(c);
    int value = idx != std::string_view::npos
                    ? static_cast<int>(idx)
                    : static_cast<int>(static_cast<unsigned char>(c)) % kLuhnBase;
    if (position % 2 == 1) {
      value *= 2;
      if (value >= kLuhnBase) {
        value = value / kLuhnBase + value % kLuhnBase;
      }
    }
    total += value;
  }
  return kLuhnAlphabet[static_cast<size_t>((kLuhnBase - total % kLuhnBase) % kLuhnBase)];
}

std::string PercentEncode(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (IsUnreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c != '%') {
      out.push_back(c);
      continue;
    }
    if (i + 2 >= text.size()) {
      ThrowEncoding(errors::msg::kLabelBadEscape, text);
    }
    const int hi = HexValue(text[i + 1]);
    const int lo = HexValue(text[i + 2]);
    if (hi < 0 || lo < 0) {
      ThrowEncoding(errors::msg::kLabelBadEscape, text);
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

bool IsValidIsoDate(std::string_view date) noexcept {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return false;
  }
  auto digits = [&](size_t start, size_t count, int& out) {
    out = 0;
    for (size_t i = start; i < start + count; ++i) {
      if (date[i] < '0' || date[i] > '9') {
        return false;
      }
      out = out * 10 + (date[i] - '0');
    }
    return true;
  };
  int year = 0;
  int month = 0;
  int day = 0;
  if (!digits(0, 4, year) || !digits(5, 2, month) || !digits(8, 2, day)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1) {
    return false;
  }
  static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = kDaysInMonth[month - 1];
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) {
    limit = 29;
  }
  return day <= limit;
}

Label::Label(LabelType type, std::string algorithm, std::string data, std::string date)
    : type_(type), algorithm_(std::move(algorithm)), data_(std::move(data)), date_(std::move(date)) {
  if (!IsValidAlgorithmToken(algorithm_)) {
    ThrowEncoding(errors::msg::kLabelBadAlgorithm, algorithm_);
  }
  if (!date_.empty() && !IsValidIsoDate(date_)) {
    ThrowEncoding(errors::msg::kLabelBadDate, date_);
  }
}

Label& Label::Add(std::string key, std::string value) {
  if (key.empty()) {
    ThrowEncoding(errors::msg::kLabelMalformedParam);
  }
  if (Get(key)) {
    ThrowEncoding(errors::msg::kLabelDuplicateParam, key);
  }
  params_.emplace_back(std::move(key), std::move(value));
  return *this;
}

std::optional<std::string> Label::Get(std::string_view key) const {
  for (const auto& [k, v] : params_) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

std::string Label::Body() const {
  std::string body(kLabelCategory);
  body.push_back('/');
  body.append(LabelTypeToken(type_));
  body.push_back('/');
  body.append(algorithm_);
  body.push_back(':');
  body.append(PercentEncode(data_));
  body.push_back(':');
  body.append(date_);
  body.push_back('#');
  bool first = true;
  for (const auto& [key, value] : params_) {
    if (!first) {
      body.push_back('&');
    }
    first = false;
    body.append(PercentEncode(key));
    body.push_back('=');
    body.append(PercentEncode(value));
  }
  return body;
}

std::string Label::Serialize() const {
  std::string body = Body();
  const char check = LuhnMod36CheckChar(body);
  body.push_back('|');
  body.push_back(check);
  return body;
}

Label Label::Parse(std::string_view text) {
  const size_t pipe = text.rfind('|');
  if (pipe == std::string_view::npos || pipe + 2 != text.size()) {
    ThrowEncoding(errors::msg::kLabelMissingCheck, text);
  }
  const std::string_view body = text.substr(0, pipe);
  if (ToUpperAscii(text[pipe + 1]) != LuhnMod36CheckChar(body)) {
    ThrowEncoding(errors::msg::kLabelBadCheck, text);
  }

  const size_t hash = body.find('#');
  if (hash == std::string_view::npos) {
    ThrowEncoding(errors::msg::kLabelMissingParams, text);
  }
  const auto head = Split(body.substr(0, hash), ':');
  if (head.size() != 3) {
    ThrowEncoding(errors::msg::kLabelMalformedHead, text);
  }
  const auto tokens = Split(head[0], '/');
  if (tokens.size() != 3) {
    ThrowEncoding(errors::msg::kLabelMalformedHead, text);
  }
  if (tokens[0] != kLabelCategory) {
    ThrowEncoding(errors::msg::kLabelUnknownCategory, text);
  }
  const auto type = ParseLabelType(tokens[1]);
  if (!type) {
    ThrowEncoding(errors::msg::kLabelUnknownType, text);
  }

  Label label(*type, std::string(tokens[2]), PercentDecode(head[1]), std::string(head[2]));
  const std::string_view params = body.substr(hash + 1);
  if (!params.empty()) {
    for (auto entry : Split(params, '&')) {
      const size_t eq = entry.find('=');
      if (eq == std::string_view::npos || entry.find('=', eq + 1) != std::string_view::npos) {
        ThrowEncoding(errors::msg::kLabelMalformedParam, text);
      }
      label.Add(PercentDecode(entry.substr(0, eq)), PercentDecode(entry.substr(eq + 1)));
    }
  }
  return label;
}

bool Label::operator==(const Label& other) const {
  if (type_ != other.type_ || algorithm_ != other.algorithm_ || data_ != other.data_ ||
      date_ != other.date_ || params_.size() != other.params_.size()) {
    return false;
  }
  for (const auto& [key, value] : params_) {
    auto theirs = other.Get(key);
    if (!theirs || *theirs != value) {
      return false;
    }
  }
  return true;
}

} // namespace core
} // namespace sf
