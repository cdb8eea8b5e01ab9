#include "sf/error.h"

#include <string>

namespace sf {

ErrorKind ClassifyError(const Error& error) noexcept {
  namespace e = errors::entropy;
  // native errno values and codes filed under the wrong domain are not kinds
  if (!IsFrameworkErrorCode(error.domain, error.code)) {
    return ErrorKind::kOther;
  }
  switch (error.code) {
  case e::kHardwareUnavailable:
    return ErrorKind::kHardwareUnavailable;
  case e::kCollectionAborted:
    return ErrorKind::kCollectionAborted;
  case e::kInsufficientEntropy:
    return ErrorKind::kInsufficientEntropy;
  case e::kQualityRejected:
    return ErrorKind::kQualityRejected;
  case e::kPoolConsumed:
    return ErrorKind::kPoolConsumed;
  case e::kPoolExpired:
    return ErrorKind::kPoolExpired;
  case e::kEncoding:
    return ErrorKind::kEncoding;
  case e::kPoolNotFound:
    return ErrorKind::kPoolNotFound;
  case e::kInvalidArgument:
    return ErrorKind::kInvalidArgument;
  default:
    return ErrorKind::kOther;
  }
}

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::kNone:
    return "None";
  case ErrorKind::kHardwareUnavailable:
    return "HardwareUnavailable";
  case ErrorKind::kCollectionAborted:
    return "CollectionAborted";
  case ErrorKind::kInsufficientEntropy:
    return "InsufficientEntropy";
  case ErrorKind::kQualityRejected:
    return "QualityRejected";
  case ErrorKind::kPoolConsumed:
    return "PoolConsumedError";
  case ErrorKind::kPoolExpired:
    return "PoolExpiredError";
  case ErrorKind::kEncoding:
    return "EncodingError";
  case ErrorKind::kPoolNotFound:
    return "PoolNotFound";
  case ErrorKind::kInvalidArgument:
    return "InvalidArgument";
  case ErrorKind::kOther:
    return "Other";
  }
  return "Other";
}

std::optional<std::string> ContextValue(const Error& error, std::string_view key) {
  for (const auto& entry : error.context) {
    const auto eq = entry.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    if (std::string_view(entry).substr(0, eq) == key) {
      return entry.substr(eq + 1);
    }
  }
  return std::nullopt;
}

std::string ContextEntry(std::string_view key, std::string_view value) {
  std::string entry(key);
  entry.push_back('=');
  entry.append(value);
  return entry;
}

std::string ContextEntry(std::string_view key, std::uint64_t value) {
  return ContextEntry(key, std::to_string(value));
}

} // namespace sf
