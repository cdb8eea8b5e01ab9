#include "sf/sources/source.h"

#include "sf/error.h"
#include "sf/errors.h"
#include "sf/orchestrator/event_bus.h"

namespace sf::sources {

std::string_view SourceKindName(SourceKind kind) noexcept {
  switch (kind) {
  case SourceKind::kHardwareChallenge:
    return "hardware_challenge";
  case SourceKind::kDice:
    return "dice";
  case SourceKind::kHardwareNoise:
    return "hardware_noise";
  case SourceKind::kSystemRng:
    return "system_rng";
  case SourceKind::kComposite:
    return "composite";
  }
  return "unknown";
}

std::string_view SourceAlgorithmToken(SourceKind kind) noexcept {
  switch (kind) {
  case SourceKind::kHardwareChallenge:
    return "YUBIKEY-HMAC";
  case SourceKind::kDice:
    return "DICE";
  case SourceKind::kHardwareNoise:
    return "INFNOISE";
  case SourceKind::kSystemRng:
    return "SYSRNG";
  case SourceKind::kComposite:
    return "SHAKE256-XOR";
  }
  return "UNKNOWN";
}

std::optional<SourceKind> ParseSourceKind(std::string_view name) noexcept {
  for (auto kind : kAllSourceKinds) {
    if (SourceKindName(kind) == name || SourceAlgorithmToken(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

void ThrowCollectionAborted(SourceKind kind, uint64_t collected_bits) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "collection_aborted";
  event.message = "Entropy collection cancelled";
  event.fields.emplace_back("source", std::string(SourceKindName(kind)));
  event.fields.emplace_back("discarded_bits", std::to_string(collected_bits),
                            orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(event);

  throw Error{ErrorDomain::State, errors::entropy::kCollectionAborted,
              std::string(errors::msg::kCollectionAborted), std::nullopt, Retryability::kFatal,
              {ContextEntry("source", SourceKindName(kind)),
               ContextEntry("discarded_bits", collected_bits)}};
}

void ThrowHardwareUnavailable(SourceKind kind, std::string_view detail) {
  std::string message(errors::msg::kHardwareUnavailable);
  if (!detail.empty()) {
    message.append(": ");
    message.append(detail);
  }
  throw Error{ErrorDomain::Dependency, errors::entropy::kHardwareUnavailable, std::move(message),
              std::nullopt, Retryability::kFatal, {ContextEntry("source", SourceKindName(kind))}};
}

void RequirePositiveTarget(uint64_t target_bits) {
  if (target_bits == 0) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                std::string(errors::msg::kInvalidTargetBits)};
  }
}

} // namespace sf::sources
