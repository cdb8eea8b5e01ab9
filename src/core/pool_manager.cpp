#include "sf/core/pool_manager.h"

#include <algorithm>
#include <set>

#include "sf/core/combiner.h"
#include "sf/error.h"
#include "sf/errors.h"
#include "sf/orchestrator/event_bus.h"

namespace sf::core {

namespace {

using orchestrator::Event;
using orchestrator::EventBus;
using orchestrator::EventCategory;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

Event PoolEvent(const EntropyPool& pool, std::string event_id, EventSeverity severity,
                std::string message) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields.emplace_back("pool_id", pool.id);
  event.fields.emplace_back("source", std::string(sources::SourceKindName(pool.kind)));
  return event;
}

std::vector<std::string> PoolContext(const EntropyPool& pool) {
  return {ContextEntry("pool_id", pool.id)};
}

void PublishAll(const std::vector<Event>& events) {
  for (const auto& event : events) {
    EventBus::Instance().Publish(event);
  }
}

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined.append(id);
  }
  return joined;
}

} // namespace

PoolLifecycleManager::PoolLifecycleManager(PoolRepository& repository, PoolManagerOptions options)
    : repository_(repository), options_(options) {}

PoolState PoolLifecycleManager::StateOf(const EntropyPool& pool, TimePoint now) noexcept {
  if (pool.consumed) {
    return PoolState::kConsumed;
  }
  if (now >= pool.expires_at) {
    return PoolState::kExpired;
  }
  return PoolState::kCreated;
}

PoolSnapshot PoolLifecycleManager::CreatePool(PoolDraft draft) {
  if (draft.bytes.empty()) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                "Cannot create an entropy pool without bytes"};
  }
  EntropyPool pool;
  pool.id = GeneratePoolId();
  pool.kind = draft.kind;
  pool.size_bits = static_cast<uint64_t>(draft.bytes.size()) * 8;
  pool.entropy_bits = std::min(draft.entropy_bits == 0 ? pool.size_bits : draft.entropy_bits, pool.size_bits);
  pool.created_at = draft.created_at == TimePoint{} ? Clock::now() : draft.created_at;
  pool.expires_at = pool.created_at + options_.ttl;
  pool.quality = draft.quality ? *draft.quality : ValidateEntropy(draft.bytes.AsSpan());
  if (draft.quality_ceiling && !MeetsQuality(*draft.quality_ceiling, pool.quality->tier)) {
    pool.quality->tier = *draft.quality_ceiling;
  }
  pool.quality_rejected = !MeetsQuality(pool.quality->tier, options_.flag_below);
  pool.lineage = std::move(draft.lineage);
  pool.device_info = std::move(draft.device_info);
  pool.raw_bytes = std::move(draft.bytes);

  const bool composite = pool.kind == sources::SourceKind::kComposite;
  pool.label = Label(LabelType::kEntropy, std::string(sources::SourceAlgorithmToken(pool.kind)), pool.id,
                     FormatIsoDate(pool.created_at));
  pool.label.Add("VERSION", composite ? kCombinerVersion : 1)
      .Add("BITS", pool.size_bits)
      .Add("ENTROPY", pool.entropy_bits)
      .Add("QUALITY", std::string(QualityTierName(pool.quality->tier)));
  if (!pool.lineage.empty()) {
    pool.label.Add("INPUTS", JoinIds(pool.lineage));
  }

  const std::string id = repository_.Create(std::move(pool));
  auto stored = repository_.Get(id);

  auto created = PoolEvent(*stored, "pool_created", EventSeverity::kInfo, "Entropy pool created");
  created.fields.emplace_back("size_bits", std::to_string(stored->size_bits), FieldPrivacy::kPublic, true);
  created.fields.emplace_back("quality", std::string(QualityTierName(stored->quality->tier)));
  created.fields.emplace_back("label", stored->label.Serialize());
  EventBus::Instance().Publish(created);

  if (stored->quality_rejected) {
    auto rejected = PoolEvent(*stored, "pool_quality_rejected", EventSeverity::kWarning,
                              "Entropy pool below quality threshold; stored flagged");
    rejected.category = EventCategory::kSecurity;
    rejected.fields.emplace_back("quality", std::string(QualityTierName(stored->quality->tier)));
    rejected.fields.emplace_back("threshold", std::string(QualityTierName(options_.flag_below)));
    EventBus::Instance().Publish(rejected);
  }
  return stored;
}

PoolLifecycleManager::OverrideUse PoolLifecycleManager::CheckClaimable(const EntropyPool& pool,
                                                                     const ClaimPolicy& policy,
                                                                     TimePoint now) const {
  OverrideUse used;
  if (pool.consumed) {
    throw Error{ErrorDomain::State, errors::entropy::kPoolConsumed, std::string(errors::msg::kPoolConsumed),
                std::nullopt, Retryability::kFatal, PoolContext(pool)};
  }
  if (StateOf(pool, now) == PoolState::kExpired) {
    if (!policy.allow_expired) {
      throw Error{ErrorDomain::State, errors::entropy::kPoolExpired, std::string(errors::msg::kPoolExpired),
                  std::nullopt, Retryability::kFatal,
                  {ContextEntry("pool_id", pool.id), ContextEntry("expires_at", FormatIsoDate(pool.expires_at))}};
    }
    used.freshness = true;
  }
  if (pool.entropy_bits < policy.min_entropy_bits) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInsufficientEntropy,
                std::string(errors::msg::kInsufficientEntropy), std::nullopt, Retryability::kFatal,
                {ContextEntry("pool_id", pool.id), ContextEntry("required_bits", policy.min_entropy_bits),
                 ContextEntry("actual_bits", pool.entropy_bits)}};
  }
  if (policy.min_quality) {
    const QualityTier tier = pool.quality ? pool.quality->tier : QualityTier::kPoor;
    if (pool.quality_rejected || !MeetsQuality(tier, *policy.min_quality)) {
      if (!policy.allow_quality_override) {
        throw Error{ErrorDomain::Security, errors::entropy::kQualityRejected,
                    std::string(errors::msg::kQualityRejected), std::nullopt, Retryability::kFatal,
                    {ContextEntry("pool_id", pool.id), ContextEntry("quality", QualityTierName(tier)),
                     ContextEntry("required_quality", QualityTierName(*policy.min_quality))}};
      }
      used.quality = true;
    }
  }
  return used;
}

void PoolLifecycleManager::MarkConsumedOrThrow(const EntropyPool& pool, const OverrideUse& overrides,
                                               std::vector<Event>& pending) {
  if (!repository_.MarkConsumed(pool.id)) {
    throw Error{ErrorDomain::State, errors::entropy::kPoolConsumed, std::string(errors::msg::kPoolConsumed),
                std::nullopt, Retryability::kFatal, PoolContext(pool)};
  }
  if (overrides.freshness) {
    auto event = PoolEvent(pool, "freshness_override_used", EventSeverity::kWarning,
                           "Expired pool consumed under freshness override");
    event.category = EventCategory::kSecurity;
    event.fields.emplace_back("expires_at", FormatIsoDate(pool.expires_at));
    pending.push_back(std::move(event));
  }
  if (overrides.quality) {
    auto event = PoolEvent(pool, "quality_override_used", EventSeverity::kWarning,
                           "Low-quality pool consumed under quality override");
    event.category = EventCategory::kSecurity;
    event.fields.emplace_back("quality",
                              std::string(QualityTierName(pool.quality ? pool.quality->tier : QualityTier::kPoor)));
    pending.push_back(std::move(event));
  }
  pending.push_back(PoolEvent(pool, "pool_consumed", EventSeverity::kInfo, "Entropy pool consumed"));
}

void PoolLifecycleManager::Claim(const std::string& id, const ClaimPolicy& policy, TimePoint now,
                                 const Consumer& consumer) {
  std::vector<Event> pending;
  {
    std::lock_guard<std::mutex> guard(claim_mutex_);
    auto pool = repository_.Get(id);
    const auto overrides = CheckClaimable(*pool, policy, now);
    consumer(*pool);
    MarkConsumedOrThrow(*pool, overrides, pending);
  }
  PublishAll(pending);
}

void PoolLifecycleManager::ClaimAll(const std::vector<std::string>& ids, const ClaimPolicy& policy,
                                    TimePoint now, const BatchConsumer& consumer) {
  if (ids.empty()) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                std::string(errors::msg::kEmptyCombineInput)};
  }
  std::set<std::string> seen;
  for (const auto& id : ids) {
    if (!seen.insert(id).second) {
      throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
                  std::string(errors::msg::kDuplicatePoolInput), std::nullopt, Retryability::kFatal,
                  {ContextEntry("pool_id", id)}};
    }
  }

  std::vector<Event> pending;
  {
    std::lock_guard<std::mutex> guard(claim_mutex_);
    std::vector<PoolSnapshot> pools;
    std::vector<OverrideUse> overrides;
    pools.reserve(ids.size());
    overrides.reserve(ids.size());
    for (const auto& id : ids) {
      pools.push_back(repository_.Get(id));
      overrides.push_back(CheckClaimable(*pools.back(), policy, now));
    }
    consumer(pools);
    for (size_t i = 0; i < pools.size(); ++i) {
      MarkConsumedOrThrow(*pools[i], overrides[i], pending);
    }
  }
  PublishAll(pending);
}

} // namespace sf::core
