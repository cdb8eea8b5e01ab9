#include "sf/orchestrator/entropy_service.h"

#include <algorithm>
#include <span>
#include <utility>

#include "sf/core/combiner.h"
#include "sf/crypto/provider.h"
#include "sf/orchestrator/event_bus.h"
#include "sf/sources/hardware_noise.h"
#include "sf/sources/system_rng.h"

namespace sf::orchestrator {

namespace {

constexpr uint64_t kMinValidationSampleBits = 32768;

// Runs `fn`, turning a thrown sf::Error into a failed Result.
template <class T, class Fn>
Result<T> Guarded(Fn&& fn) {
  try {
    return Result<T>(fn());
  } catch (const Error& error) {
    return Result<T>(error);
  }
}

} // namespace

ServiceOptions ServiceOptions::FromConfig(const RuntimeConfig& config) {
  ServiceOptions options;
  options.min_salt_bits = config.min_salt_bits;
  options.min_quality = config.min_quality;
  options.username_length = config.username_length;
  options.pool_ttl = std::chrono::days(config.pool_ttl_days);
  return options;
}

PoolHandle PoolHandle::FromPool(const core::EntropyPool& pool, TimePoint now) {
  PoolHandle handle;
  handle.id = pool.id;
  handle.kind = pool.kind;
  handle.state = core::PoolLifecycleManager::StateOf(pool, now);
  handle.size_bits = pool.size_bits;
  handle.entropy_bits = pool.entropy_bits;
  handle.quality = pool.quality;
  handle.quality_rejected = pool.quality_rejected;
  handle.created_at = pool.created_at;
  handle.expires_at = pool.expires_at;
  handle.lineage = pool.lineage;
  handle.device_info = pool.device_info;
  handle.label = pool.label.Serialize();
  return handle;
}

EntropyService::EntropyService(sources::SourceRegistry& registry, core::PoolRepository& repository,
                               ServiceOptions options)
    : registry_(registry),
      repository_(repository),
      options_(std::move(options)),
      manager_(repository, core::PoolManagerOptions{options_.pool_ttl, options_.min_quality}) {
  crypto::EnsureCryptoProviderInitialized();
}

TimePoint EntropyService::Now() const {
  return options_.clock ? options_.clock() : Clock::now();
}

core::ClaimPolicy EntropyService::DefaultSaltPolicy() const {
  core::ClaimPolicy policy;
  policy.min_entropy_bits = options_.min_salt_bits;
  policy.min_quality = options_.min_quality;
  return policy;
}

Result<PoolHandle> EntropyService::CollectEntropy(sources::SourceKind kind, uint64_t target_bits,
                                                  const sources::CancellationToken& cancel) {
  return Guarded<PoolHandle>([&] {
    auto& source = registry_.Get(kind);
    auto collected = source.Collect(target_bits, cancel);

    core::PoolDraft draft;
    draft.kind = kind;
    draft.entropy_bits = collected.actual_bits;
    draft.bytes = std::move(collected.bytes);
    draft.device_info = std::move(collected.device_info);
    draft.created_at = Now();
    auto pool = manager_.CreatePool(std::move(draft));
    return PoolHandle::FromPool(*pool, Now());
  });
}

Result<PoolHandle> EntropyService::CollectForSalt(sources::SourceKind kind, uint64_t salt_bits,
                                                  const sources::CancellationToken& cancel) {
  return CollectEntropy(kind, std::max(2 * salt_bits, kMinValidationSampleBits), cancel);
}

Result<PoolHandle> EntropyService::CombineAndValidate(const std::vector<std::string>& pool_ids,
                                                      bool allow_quality_override) {
  return Guarded<PoolHandle>([&] {
    const TimePoint now = Now();
    core::PoolDraft draft;
    draft.kind = sources::SourceKind::kComposite;
    draft.created_at = now;

    core::ClaimPolicy policy;
    policy.min_quality = options_.min_quality;
    policy.allow_quality_override = allow_quality_override;
    manager_.ClaimAll(pool_ids, policy, now, [&](const std::vector<core::PoolSnapshot>& pools) {
      std::vector<std::span<const uint8_t>> inputs;
      std::vector<uint64_t> claimed;
      inputs.reserve(pools.size());
      claimed.reserve(pools.size());
      core::QualityTier weakest = core::QualityTier::kExcellent;
      for (const auto& pool : pools) {
        inputs.push_back(pool->raw_bytes.AsSpan());
        claimed.push_back(pool->entropy_bits);
        draft.lineage.push_back(pool->id);
        const auto tier = pool->quality ? pool->quality->tier : core::QualityTier::kPoor;
        if (!core::MeetsQuality(tier, weakest)) {
          weakest = tier;
        }
      }
      draft.quality_ceiling = weakest;
      draft.bytes = core::CombineSources(inputs);
      draft.entropy_bits = core::CombinedEntropyBits(claimed);
    });

    auto pool = manager_.CreatePool(std::move(draft));

    Event event;
    event.category = EventCategory::kLifecycle;
    event.severity = EventSeverity::kInfo;
    event.event_id = "pools_combined";
    event.message = "Entropy pools combined";
    event.fields.emplace_back("pool_id", pool->id);
    event.fields.emplace_back("inputs", std::to_string(pool->lineage.size()), FieldPrivacy::kPublic, true);
    event.fields.emplace_back("algorithm", std::string(core::kCombinerAlgorithm));
    event.fields.emplace_back("version", std::to_string(core::kCombinerVersion), FieldPrivacy::kPublic, true);
    EventBus::Instance().Publish(event);
    return PoolHandle::FromPool(*pool, now);
  });
}

Result<core::SaltContext> EntropyService::InitializeSalt(const std::string& pool_id,
                                                         const core::ClaimPolicy& policy) {
  return Guarded<core::SaltContext>([&] {
    const TimePoint now = Now();
    std::shared_ptr<const core::DerivationSalt> salt;
    manager_.Claim(pool_id, policy, now, [&](const core::EntropyPool& pool) {
      salt = core::DerivationSalt::Derive(pool.raw_bytes.AsSpan(), pool.id, now);
    });

    Event event;
    event.category = EventCategory::kSecurity;
    event.severity = EventSeverity::kInfo;
    event.event_id = "salt_initialized";
    event.message = "Derivation salt initialized";
    event.fields.emplace_back("pool_id", pool_id);
    event.fields.emplace_back("label", salt->label().Serialize());
    EventBus::Instance().Publish(event);
    return core::SaltContext(std::move(salt));
  });
}

Result<core::DerivedIdentifier> EntropyService::DeriveIdentifier(const core::SaltContext& context,
                                                                 std::string_view domain, size_t length) {
  return Guarded<core::DerivedIdentifier>(
      [&] { return core::DeriveIdentifier(context, domain, length, Now()); });
}

Result<std::string> EntropyService::DeriveUsername(const core::SaltContext& context, std::string_view domain,
                                                   size_t length) {
  return Guarded<std::string>([&] { return core::DeriveIdentifier(context, domain, length, Now()).value; });
}

bool EntropyService::VerifyUsername(std::string_view domain, std::string_view candidate,
                                    const core::SaltContext& context) const {
  if (!context.valid()) {
    return false;
  }
  return core::VerifyIdentifier(context, domain, candidate);
}

Result<PoolHandle> EntropyService::GetPool(const std::string& pool_id) const {
  return Guarded<PoolHandle>([&] { return PoolHandle::FromPool(*repository_.Get(pool_id), Now()); });
}

std::vector<PoolHandle> EntropyService::ListPools(bool unconsumed_only) const {
  const TimePoint now = Now();
  std::vector<PoolHandle> handles;
  for (const auto& pool : manager_.List(unconsumed_only)) {
    handles.push_back(PoolHandle::FromPool(*pool, now));
  }
  return handles;
}

void RegisterDefaultSources(sources::SourceRegistry& registry, const RuntimeConfig& config,
                            std::shared_ptr<sources::DiceRollReader> dice_reader) {
  registry.Register(std::make_unique<sources::SystemRngSource>());
  registry.Register(std::make_unique<sources::HardwareNoiseSource>(
      std::make_shared<sources::FileNoiseDevice>(config.noise_device)));
  if (dice_reader) {
    registry.Register(std::make_unique<sources::DiceSource>(std::move(dice_reader), config.dice_per_roll));
  }
}

} // namespace sf::orchestrator
