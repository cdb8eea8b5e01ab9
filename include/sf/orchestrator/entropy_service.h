#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "sf/common.h"
#include "sf/core/derivation.h"
#include "sf/core/pool_manager.h"
#include "sf/orchestrator/config.h"
#include "sf/result.h"
#include "sf/sources/dice.h"
#include "sf/sources/registry.h"

namespace sf::orchestrator {

struct ServiceOptions {
  uint64_t min_salt_bits{256};
  core::QualityTier min_quality{core::QualityTier::kGood};
  size_t username_length{16};
  std::chrono::days pool_ttl{90};
  std::function<TimePoint()> clock; // defaults to the system clock

  static ServiceOptions FromConfig(const RuntimeConfig& config);
};

// Non-secret view of a stored pool.
struct PoolHandle {
  std::string id;
  sources::SourceKind kind{sources::SourceKind::kSystemRng};
  core::PoolState state{core::PoolState::kCreated};
  uint64_t size_bits{0};
  uint64_t entropy_bits{0};
  std::optional<core::QualityMetrics> quality;
  bool quality_rejected{false};
  TimePoint created_at{};
  TimePoint expires_at{};
  std::vector<std::string> lineage;
  sources::DeviceInfo device_info;
  std::string label;

  static PoolHandle FromPool(const core::EntropyPool& pool, TimePoint now);
};

// Core-facing operations. Every failure comes back as a Result carrying the
// sf::Error; nothing here prints or touches storage except through the
// repository collaborator.
class EntropyService {
public:
  EntropyService(sources::SourceRegistry& registry, core::PoolRepository& repository,
                 ServiceOptions options = {});

  Result<PoolHandle> CollectEntropy(sources::SourceKind kind, uint64_t target_bits,
                                    const sources::CancellationToken& cancel);
  // Requests max(2 * salt_bits, 32768) bits; below 4 KiB the measured Shannon
  // entropy of a uniform source falls short of the GOOD threshold.
  Result<PoolHandle> CollectForSalt(sources::SourceKind kind, uint64_t salt_bits,
                                    const sources::CancellationToken& cancel);
  // Claims every input (all or none) and stores the combination as a new pool.
  // Flagged or below-minimum inputs are refused unless `allow_quality_override`
  // is set (each use publishes quality_override_used); the composite's tier is
  // capped at its weakest input's.
  Result<PoolHandle> CombineAndValidate(const std::vector<std::string>& pool_ids,
                                        bool allow_quality_override = false);

  Result<core::SaltContext> InitializeSalt(const std::string& pool_id, const core::ClaimPolicy& policy);
  Result<core::SaltContext> InitializeSalt(const std::string& pool_id) {
    return InitializeSalt(pool_id, DefaultSaltPolicy());
  }

  Result<std::string> DeriveUsername(const core::SaltContext& context, std::string_view domain,
                                     size_t length);
  Result<std::string> DeriveUsername(const core::SaltContext& context, std::string_view domain) {
    return DeriveUsername(context, domain, options_.username_length);
  }
  Result<core::DerivedIdentifier> DeriveIdentifier(const core::SaltContext& context, std::string_view domain,
                                                   size_t length);
  bool VerifyUsername(std::string_view domain, std::string_view candidate,
                      const core::SaltContext& context) const;

  Result<PoolHandle> GetPool(const std::string& pool_id) const;
  std::vector<PoolHandle> ListPools(bool unconsumed_only) const;

  core::ClaimPolicy DefaultSaltPolicy() const;
  const ServiceOptions& options() const noexcept { return options_; }

private:
  TimePoint Now() const;

  sources::SourceRegistry& registry_;
  core::PoolRepository& repository_;
  ServiceOptions options_;
  core::PoolLifecycleManager manager_;
};

// System RNG, the configured noise device and, when a reader is supplied,
// dice read config.dice_per_roll at a time.
void RegisterDefaultSources(sources::SourceRegistry& registry, const RuntimeConfig& config,
                            std::shared_ptr<sources::DiceRollReader> dice_reader = nullptr);

} // namespace sf::orchestrator
