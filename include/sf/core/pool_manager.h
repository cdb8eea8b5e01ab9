#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sf/core/pool_repository.h"
#include "sf/orchestrator/event_bus.h"

namespace sf::core {

struct ClaimPolicy {
  uint64_t min_entropy_bits{0};
  // Unset skips the quality gate entirely.
  std::optional<QualityTier> min_quality;
  bool allow_expired{false};
  bool allow_quality_override{false};
};

// Raw material for a new pool; the manager assigns id, expiry and label.
struct PoolDraft {
  sources::SourceKind kind{sources::SourceKind::kSystemRng};
  security::SecureBuffer<uint8_t> bytes;
  uint64_t entropy_bits{0};
  std::optional<QualityMetrics> quality; // computed when absent
  // Caps the stored tier; a composite is no better than its weakest input.
  std::optional<QualityTier> quality_ceiling;
  std::vector<std::string> lineage;
  sources::DeviceInfo device_info;
  TimePoint created_at{};
};

struct PoolManagerOptions {
  std::chrono::days ttl{90};
  QualityTier flag_below{QualityTier::kGood}; // pools under this tier are flagged
};

class PoolLifecycleManager {
public:
  using Consumer = std::function<void(const EntropyPool&)>;
  using BatchConsumer = std::function<void(const std::vector<PoolSnapshot>&)>;

  explicit PoolLifecycleManager(PoolRepository& repository, PoolManagerOptions options = {});

  // Validates (if needed), labels and persists the draft; publishes
  // pool_created and, for flagged pools, pool_quality_rejected.
  PoolSnapshot CreatePool(PoolDraft draft);

  static PoolState StateOf(const EntropyPool& pool, TimePoint now) noexcept;

  // Runs `consumer` on the pool and then marks it consumed. Exactly one of
  // any number of concurrent claims succeeds; the rest throw PoolConsumed.
  // A consumer exception leaves the pool Created. The consumer runs under the
  // claim lock and must not call back into this manager; events are published
  // after the lock is released.
  void Claim(const std::string& id, const ClaimPolicy& policy, TimePoint now, const Consumer& consumer);

  // All-or-nothing claim over several distinct pools.
  void ClaimAll(const std::vector<std::string>& ids, const ClaimPolicy& policy, TimePoint now,
                const BatchConsumer& consumer);

  PoolSnapshot Get(const std::string& id) const { return repository_.Get(id); }
  std::vector<PoolSnapshot> List(bool unconsumed_only) const { return repository_.List(unconsumed_only); }

  const PoolManagerOptions& options() const noexcept { return options_; }

private:
  struct OverrideUse {
    bool freshness{false};
    bool quality{false};
  };

  OverrideUse CheckClaimable(const EntropyPool& pool, const ClaimPolicy& policy, TimePoint now) const;
  void MarkConsumedOrThrow(const EntropyPool& pool, const OverrideUse& overrides,
                           std::vector<orchestrator::Event>& pending);

  PoolRepository& repository_;
  PoolManagerOptions options_;
  std::mutex claim_mutex_;
};

} // namespace sf::core
