#include "sf/core/pool_manager.h"
#include "sf/crypto/random.h"
#include "sf/error.h"
#include "sf/orchestrator/event_bus.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using sf::core::ClaimPolicy;
using sf::core::PoolDraft;
using sf::core::PoolLifecycleManager;
using sf::core::PoolState;
using sf::core::QualityTier;

const sf::TimePoint kCreated = std::chrono::sys_days{std::chrono::year{2026} / 10 / 19};

// Collects event ids published on the process bus.
class EventRecorder {
public:
  EventRecorder() {
    sf::orchestrator::ResetEventBusForTesting();
    auto state = state_;
    sf::orchestrator::EventBus::Instance().Subscribe([state](const sf::orchestrator::Event& event) {
      std::lock_guard<std::mutex> guard(state->mutex);
      state->ids.push_back(event.event_id);
    });
  }
  ~EventRecorder() { sf::orchestrator::ResetEventBusForTesting(); }

  size_t Count(const std::string& id) const {
    std::lock_guard<std::mutex> guard(state_->mutex);
    return static_cast<size_t>(std::count(state_->ids.begin(), state_->ids.end(), id));
  }

private:
  struct State {
    std::mutex mutex;
    std::vector<std::string> ids;
  };
  std::shared_ptr<State> state_ = std::make_shared<State>();
};

PoolDraft Draft(size_t bytes, QualityTier tier) {
  PoolDraft draft;
  draft.kind = sf::sources::SourceKind::kSystemRng;
  draft.bytes = sf::security::SecureBuffer<uint8_t>(bytes);
  sf::crypto::SystemRandomBytes(draft.bytes.AsSpan());
  sf::core::QualityMetrics metrics;
  metrics.sample_bytes = bytes;
  metrics.tier = tier;
  draft.quality = metrics;
  draft.created_at = kCreated;
  return draft;
}

sf::ErrorKind KindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const sf::Error& err) {
    return sf::ClassifyError(err);
  }
  return sf::ErrorKind::kNone;
}

void TestCreatePoolLabelsAndFlags() {
  EventRecorder events;
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);

  auto good = manager.CreatePool(Draft(64, QualityTier::kExcellent));
  assert(good->id.rfind("pool-", 0) == 0 && good->id.size() == 37 && "pool id format");
  assert(good->size_bits == 512 && good->entropy_bits == 512 && "size defaults the claim");
  assert(good->expires_at == kCreated + std::chrono::days(90) && "default ttl is 90 days");
  assert(!good->quality_rejected && "excellent pool is not flagged");
  assert(good->label.Serialize().rfind("Saltforge/ENTROPY/SYSRNG:" + good->id + ":2026-10-19#", 0) == 0 &&
         "entropy label head");
  assert(good->label.Get("QUALITY") == std::optional<std::string>("EXCELLENT") && "quality param");
  assert(sf::core::Label::Parse(good->label.Serialize()) == good->label && "label parses back");
  assert(events.Count("pool_created") == 1 && "creation published");

  auto fair = manager.CreatePool(Draft(64, QualityTier::kFair));
  assert(fair->quality_rejected && "fair pool is flagged");
  assert(events.Count("pool_quality_rejected") == 1 && "flag published");

  auto measured = Draft(4096, QualityTier::kPoor);
  measured.quality.reset();
  auto validated = manager.CreatePool(std::move(measured));
  assert(validated->quality && validated->quality->sample_bytes == 4096 && "quality computed when absent");

  assert(KindOf([&] { (void)manager.CreatePool(PoolDraft{}); }) == sf::ErrorKind::kInvalidArgument &&
         "empty draft rejected");
  assert(repo.size() == 3 && "three pools stored");
}

void TestStates() {
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo, sf::core::PoolManagerOptions{std::chrono::days(1), QualityTier::kGood});
  auto pool = manager.CreatePool(Draft(32, QualityTier::kGood));
  assert(PoolLifecycleManager::StateOf(*pool, kCreated) == PoolState::kCreated && "fresh pool");
  assert(PoolLifecycleManager::StateOf(*pool, kCreated + std::chrono::hours(24)) == PoolState::kExpired &&
         "expired at the boundary");

  manager.Claim(pool->id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {});
  auto consumed = manager.Get(pool->id);
  assert(PoolLifecycleManager::StateOf(*consumed, kCreated + std::chrono::hours(48)) == PoolState::kConsumed &&
         "consumed wins over expired");
  assert(sf::core::PoolStateName(PoolState::kExpired) == "expired" && "state name");
}

void TestClaimConsumesOnce() {
  EventRecorder events;
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  auto pool = manager.CreatePool(Draft(32, QualityTier::kGood));

  size_t seen = 0;
  manager.Claim(pool->id, ClaimPolicy{}, kCreated, [&](const sf::core::EntropyPool& claimed) {
    seen = claimed.raw_bytes.size();
  });
  assert(seen == 32 && "consumer sees the raw bytes");
  auto after = repo.Get(pool->id);
  assert(after->consumed && "pool marked consumed");
  assert(after->raw_bytes.empty() && "raw bytes released on consumption");
  assert(after->label == pool->label && "metadata survives consumption");
  assert(events.Count("pool_consumed") == 1 && "consumption published");

  assert(KindOf([&] { manager.Claim(pool->id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {}); }) ==
             sf::ErrorKind::kPoolConsumed &&
         "second claim fails");
  assert(KindOf([&] { manager.Claim("pool-missing", ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {}); }) ==
             sf::ErrorKind::kPoolNotFound &&
         "unknown pool");
}

void TestFailedConsumerLeavesPoolUsable() {
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  auto pool = manager.CreatePool(Draft(32, QualityTier::kGood));
  assert(KindOf([&] {
           manager.Claim(pool->id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {
             throw sf::Error{sf::ErrorDomain::Validation, sf::errors::entropy::kEncoding, "consumer failed"};
           });
         }) == sf::ErrorKind::kEncoding &&
         "consumer error propagates");
  assert(!repo.Get(pool->id)->consumed && "pool remains unconsumed");
}

void TestClaimCheckOrderAndOverrides() {
  EventRecorder events;
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo, sf::core::PoolManagerOptions{std::chrono::days(1), QualityTier::kGood});
  auto pool = manager.CreatePool(Draft(16, QualityTier::kFair));
  const auto late = kCreated + std::chrono::days(2);
  auto noop = [](const sf::core::EntropyPool&) {};

  ClaimPolicy policy;
  policy.min_entropy_bits = 256;
  policy.min_quality = QualityTier::kGood;
  assert(KindOf([&] { manager.Claim(pool->id, policy, late, noop); }) == sf::ErrorKind::kPoolExpired &&
         "freshness is checked before size");
  policy.allow_expired = true;
  assert(KindOf([&] { manager.Claim(pool->id, policy, late, noop); }) == sf::ErrorKind::kInsufficientEntropy &&
         "size is checked before quality");
  policy.min_entropy_bits = 128;
  assert(KindOf([&] { manager.Claim(pool->id, policy, late, noop); }) == sf::ErrorKind::kQualityRejected &&
         "flagged pool fails the quality gate");
  assert(!repo.Get(pool->id)->consumed && "failed checks consume nothing");

  policy.allow_quality_override = true;
  manager.Claim(pool->id, policy, late, noop);
  assert(events.Count("freshness_override_used") == 1 && "freshness override recorded");
  assert(events.Count("quality_override_used") == 1 && "quality override recorded");
  assert(KindOf([&] { manager.Claim(pool->id, policy, late, noop); }) == sf::ErrorKind::kPoolConsumed &&
         "consumption is checked first");

  auto unchecked = manager.CreatePool(Draft(16, QualityTier::kPoor));
  manager.Claim(unchecked->id, ClaimPolicy{}, kCreated, noop);
  assert(events.Count("quality_override_used") == 1 && "no quality gate without a minimum");
}

void TestConcurrentClaimHasOneWinner() {
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  auto pool = manager.CreatePool(Draft(64, QualityTier::kGood));

  constexpr int kThreads = 16;
  std::atomic<int> winners{0};
  std::atomic<int> consumed_errors{0};
  std::atomic<int> consumer_runs{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        manager.Claim(pool->id, ClaimPolicy{}, kCreated,
                      [&](const sf::core::EntropyPool&) { consumer_runs.fetch_add(1); });
        winners.fetch_add(1);
      } catch (const sf::Error& err) {
        if (sf::ClassifyError(err) == sf::ErrorKind::kPoolConsumed) {
          consumed_errors.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(winners.load() == 1 && "exactly one claim succeeds");
  assert(consumer_runs.load() == 1 && "pool bytes handed out once");
  assert(consumed_errors.load() == kThreads - 1 && "every other claim sees PoolConsumed");
}

void TestClaimAllIsAtomic() {
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  auto a = manager.CreatePool(Draft(32, QualityTier::kGood));
  auto b = manager.CreatePool(Draft(32, QualityTier::kGood));
  auto c = manager.CreatePool(Draft(32, QualityTier::kGood));
  manager.Claim(c->id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {});
  auto noop = [](const std::vector<sf::core::PoolSnapshot>&) {};

  assert(KindOf([&] { manager.ClaimAll({a->id, b->id, c->id}, ClaimPolicy{}, kCreated, noop); }) ==
             sf::ErrorKind::kPoolConsumed &&
         "one consumed input fails the batch");
  assert(!repo.Get(a->id)->consumed && !repo.Get(b->id)->consumed && "no partial consumption");

  assert(KindOf([&] { manager.ClaimAll({a->id, a->id}, ClaimPolicy{}, kCreated, noop); }) ==
             sf::ErrorKind::kInvalidArgument &&
         "duplicate inputs rejected");
  assert(KindOf([&] { manager.ClaimAll({}, ClaimPolicy{}, kCreated, noop); }) == sf::ErrorKind::kInvalidArgument &&
         "empty batch rejected");

  size_t batch = 0;
  manager.ClaimAll({a->id, b->id}, ClaimPolicy{}, kCreated,
                   [&](const std::vector<sf::core::PoolSnapshot>& pools) { batch = pools.size(); });
  assert(batch == 2 && "consumer sees every input");
  assert(repo.Get(a->id)->consumed && repo.Get(b->id)->consumed && "batch consumed together");
  assert(manager.List(true).empty() && "nothing left unconsumed");
  assert(manager.List(false).size() == 3 && "consumed pools stay listed");
}

void TestSubscriberMayClaimFromCallback() {
  sf::orchestrator::ResetEventBusForTesting();
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  const auto first = manager.CreatePool(Draft(64, QualityTier::kGood));
  const auto second = manager.CreatePool(Draft(64, QualityTier::kGood));

  auto nested_claimed = std::make_shared<bool>(false);
  PoolLifecycleManager* target = &manager;
  const std::string first_id = first->id;
  const std::string second_id = second->id;
  sf::orchestrator::EventBus::Instance().Subscribe(
      [target, first_id, second_id, nested_claimed](const sf::orchestrator::Event& event) {
        if (event.event_id != "pool_consumed" || event.fields.empty() || event.fields[0].value != first_id) {
          return;
        }
        target->Claim(second_id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {});
        *nested_claimed = true;
      });

  manager.Claim(first_id, ClaimPolicy{}, kCreated, [](const sf::core::EntropyPool&) {});
  assert(*nested_claimed && "claim lock released before events are delivered");
  assert(manager.Get(second_id)->consumed && "nested claim consumed the second pool");
  sf::orchestrator::ResetEventBusForTesting();
}

void TestQualityCeilingCapsTier() {
  sf::core::InMemoryPoolRepository repo;
  PoolLifecycleManager manager(repo);
  auto capped = Draft(64, QualityTier::kExcellent);
  capped.quality_ceiling = QualityTier::kFair;
  const auto pool = manager.CreatePool(std::move(capped));
  assert(pool->quality->tier == QualityTier::kFair && "tier lowered to the ceiling");
  assert(pool->quality_rejected && "capped pool flagged below GOOD");

  auto loose = Draft(64, QualityTier::kGood);
  loose.quality_ceiling = QualityTier::kExcellent;
  const auto unchanged = manager.CreatePool(std::move(loose));
  assert(unchanged->quality->tier == QualityTier::kGood && "ceiling never raises the tier");
  assert(!unchanged->quality_rejected && "good pool stays unflagged");
}

void TestRepositoryRejectsDuplicateIds() {
  sf::core::InMemoryPoolRepository repo;
  sf::core::EntropyPool first;
  first.id = "pool-fixed";
  repo.Create(std::move(first));
  sf::core::EntropyPool second;
  second.id = "pool-fixed";
  assert(KindOf([&] { repo.Create(std::move(second)); }) == sf::ErrorKind::kInvalidArgument &&
         "duplicate id rejected");
  assert(repo.MarkConsumed("pool-fixed") && "first mark wins");
  assert(!repo.MarkConsumed("pool-fixed") && "second mark loses");
  assert(KindOf([&] { (void)repo.MarkConsumed("pool-other"); }) == sf::ErrorKind::kPoolNotFound &&
         "unknown id");
}

} // namespace

int main() {
  TestCreatePoolLabelsAndFlags();
  TestStates();
  TestClaimConsumesOnce();
  TestFailedConsumerLeavesPoolUsable();
  TestClaimCheckOrderAndOverrides();
  TestConcurrentClaimHasOneWinner();
  TestClaimAllIsAtomic();
  TestSubscriberMayClaimFromCallback();
  TestQualityCeilingCapsTier();
  TestRepositoryRejectsDuplicateIds();
  std::cout << "test_pool_manager completed" << std::endl;
  return 0;
}
