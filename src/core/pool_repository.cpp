#include "sf/core/pool_repository.h"

#include <utility>

#include "sf/error.h"
#include "sf/errors.h"

namespace sf::core {

void ThrowPoolNotFound(const std::string& id) {
  throw Error{ErrorDomain::IO, errors::entropy::kPoolNotFound, std::string(errors::msg::kPoolNotFound),
              std::nullopt, Retryability::kFatal, {ContextEntry("pool_id", id)}};
}

std::string InMemoryPoolRepository::Create(EntropyPool pool) {
  if (pool.id.empty()) {
    pool.id = GeneratePoolId();
  }
  std::string id = pool.id;
  auto snapshot = std::make_shared<const EntropyPool>(std::move(pool));
  std::lock_guard<std::mutex> guard(mutex_);
  if (!pools_.emplace(id, std::move(snapshot)).second) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument, "Duplicate pool id",
                std::nullopt, Retryability::kFatal, {ContextEntry("pool_id", id)}};
  }
  return id;
}

PoolSnapshot InMemoryPoolRepository::Get(const std::string& id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = pools_.find(id);
  if (it == pools_.end()) {
    ThrowPoolNotFound(id);
  }
  return it->second;
}

bool InMemoryPoolRepository::MarkConsumed(const std::string& id) {
  PoolSnapshot released; // dropped after the lock so the wipe runs outside it
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = pools_.find(id);
  if (it == pools_.end()) {
    ThrowPoolNotFound(id);
  }
  if (it->second->consumed) {
    return false;
  }
  auto consumed = it->second->MetadataCopy();
  consumed.consumed = true;
  released = std::exchange(it->second, std::make_shared<const EntropyPool>(std::move(consumed)));
  return true;
}

std::vector<PoolSnapshot> InMemoryPoolRepository::List(bool unconsumed_only) const {
  std::vector<PoolSnapshot> out;
  std::lock_guard<std::mutex> guard(mutex_);
  out.reserve(pools_.size());
  for (const auto& [id, pool] : pools_) {
    if (!unconsumed_only || !pool->consumed) {
      out.push_back(pool);
    }
  }
  return out;
}

size_t InMemoryPoolRepository::size() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return pools_.size();
}

} // namespace sf::core
