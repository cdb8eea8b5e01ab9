#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sf/core/pool.h"

namespace sf::core {

using PoolSnapshot = std::shared_ptr<const EntropyPool>;

// Storage collaborator for pools. Implementations must make MarkConsumed
// atomic: of several concurrent calls for one id, exactly one returns true.
class PoolRepository {
public:
  virtual ~PoolRepository() = default;

  virtual std::string Create(EntropyPool pool) = 0;
  // Throws PoolNotFound.
  virtual PoolSnapshot Get(const std::string& id) const = 0;
  // False when the pool was already consumed; throws PoolNotFound.
  virtual bool MarkConsumed(const std::string& id) = 0;
  virtual std::vector<PoolSnapshot> List(bool unconsumed_only) const = 0;
};

class InMemoryPoolRepository final : public PoolRepository {
public:
  std::string Create(EntropyPool pool) override;
  PoolSnapshot Get(const std::string& id) const override;
  bool MarkConsumed(const std::string& id) override;
  std::vector<PoolSnapshot> List(bool unconsumed_only) const override;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, PoolSnapshot> pools_; // ordered by id for stable listing
};

[[noreturn]] void ThrowPoolNotFound(const std::string& id);

} // namespace sf::core
