#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <vector>

#include "sf/sources/source.h"

namespace sf::sources {

// One adapter slot per collectable SourceKind. Composite pools come from the
// combiner and cannot be registered.
class SourceRegistry {
public:
  // Replaces any adapter already registered for the same kind.
  void Register(std::unique_ptr<EntropySource> source);

  // Throws HardwareUnavailable when no adapter is registered or it reports
  // unavailable; InvalidArgument for kComposite.
  EntropySource& Get(SourceKind kind) const;

  bool Contains(SourceKind kind) const;
  std::vector<SourceKind> AvailableKinds() const;

private:
  static constexpr size_t kSlots = static_cast<size_t>(SourceKind::kComposite);

  mutable std::mutex mutex_;
  std::array<std::unique_ptr<EntropySource>, kSlots> slots_{};
};

} // namespace sf::sources
