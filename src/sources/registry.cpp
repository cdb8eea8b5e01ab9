#include "sf/sources/registry.h"

#include "sf/error.h"
#include "sf/errors.h"

namespace sf::sources {

namespace {

[[noreturn]] void ThrowComposite() {
  throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument,
              std::string(errors::msg::kCompositeNotCollectable)};
}

} // namespace

void SourceRegistry::Register(std::unique_ptr<EntropySource> source) {
  if (!source) {
    throw Error{ErrorDomain::Validation, errors::entropy::kInvalidArgument, "Null entropy source"};
  }
  if (source->kind() == SourceKind::kComposite) {
    ThrowComposite();
  }
  std::lock_guard<std::mutex> guard(mutex_);
  slots_[static_cast<size_t>(source->kind())] = std::move(source);
}

EntropySource& SourceRegistry::Get(SourceKind kind) const {
  if (kind == SourceKind::kComposite) {
    ThrowComposite();
  }
  EntropySource* source = nullptr;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    source = slots_[static_cast<size_t>(kind)].get();
  }
  if (!source) {
    ThrowHardwareUnavailable(kind, errors::msg::kNoAdapterRegistered);
  }
  if (!source->Available()) {
    ThrowHardwareUnavailable(kind, source->name());
  }
  return *source;
}

bool SourceRegistry::Contains(SourceKind kind) const {
  if (kind == SourceKind::kComposite) {
    return false;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  return slots_[static_cast<size_t>(kind)] != nullptr;
}

std::vector<SourceKind> SourceRegistry::AvailableKinds() const {
  std::vector<SourceKind> kinds;
  std::lock_guard<std::mutex> guard(mutex_);
  for (size_t i = 0; i < kSlots; ++i) {
    if (slots_[i] && slots_[i]->Available()) {
      kinds.push_back(static_cast<SourceKind>(i));
    }
  }
  return kinds;
}

} // namespace sf::sources
