#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include "sf/error.h"

namespace sf {

// Value-or-error returned by the core-facing operations. Callers must check
// ok() before value(); value() on a failed result rethrows the stored Error.
template <class T>
class [[nodiscard]] Result {
  static_assert(!std::is_same_v<std::decay_t<T>, Error>, "Result<Error> is not meaningful");

public:
  Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
  Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool ok() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] ErrorKind kind() const noexcept {
    return ok() ? ErrorKind::kNone : ClassifyError(std::get<1>(state_));
  }

  T& value() & {
    if (!ok()) {
      throw std::get<1>(state_);
    }
    return std::get<0>(state_);
  }
  const T& value() const& {
    if (!ok()) {
      throw std::get<1>(state_);
    }
    return std::get<0>(state_);
  }
  T&& value() && {
    if (!ok()) {
      throw std::get<1>(state_);
    }
    return std::get<0>(std::move(state_));
  }

  // Only valid when !ok().
  const Error& error() const { return std::get<1>(state_); }

private:
  std::variant<T, Error> state_;
};

} // namespace sf
