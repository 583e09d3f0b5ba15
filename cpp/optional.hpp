#ifndef HEADER_GUARD_NONMINMAX_OPTIONAL_HPP
#define HEADER_GUARD_NONMINMAX_OPTIONAL_HPP

#include "niche.hpp"

#include <cassert>
#include <optional>
#include <type_traits>

namespace nonminmax {

/// Optional value stored in the niche of `T`: the empty state is the one
/// storage pattern no `T` can have, so no flag is needed and
/// `sizeof(optional<T>) == sizeof(niche_traits<T>::storage_type)`.
///
/// Unlike `std::optional` it holds the storage rather than a `T` object, so
/// `operator*` and `value()` return by value.
template <class T> class optional {
  static_assert(niche_type<T>,
                "optional<T> requires a niche_traits<T> specialization");

  using traits = niche_traits<T>;

public:
  using value_type = T;
  using storage_type = typename traits::storage_type;

private:
  storage_type _storage = traits::empty;

public:
  constexpr optional() noexcept = default;
  constexpr optional(value_type value) noexcept
      : _storage(traits::to_storage(value)) {}
  constexpr optional(std::nullopt_t) noexcept : _storage(traits::empty) {}
  constexpr optional(const optional &) noexcept = default;
  constexpr optional(optional &&) noexcept = default;
  constexpr optional &operator=(const optional &) noexcept = default;
  constexpr optional &operator=(optional &&) noexcept = default;
  constexpr optional &operator=(value_type value) noexcept {
    _storage = traits::to_storage(value);
    return *this;
  }
  constexpr optional &operator=(std::nullopt_t) noexcept {
    reset();
    return *this;
  }

  constexpr void reset() noexcept { _storage = traits::empty; }

  constexpr bool has_value() const noexcept {
    return _storage != traits::empty;
  }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr value_type value() const noexcept {
    assert(has_value() && "optional has no value");
    return traits::from_storage(_storage);
  }
  constexpr value_type value_or(value_type def) const noexcept {
    return has_value() ? traits::from_storage(_storage) : def;
  }
  constexpr value_type operator*() const noexcept { return value(); }

  struct arrow_proxy {
    value_type held;
    constexpr const value_type *operator->() const noexcept { return &held; }
  };
  constexpr arrow_proxy operator->() const noexcept { return {value()}; }

  // Valid values map one to one onto storage patterns, so comparing storage
  // compares values.
  constexpr bool operator==(const optional &other) const noexcept {
    return _storage == other._storage;
  }
  constexpr bool operator==(value_type other) const noexcept {
    return _storage == traits::to_storage(other);
  }
  constexpr bool operator==(std::nullopt_t) const noexcept {
    return !has_value();
  }
};

} // namespace nonminmax

#endif // HEADER_GUARD_NONMINMAX_OPTIONAL_HPP
