#ifndef HEADER_GUARD_NONMINMAX_NON_ZERO_HPP
#define HEADER_GUARD_NONMINMAX_NON_ZERO_HPP

#include "meta/integer_traits.hpp"
#include "niche.hpp"
#include "optional.hpp"

#include <cassert>
#include <compare>
#include <cstddef>
#include <functional>

namespace nonminmax {

/// An integer known never to be zero.
///
/// The all-zero bit pattern is left free, which `niche_traits` exposes to
/// `optional` and `result`.
template <meta::integer Underlying> class non_zero {
  Underlying _value;

  constexpr explicit non_zero(Underlying value) noexcept : _value(value) {}

public:
  using type = Underlying;

  /// Returns an empty optional when `value` is zero.
  static constexpr optional<non_zero> make(type value) noexcept {
    if (value == 0) {
      return std::nullopt;
    }
    return non_zero{value};
  }

  /// Wraps `value` without checking it in release builds.
  ///
  /// @pre `value != 0`. A zero here breaks the niche every `optional` and
  /// `result` of this type relies on.
  static constexpr non_zero make_unchecked(type value) noexcept {
    assert(value != 0 && "non_zero::make_unchecked called with zero");
    return non_zero{value};
  }

  constexpr type get() const noexcept { return _value; }
  constexpr explicit operator type() const noexcept { return _value; }

  friend constexpr bool operator==(const non_zero &,
                                   const non_zero &) noexcept = default;
  friend constexpr std::strong_ordering
  operator<=>(const non_zero &, const non_zero &) noexcept = default;
};

template <meta::integer Underlying> struct niche_traits<non_zero<Underlying>> {
  using storage_type = Underlying;
  constexpr static inline storage_type empty = 0;

  static constexpr storage_type
  to_storage(non_zero<Underlying> value) noexcept {
    return value.get();
  }
  static constexpr non_zero<Underlying>
  from_storage(storage_type raw) noexcept {
    return non_zero<Underlying>::make_unchecked(raw);
  }
};

} // namespace nonminmax

template <nonminmax::meta::integer Underlying>
struct std::hash<nonminmax::non_zero<Underlying>> {
  std::size_t
  operator()(const nonminmax::non_zero<Underlying> &value) const noexcept {
    return std::hash<Underlying>{}(value.get());
  }
};

#endif // HEADER_GUARD_NONMINMAX_NON_ZERO_HPP
