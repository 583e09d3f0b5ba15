#ifndef HEADER_GUARD_NONMINMAX_SENTINEL_EXCLUDED_INTEGER_HPP
#define HEADER_GUARD_NONMINMAX_SENTINEL_EXCLUDED_INTEGER_HPP

#include "meta/integer_traits.hpp"
#include "niche.hpp"
#include "non_zero.hpp"
#include "optional.hpp"
#include "types.hpp"

#include <cassert>
#include <compare>
#include <cstddef>
#include <functional>
#include <limits>

/** @file
 *  @brief Integers that can never hold their minimum (or maximum) value
 *
 *  @details
 *  `sentinel_excluded_integer<T, Sentinel>` holds any `T` except `Sentinel`,
 *  which must be the minimum or the maximum of `T`. The value is stored as
 *  `value ^ Sentinel` inside a `non_zero<T>`: the excluded value is the only
 *  one that encodes to zero, so the zero pattern stays free and
 *  `optional`/`result` of these types are exactly as large as `T`.
 *  Reading the value back costs a single xor.
 *
 *  `usize`/`isize` are `std::size_t`/`std::ptrdiff_t`; where those are the
 *  same types as `u64`/`i64` (LP64), `non_max_usize` is `non_max_u64` and
 *  `type_name`/`debug_string` report it as `non_max_u64`.
 *
 *  Example:
 *  @code
 *  using namespace nonminmax;
 *
 *  auto x = non_max_u8::make(123);
 *  assert(x.has_value() && x.value().get() == 123);
 *  assert(non_max_u8::make(255) == std::nullopt);
 *
 *  static_assert(sizeof(optional<non_max_u32>) == sizeof(u32));
 *  optional<non_min_i64> slots[1000]; // 8000 bytes, no tags
 *  @endcode
 */

namespace nonminmax {

template <meta::integer Underlying, Underlying Sentinel>
class sentinel_excluded_integer {
  static_assert(meta::is_min_or_max(Sentinel),
                "Sentinel must be the minimum or maximum value of the type");

public:
  using type = Underlying;
  using storage_type = non_zero<Underlying>;
  constexpr static inline type sentinel = Sentinel;

private:
  storage_type _value;

  constexpr explicit sentinel_excluded_integer(storage_type encoded) noexcept
      : _value(encoded) {}

  // xor is its own inverse: this both encodes and decodes
  static constexpr type flip(type value) noexcept {
    return static_cast<type>(value ^ sentinel);
  }

  friend struct niche_traits<sentinel_excluded_integer>;

public:
  /// Returns an empty optional when `value` is the sentinel.
  static constexpr optional<sentinel_excluded_integer>
  make(type value) noexcept {
    auto encoded = storage_type::make(flip(value));
    if (!encoded) {
      return std::nullopt;
    }
    return sentinel_excluded_integer{*encoded};
  }

  /// Builds the value without checking it in release builds.
  ///
  /// @pre `value != sentinel`. Debug builds assert. Release builds store a
  /// zero pattern, after which comparisons, hashing, and every `optional`
  /// or `result` holding the value are meaningless.
  static constexpr sentinel_excluded_integer
  make_unchecked(type value) noexcept {
    assert(value != sentinel &&
           "sentinel_excluded_integer::make_unchecked called with sentinel");
    return sentinel_excluded_integer{storage_type::make_unchecked(flip(value))};
  }

  constexpr type get() const noexcept { return flip(_value.get()); }
  constexpr explicit operator type() const noexcept { return get(); }

  friend constexpr bool
  operator==(const sentinel_excluded_integer &,
             const sentinel_excluded_integer &) noexcept = default;

  // Storage order is not value order for most sentinels (for an all-ones
  // mask it is reversed), so compare decoded values.
  friend constexpr std::strong_ordering
  operator<=>(const sentinel_excluded_integer &lhs,
              const sentinel_excluded_integer &rhs) noexcept {
    return lhs.get() <=> rhs.get();
  }
};

template <meta::integer Underlying, Underlying Sentinel>
struct niche_traits<sentinel_excluded_integer<Underlying, Sentinel>> {
  using value_type = sentinel_excluded_integer<Underlying, Sentinel>;
  using storage_type = Underlying;
  constexpr static inline storage_type empty =
      niche_traits<non_zero<Underlying>>::empty;

  static constexpr storage_type to_storage(value_type value) noexcept {
    return value._value.get();
  }
  static constexpr value_type from_storage(storage_type raw) noexcept {
    return value_type{non_zero<Underlying>::make_unchecked(raw)};
  }
};

template <meta::integer Underlying>
using non_min =
    sentinel_excluded_integer<Underlying,
                              std::numeric_limits<Underlying>::min()>;

template <meta::integer Underlying>
using non_max =
    sentinel_excluded_integer<Underlying,
                              std::numeric_limits<Underlying>::max()>;

template <meta::integer Underlying, Underlying Sentinel>
constexpr Underlying
to_primitive(sentinel_excluded_integer<Underlying, Sentinel> value) noexcept {
  return value.get();
}

template <meta::integer Underlying>
constexpr Underlying to_primitive(non_zero<Underlying> value) noexcept {
  return value.get();
}

using non_max_u8 = non_max<u8>;
using non_max_u16 = non_max<u16>;
using non_max_u32 = non_max<u32>;
using non_max_u64 = non_max<u64>;
using non_max_u128 = non_max<u128>;
using non_max_usize = non_max<usize>;

using non_max_i8 = non_max<i8>;
using non_max_i16 = non_max<i16>;
using non_max_i32 = non_max<i32>;
using non_max_i64 = non_max<i64>;
using non_max_i128 = non_max<i128>;
using non_max_isize = non_max<isize>;

using non_min_u8 = non_min<u8>;
using non_min_u16 = non_min<u16>;
using non_min_u32 = non_min<u32>;
using non_min_u64 = non_min<u64>;
using non_min_u128 = non_min<u128>;
using non_min_usize = non_min<usize>;

using non_min_i8 = non_min<i8>;
using non_min_i16 = non_min<i16>;
using non_min_i32 = non_min<i32>;
using non_min_i64 = non_min<i64>;
using non_min_i128 = non_min<i128>;
using non_min_isize = non_min<isize>;

} // namespace nonminmax

template <nonminmax::meta::integer Underlying, Underlying Sentinel>
struct std::hash<nonminmax::sentinel_excluded_integer<Underlying, Sentinel>> {
  std::size_t
  operator()(const nonminmax::sentinel_excluded_integer<Underlying, Sentinel>
                 &value) const noexcept {
    return std::hash<Underlying>{}(value.get());
  }
};

#endif // HEADER_GUARD_NONMINMAX_SENTINEL_EXCLUDED_INTEGER_HPP
