#ifndef HEADER_GUARD_NONMINMAX_META_INTEGER_TRAITS_HPP
#define HEADER_GUARD_NONMINMAX_META_INTEGER_TRAITS_HPP

#include <climits>
#include <limits>
#include <type_traits>

namespace nonminmax::meta {

// bool is integral but has no meaningful sentinel to exclude
template <class T>
concept integer = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                  std::numeric_limits<T>::is_specialized;

template <integer T>
constexpr static inline unsigned bit_width_v = sizeof(T) * CHAR_BIT;

template <integer T>
constexpr bool is_min_or_max(T value) noexcept {
  return value == std::numeric_limits<T>::min() ||
         value == std::numeric_limits<T>::max();
}

} // namespace nonminmax::meta

#endif // HEADER_GUARD_NONMINMAX_META_INTEGER_TRAITS_HPP
