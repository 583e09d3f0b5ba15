#ifndef HEADER_GUARD_NONMINMAX_FORMAT_HPP
#define HEADER_GUARD_NONMINMAX_FORMAT_HPP

#include "meta/integer_traits.hpp"
#include "non_zero.hpp"
#include "optional.hpp"
#include "sentinel_excluded_integer.hpp"

#include <array>
#include <cassert>
#include <charconv>
#include <limits>
#include <ostream>
#include <string>
#include <system_error>
#include <type_traits>

/** @file
 *  @brief Text output for the constrained integer types
 *
 *  @details
 *  - `to_string(x)` prints the decoded value in decimal, nothing else.
 *  - `debug_string(x)` prints `type_name(value)`, e.g. `non_max_u8(123)`.
 *  - `operator<<` behaves like streaming the underlying integer, except that
 *    8-bit values are printed as numbers rather than characters.
 *
 *  128-bit values go through `std::to_chars` since iostreams cannot print
 *  them, so stream flags such as `std::hex` do not apply to them.
 */

namespace nonminmax {

namespace detail {

template <meta::integer T> std::string integer_to_string(T value) {
  // digits10 + 1 digits, plus the sign
  std::array<char, std::numeric_limits<T>::digits10 + 2> buffer{};
  auto [end, ec] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  assert(ec == std::errc{} && "integer does not fit its decimal buffer");
  return std::string(buffer.data(), end);
}

template <meta::integer T>
std::ostream &write_integer(std::ostream &out, T value) {
  if constexpr (sizeof(T) <= sizeof(long long)) {
    return out << +value;
  } else {
    return out << integer_to_string(value);
  }
}

template <meta::integer T> std::string type_suffix() {
  return (std::is_signed_v<T> ? "i" : "u") +
         std::to_string(meta::bit_width_v<T>);
}

template <class T> struct type_name_of;

template <meta::integer Underlying, Underlying Sentinel>
struct type_name_of<sentinel_excluded_integer<Underlying, Sentinel>> {
  static std::string get() {
    constexpr bool excludes_min =
        Sentinel == std::numeric_limits<Underlying>::min();
    return (excludes_min ? "non_min_" : "non_max_") +
           type_suffix<Underlying>();
  }
};

template <meta::integer Underlying>
struct type_name_of<non_zero<Underlying>> {
  static std::string get() { return "non_zero_" + type_suffix<Underlying>(); }
};

} // namespace detail

/// Name of the alias naming `T`, e.g. `non_min_i32`. Pointer-sized
/// integers share the name of the fixed-width type they are defined as.
template <class T> std::string type_name() {
  return detail::type_name_of<T>::get();
}

template <meta::integer Underlying, Underlying Sentinel>
std::string
to_string(sentinel_excluded_integer<Underlying, Sentinel> value) {
  return detail::integer_to_string(value.get());
}

template <meta::integer Underlying>
std::string to_string(non_zero<Underlying> value) {
  return detail::integer_to_string(value.get());
}

template <meta::integer Underlying, Underlying Sentinel>
std::string
debug_string(sentinel_excluded_integer<Underlying, Sentinel> value) {
  return type_name<sentinel_excluded_integer<Underlying, Sentinel>>() + "(" +
         to_string(value) + ")";
}

template <meta::integer Underlying>
std::string debug_string(non_zero<Underlying> value) {
  return type_name<non_zero<Underlying>>() + "(" + to_string(value) + ")";
}

template <meta::integer Underlying, Underlying Sentinel>
std::ostream &
operator<<(std::ostream &out,
           sentinel_excluded_integer<Underlying, Sentinel> value) {
  return detail::write_integer(out, value.get());
}

template <meta::integer Underlying>
std::ostream &operator<<(std::ostream &out, non_zero<Underlying> value) {
  return detail::write_integer(out, value.get());
}

template <class T>
std::ostream &operator<<(std::ostream &out, const optional<T> &value) {
  if (!value) {
    return out << "nullopt";
  }
  return out << *value;
}

} // namespace nonminmax

#endif // HEADER_GUARD_NONMINMAX_FORMAT_HPP
