#ifndef HEADER_GUARD_NONMINMAX_RESULT_HPP
#define HEADER_GUARD_NONMINMAX_RESULT_HPP

#include "niche.hpp"

#include <cassert>
#include <type_traits>
#include <variant>

namespace nonminmax {

/// Either a `T` or an `ErrorType`, packed into the niche of `T`.
///
/// `ErrorType` carries no data (its default value is the only error), which
/// is what lets the error arm live in `niche_traits<T>::empty`.
template <class T, class ErrorType = std::monostate> class result {
  static_assert(niche_type<T>,
                "result<T, E> requires a niche_traits<T> specialization");
  static_assert(std::is_empty_v<ErrorType> &&
                    std::is_nothrow_default_constructible_v<ErrorType>,
                "error_type must be an empty, default constructible type");
  static_assert(!std::is_convertible_v<ErrorType, T> &&
                    !std::is_convertible_v<T, ErrorType>,
                "type and error_type must be distinguishable");

  using traits = niche_traits<T>;

public:
  using type = T;
  using error_type = ErrorType;
  using storage_type = typename traits::storage_type;

private:
  storage_type _storage;

public:
  constexpr explicit result(type value) noexcept
      : _storage(traits::to_storage(value)) {}
  template <class U>
    requires(std::is_convertible_v<U, error_type> &&
             !std::is_convertible_v<U, type>)
  constexpr explicit result(U &&) noexcept : _storage(traits::empty) {}

  constexpr bool is_error() const noexcept {
    return _storage == traits::empty;
  }

  constexpr bool is_value() const noexcept { return !is_error(); }

  constexpr explicit operator bool() const noexcept { return is_value(); }

  constexpr type value() const noexcept {
    assert(is_value() && "result is an error");
    return traits::from_storage(_storage);
  }

  constexpr error_type error() const noexcept {
    assert(is_error() && "result is not an error");
    return error_type{};
  }

  constexpr bool operator==(const result &other) const noexcept {
    return _storage == other._storage;
  }
};

} // namespace nonminmax

#endif // HEADER_GUARD_NONMINMAX_RESULT_HPP
