#ifndef HEADER_GUARD_NONMINMAX_NICHE_HPP
#define HEADER_GUARD_NONMINMAX_NICHE_HPP

#include <concepts>
#include <type_traits>

/** @file
 *  @brief Customization point describing types with an unused bit pattern
 *
 *  @details
 *  A type has a niche when at least one bit pattern of its storage can never
 *  be produced by a valid value. Wrappers such as `nonminmax::optional` and
 *  `nonminmax::result` reuse that pattern as their "empty" marker and so need
 *  no separate tag.
 *
 *  A specialization of `niche_traits<T>` provides:
 *  - `storage_type`: the trivially copyable representation of a `T`;
 *  - `empty`: the storage pattern no valid `T` ever has;
 *  - `to_storage(T)`: the representation of a value;
 *  - `from_storage(storage_type)`: the value back, given storage != empty.
 *
 *  Example:
 *  @code
 *  static_assert(nonminmax::niche_type<nonminmax::non_zero<int>>);
 *  static_assert(sizeof(nonminmax::optional<nonminmax::non_zero<int>>) ==
 *                sizeof(int));
 *  @endcode
 */

namespace nonminmax {

template <class T> struct niche_traits;

template <class T>
concept niche_type = requires(const T &value,
                              typename niche_traits<T>::storage_type raw) {
  typename niche_traits<T>::storage_type;
  requires std::is_trivially_copyable_v<typename niche_traits<T>::storage_type>;
  {
    niche_traits<T>::empty
  } -> std::convertible_to<typename niche_traits<T>::storage_type>;
  {
    niche_traits<T>::to_storage(value)
  } -> std::same_as<typename niche_traits<T>::storage_type>;
  { niche_traits<T>::from_storage(raw) } -> std::same_as<T>;
};

} // namespace nonminmax

#endif // HEADER_GUARD_NONMINMAX_NICHE_HPP
