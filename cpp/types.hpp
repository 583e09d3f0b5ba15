#ifndef HEADER_GUARD_NONMINMAX_TYPES_HPP
#define HEADER_GUARD_NONMINMAX_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace nonminmax {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
__extension__ typedef unsigned __int128 u128;
using usize = std::size_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
__extension__ typedef __int128 i128;
using isize = std::ptrdiff_t;

} // namespace nonminmax

#endif // HEADER_GUARD_NONMINMAX_TYPES_HPP
