#ifndef HEADER_GUARD_NONMINMAX_HPP
#define HEADER_GUARD_NONMINMAX_HPP

#include "format.hpp"
#include "niche.hpp"
#include "non_zero.hpp"
#include "optional.hpp"
#include "result.hpp"
#include "sentinel_excluded_integer.hpp"
#include "types.hpp"

#endif // HEADER_GUARD_NONMINMAX_HPP
