#include "sentinel_excluded_integer.hpp"
#include "format.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <compare>
#include <limits>
#include <vector>

using namespace nonminmax;

namespace {

template <class T> std::vector<typename T::type> boundary_samples() {
  using type = typename T::type;
  using limits = std::numeric_limits<type>;
  std::vector<type> candidates{limits::min(),
                               static_cast<type>(limits::min() + 1),
                               static_cast<type>(limits::min() + 2),
                               type{0},
                               type{1},
                               type{2},
                               type{100},
                               static_cast<type>(limits::max() / 2),
                               static_cast<type>(limits::max() / 2 + 1),
                               static_cast<type>(limits::max() - 2),
                               static_cast<type>(limits::max() - 1),
                               limits::max()};
  if constexpr (std::is_signed_v<type>) {
    candidates.push_back(type{-1});
    candidates.push_back(type{-2});
    candidates.push_back(type{-100});
    candidates.push_back(static_cast<type>(limits::min() / 2));
  }
  std::erase(candidates, T::sentinel);
  return candidates;
}

template <class T>
void expect_ordering_matches(typename T::type a, typename T::type b) {
  auto x = T::make_unchecked(a);
  auto y = T::make_unchecked(b);
  EXPECT_EQ(x == y, a == b) << +a << " vs " << +b;
  EXPECT_EQ(x < y, a < b) << +a << " vs " << +b;
  EXPECT_EQ(x > y, a > b) << +a << " vs " << +b;
  EXPECT_EQ(x <= y, a <= b) << +a << " vs " << +b;
  EXPECT_EQ((x <=> y) == std::strong_ordering::equal, a == b);
}

} // namespace

template <class T> class DecodedOrdering : public ::testing::Test {};

using wide_instantiations = ::testing::Types<
    non_max_u16, non_max_u32, non_max_u64, non_max_u128, non_max_usize,
    non_max_i16, non_max_i32, non_max_i64, non_max_i128, non_max_isize,
    non_min_u16, non_min_u32, non_min_u64, non_min_u128, non_min_usize,
    non_min_i16, non_min_i32, non_min_i64, non_min_i128, non_min_isize>;

TYPED_TEST_SUITE(DecodedOrdering, wide_instantiations);

TYPED_TEST(DecodedOrdering, boundary_samples_order_like_their_values) {
  auto samples = boundary_samples<TypeParam>();
  for (auto a : samples) {
    for (auto b : samples) {
      if constexpr (sizeof(a) > sizeof(long long)) {
        auto x = TypeParam::make_unchecked(a);
        auto y = TypeParam::make_unchecked(b);
        EXPECT_EQ(x == y, a == b);
        EXPECT_EQ(x < y, a < b);
        EXPECT_EQ(x > y, a > b);
      } else {
        expect_ordering_matches<TypeParam>(a, b);
      }
    }
  }
}

TYPED_TEST(DecodedOrdering, sorting_sorts_by_value) {
  auto samples = boundary_samples<TypeParam>();
  std::vector<TypeParam> wrapped;
  for (auto raw : samples) {
    wrapped.push_back(TypeParam::make_unchecked(raw));
  }
  std::sort(samples.begin(), samples.end());
  std::sort(wrapped.begin(), wrapped.end());
  ASSERT_EQ(samples.size(), wrapped.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    EXPECT_EQ(wrapped[i].get(), samples[i]);
  }
}

TEST(DecodedOrdering, every_pair_of_8_bit_values) {
  for (int a = 0; a < 255; ++a) {
    for (int b = 0; b < 255; ++b) {
      expect_ordering_matches<non_max_u8>(static_cast<u8>(a),
                                           static_cast<u8>(b));
      expect_ordering_matches<non_min_u8>(static_cast<u8>(a + 1),
                                           static_cast<u8>(b + 1));
      expect_ordering_matches<non_max_i8>(static_cast<i8>(a - 128),
                                           static_cast<i8>(b - 128));
      expect_ordering_matches<non_min_i8>(static_cast<i8>(a - 127),
                                           static_cast<i8>(b - 127));
    }
  }
}

TEST(DecodedOrdering, storage_order_is_not_value_order) {
  using traits_max = niche_traits<non_max_u8>;
  auto one = non_max_u8::make_unchecked(1);
  auto two = non_max_u8::make_unchecked(2);
  // all-ones mask: storage runs backwards
  EXPECT_GT(traits_max::to_storage(one), traits_max::to_storage(two));
  EXPECT_LT(one, two);

  using traits_min = niche_traits<non_min_i8>;
  auto minus_one = non_min_i8::make_unchecked(-1);
  auto plus_one = non_min_i8::make_unchecked(1);
  // sign bit flipped: -1 is stored as 127, 1 as -127
  EXPECT_GT(traits_min::to_storage(minus_one),
            traits_min::to_storage(plus_one));
  EXPECT_LT(minus_one, plus_one);

  // zero mask: storage is the value itself
  using traits_zero = niche_traits<non_min_u8>;
  EXPECT_EQ(traits_zero::to_storage(non_min_u8::make_unchecked(9)), 9);
}
