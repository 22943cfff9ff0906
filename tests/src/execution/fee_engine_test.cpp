#include <gtest/gtest.h>
#include <strongbox/execution/fee_engine.hpp>
#include <strongbox/testing/common.hpp>

#include <string>

TEST(fee_engine, one_percent_of_500_tokens) {
  auto split = strongbox::execution::compute_fee(strongbox::testing::tokens(500),
                                                 100);
  EXPECT_EQ(split.fee, strongbox::testing::tokens(5));
  EXPECT_EQ(split.net, strongbox::testing::tokens(495));
}

TEST(fee_engine, fee_rounds_down) {
  // 9999 * 1 / 10000 floors to zero.
  auto dust = strongbox::execution::compute_fee(9999, 1);
  EXPECT_EQ(dust.fee, 0);
  EXPECT_EQ(dust.net, 9999);

  auto split = strongbox::execution::compute_fee(12345, 333);
  EXPECT_EQ(split.fee, 411);
  EXPECT_EQ(split.net, 11934);
}

TEST(fee_engine, zero_rate_and_max_rate) {
  auto free = strongbox::execution::compute_fee(1000, 0);
  EXPECT_EQ(free.fee, 0);
  EXPECT_EQ(free.net, 1000);

  auto max = strongbox::execution::compute_fee(
      1000, strongbox::execution::kMaxFeeBasisPoints);
  EXPECT_EQ(max.fee, 50);
  EXPECT_EQ(max.net, 950);
}

TEST(fee_engine, exact_near_the_top_of_the_range) {
  auto amount = *strongbox::schema::try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935");
  auto split = strongbox::execution::compute_fee(amount, 500);
  // floor((2^256 - 1) * 500 / 10000) = floor((2^256 - 1) / 20)
  EXPECT_EQ(split.fee, amount / 20);
  EXPECT_EQ(split.fee + split.net, amount);
}

TEST(fee_engine, rate_bound) {
  EXPECT_TRUE(strongbox::execution::is_valid_fee(0));
  EXPECT_TRUE(strongbox::execution::is_valid_fee(500));
  EXPECT_FALSE(strongbox::execution::is_valid_fee(501));
}
