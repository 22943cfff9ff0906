#include <gtest/gtest.h>
#include <strongbox/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, hex_round_trip_accepts_prefix_and_case) {
  auto decoded = strongbox::schema::try_from_hex("0xDEadBEef");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->size(), 4u);
  EXPECT_EQ(strongbox::schema::to_hex(strongbox::schema::bytes_view_t{*decoded}),
            "deadbeef");
}

TEST(primitives, hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(strongbox::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(strongbox::schema::try_from_hex("zz").has_value());
}

TEST(primitives, address_parses_32_bytes_only) {
  auto hex = std::string(64, 'a');
  auto address = strongbox::schema::try_make_address(hex);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(strongbox::schema::to_string(*address), "0x" + hex);
  EXPECT_FALSE(strongbox::schema::is_zero_address(*address));

  EXPECT_FALSE(strongbox::schema::try_make_address(std::string(62, 'a')));
  EXPECT_FALSE(strongbox::schema::try_make_address("alice"));
  EXPECT_TRUE(strongbox::schema::is_zero_address(
      strongbox::schema::make_zero_address()));
}

TEST(primitives, amount_parses_values_beyond_64_bits) {
  auto amount = strongbox::schema::try_make_amount("1000000000000000000000");
  ASSERT_TRUE(amount.has_value());
  EXPECT_EQ(*amount, strongbox::schema::amount_t{1000} *
                         strongbox::schema::amount_t{1000000000000000000ULL});
  EXPECT_EQ(strongbox::schema::to_string(*amount), "1000000000000000000000");
}

TEST(primitives, amount_rejects_malformed_input) {
  EXPECT_FALSE(strongbox::schema::try_make_amount(""));
  EXPECT_FALSE(strongbox::schema::try_make_amount("-5"));
  EXPECT_FALSE(strongbox::schema::try_make_amount("+5"));
  EXPECT_FALSE(strongbox::schema::try_make_amount("12a"));
  EXPECT_FALSE(strongbox::schema::try_make_amount("1.5"));
}

TEST(primitives, amount_rejects_overflow) {
  // 2^256 - 1 parses; 2^256 does not.
  constexpr auto kMax = std::string_view{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935"};
  constexpr auto kOverflow = std::string_view{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639936"};
  auto max = strongbox::schema::try_make_amount(kMax);
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(strongbox::schema::to_string(*max), std::string{kMax});
  EXPECT_FALSE(strongbox::schema::try_make_amount(kOverflow));
  EXPECT_FALSE(strongbox::schema::try_make_amount(std::string(79, '1')));
}
