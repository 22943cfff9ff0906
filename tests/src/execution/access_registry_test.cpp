#include <gtest/gtest.h>
#include <strongbox/execution/access_registry.hpp>
#include <strongbox/testing/common.hpp>

using strongbox::schema::vault_error_code_t;

namespace {

const auto kOwner = strongbox::testing::make_address(1);
const auto kAlice = strongbox::testing::make_address(2);
const auto kBob = strongbox::testing::make_address(3);

}  // namespace

TEST(access_registry, owner_is_first_operator) {
  auto registry = strongbox::execution::access_registry{kOwner};
  EXPECT_TRUE(registry.is_owner(kOwner));
  EXPECT_TRUE(registry.is_operator(kOwner));
  EXPECT_FALSE(registry.is_operator(kAlice));
  EXPECT_EQ(registry.operators().size(), 1u);
}

TEST(access_registry, owner_manages_operators) {
  auto registry = strongbox::execution::access_registry{kOwner};
  EXPECT_EQ(registry.add_operator(kOwner, kAlice), std::nullopt);
  EXPECT_TRUE(registry.is_operator(kAlice));
  EXPECT_EQ(registry.add_operator(kOwner, kAlice),
            vault_error_code_t::already_operator);
  EXPECT_EQ(registry.add_operator(kOwner, kOwner),
            vault_error_code_t::already_operator);

  EXPECT_EQ(registry.remove_operator(kOwner, kAlice), std::nullopt);
  EXPECT_FALSE(registry.is_operator(kAlice));
  EXPECT_EQ(registry.remove_operator(kOwner, kAlice),
            vault_error_code_t::not_operator);
}

TEST(access_registry, non_owner_cannot_manage_roles) {
  auto registry = strongbox::execution::access_registry{kOwner};
  EXPECT_EQ(registry.add_operator(kOwner, kAlice), std::nullopt);

  EXPECT_EQ(registry.add_operator(kAlice, kBob),
            vault_error_code_t::unauthorized);
  EXPECT_EQ(registry.remove_operator(kAlice, kAlice),
            vault_error_code_t::unauthorized);
  EXPECT_EQ(registry.transfer_ownership(kAlice, kAlice),
            vault_error_code_t::unauthorized);
  EXPECT_TRUE(registry.is_owner(kOwner));
}

TEST(access_registry, owner_cannot_be_removed) {
  auto registry = strongbox::execution::access_registry{kOwner};
  EXPECT_EQ(registry.remove_operator(kOwner, kOwner),
            vault_error_code_t::cannot_remove_owner);
  EXPECT_TRUE(registry.is_operator(kOwner));
}

TEST(access_registry, zero_address_is_rejected) {
  auto registry = strongbox::execution::access_registry{kOwner};
  auto zero = strongbox::schema::make_zero_address();
  EXPECT_EQ(registry.add_operator(kOwner, zero),
            vault_error_code_t::invalid_address);
  EXPECT_EQ(registry.transfer_ownership(kOwner, zero),
            vault_error_code_t::invalid_address);
}

TEST(access_registry, ownership_transfer_moves_implicit_operator_role) {
  auto registry = strongbox::execution::access_registry{kOwner};
  EXPECT_EQ(registry.transfer_ownership(kOwner, kAlice), std::nullopt);
  EXPECT_TRUE(registry.is_owner(kAlice));
  EXPECT_TRUE(registry.is_operator(kAlice));
  EXPECT_FALSE(registry.is_owner(kOwner));

  // The previous owner keeps its recorded operator membership and is now
  // removable.
  EXPECT_TRUE(registry.is_operator(kOwner));
  EXPECT_EQ(registry.remove_operator(kAlice, kOwner), std::nullopt);
  EXPECT_FALSE(registry.is_operator(kOwner));
  EXPECT_EQ(registry.remove_operator(kAlice, kAlice),
            vault_error_code_t::cannot_remove_owner);
}
