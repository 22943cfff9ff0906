#include <gtest/gtest.h>
#include <strongbox/ledger/memory_token_ledger.hpp>
#include <strongbox/testing/common.hpp>

namespace {

const auto kAlice = strongbox::testing::make_address(1);
const auto kBob = strongbox::testing::make_address(2);
const auto kSpender = strongbox::testing::make_address(3);

}  // namespace

TEST(memory_token_ledger, transfer_moves_balance) {
  auto ledger = strongbox::ledger::memory_token_ledger{};
  ledger.credit(kAlice, 100);

  EXPECT_TRUE(ledger.transfer(kAlice, kBob, 40));
  EXPECT_EQ(ledger.balance_of(kAlice), 60);
  EXPECT_EQ(ledger.balance_of(kBob), 40);

  EXPECT_FALSE(ledger.transfer(kAlice, kBob, 61));
  EXPECT_EQ(ledger.balance_of(kAlice), 60);
  EXPECT_EQ(ledger.balance_of(kBob), 40);
}

TEST(memory_token_ledger, transfer_from_consumes_allowance) {
  auto ledger = strongbox::ledger::memory_token_ledger{};
  ledger.credit(kAlice, 100);
  ledger.approve(kAlice, kSpender, 70);

  EXPECT_FALSE(ledger.transfer_from(kSpender, kAlice, kBob, 71));
  EXPECT_TRUE(ledger.transfer_from(kSpender, kAlice, kBob, 50));
  EXPECT_EQ(ledger.allowance(kAlice, kSpender), 20);
  EXPECT_EQ(ledger.balance_of(kBob), 50);

  // Allowance without balance still fails and leaves the allowance alone.
  ledger.approve(kAlice, kSpender, 1000);
  EXPECT_FALSE(ledger.transfer_from(kSpender, kAlice, kBob, 51));
  EXPECT_EQ(ledger.allowance(kAlice, kSpender), 1000);
}

TEST(memory_token_ledger, revert_undoes_everything_since_checkpoint) {
  auto ledger = strongbox::ledger::memory_token_ledger{};
  ledger.credit(kAlice, 100);
  ledger.approve(kAlice, kSpender, 100);

  auto checkpoint = ledger.checkpoint();
  EXPECT_TRUE(ledger.transfer_from(kSpender, kAlice, kBob, 30));
  EXPECT_TRUE(ledger.transfer(kBob, kSpender, 10));
  ledger.revert_to(checkpoint);

  EXPECT_EQ(ledger.balance_of(kAlice), 100);
  EXPECT_EQ(ledger.balance_of(kBob), 0);
  EXPECT_EQ(ledger.balance_of(kSpender), 0);
  EXPECT_EQ(ledger.allowance(kAlice, kSpender), 100);
  EXPECT_EQ(ledger.open_checkpoints(), 0u);
}

TEST(memory_token_ledger, nested_checkpoints_revert_independently) {
  auto ledger = strongbox::ledger::memory_token_ledger{};
  ledger.credit(kAlice, 100);

  auto outer = ledger.checkpoint();
  EXPECT_TRUE(ledger.transfer(kAlice, kBob, 10));
  auto inner = ledger.checkpoint();
  EXPECT_TRUE(ledger.transfer(kAlice, kBob, 20));
  ledger.revert_to(inner);
  EXPECT_EQ(ledger.balance_of(kBob), 10);

  ledger.release(outer);
  EXPECT_EQ(ledger.balance_of(kAlice), 90);
  EXPECT_EQ(ledger.balance_of(kBob), 10);
  EXPECT_EQ(ledger.open_checkpoints(), 0u);
}

TEST(memory_token_ledger, scoped_checkpoint_reverts_unless_released) {
  auto ledger = strongbox::ledger::memory_token_ledger{};
  ledger.credit(kAlice, 100);
  {
    auto scope = strongbox::ledger::scoped_checkpoint{ledger};
    EXPECT_TRUE(ledger.transfer(kAlice, kBob, 25));
  }
  EXPECT_EQ(ledger.balance_of(kAlice), 100);

  {
    auto scope = strongbox::ledger::scoped_checkpoint{ledger};
    EXPECT_TRUE(ledger.transfer(kAlice, kBob, 25));
    scope.release();
  }
  EXPECT_EQ(ledger.balance_of(kAlice), 75);
  EXPECT_EQ(ledger.balance_of(kBob), 25);
}
