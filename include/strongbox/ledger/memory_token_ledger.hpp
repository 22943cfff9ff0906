#pragma once

#include <strongbox/ledger/token_ledger.hpp>
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace strongbox::ledger {

/// In-process ERC-20 style ledger with balances, allowances and a journal
/// backing nested checkpoints. Used by the CLI simulator and the tests.
class memory_token_ledger : public token_ledger {
 public:
  strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& holder) const override;
  bool transfer(const strongbox::schema::address_t& from,
                const strongbox::schema::address_t& to,
                const strongbox::schema::amount_t& amount) override;
  bool transfer_from(const strongbox::schema::address_t& spender,
                     const strongbox::schema::address_t& from,
                     const strongbox::schema::address_t& to,
                     const strongbox::schema::amount_t& amount) override;

  checkpoint_t checkpoint() override;
  void revert_to(checkpoint_t checkpoint) override;
  void release(checkpoint_t checkpoint) override;

  /// Seed a balance for simulation and test setup.
  void credit(const strongbox::schema::address_t& holder,
              const strongbox::schema::amount_t& amount);

  void approve(const strongbox::schema::address_t& owner,
               const strongbox::schema::address_t& spender,
               const strongbox::schema::amount_t& amount);

  strongbox::schema::amount_t allowance(
      const strongbox::schema::address_t& owner,
      const strongbox::schema::address_t& spender) const;

  std::size_t open_checkpoints() const { return checkpoints_.size(); }

 private:
  using allowance_key_t =
      std::pair<strongbox::schema::address_t, strongbox::schema::address_t>;

  struct journal_entry final {
    bool is_allowance{};
    allowance_key_t key{};
    strongbox::schema::amount_t previous{};
  };

  void set_balance(const strongbox::schema::address_t& holder,
                   const strongbox::schema::amount_t& amount);
  void set_allowance(const allowance_key_t& key,
                     const strongbox::schema::amount_t& amount);
  bool move(const strongbox::schema::address_t& from,
            const strongbox::schema::address_t& to,
            const strongbox::schema::amount_t& amount);

  std::map<strongbox::schema::address_t, strongbox::schema::amount_t>
      balances_;
  std::map<allowance_key_t, strongbox::schema::amount_t> allowances_;
  std::vector<journal_entry> journal_;
  std::vector<std::size_t> checkpoints_;
};

}  // namespace strongbox::ledger
