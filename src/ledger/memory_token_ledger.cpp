#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/ledger/memory_token_ledger.hpp>

namespace strongbox::ledger {

using strongbox::schema::address_t;
using strongbox::schema::amount_t;

amount_t memory_token_ledger::balance_of(const address_t& holder) const {
  auto found = balances_.find(holder);
  if (found == std::end(balances_)) {
    return amount_t{0};
  }
  return found->second;
}

amount_t memory_token_ledger::allowance(const address_t& owner,
                                        const address_t& spender) const {
  auto found = allowances_.find(allowance_key_t{owner, spender});
  if (found == std::end(allowances_)) {
    return amount_t{0};
  }
  return found->second;
}

bool memory_token_ledger::transfer(const address_t& from,
                                   const address_t& to,
                                   const amount_t& amount) {
  return move(from, to, amount);
}

bool memory_token_ledger::transfer_from(const address_t& spender,
                                        const address_t& from,
                                        const address_t& to,
                                        const amount_t& amount) {
  auto key = allowance_key_t{from, spender};
  auto granted = allowance(from, spender);
  if (granted < amount) {
    spdlog::debug("Ledger rejected transfer_from: allowance {} < {}",
                  granted.str(), amount.str());
    return false;
  }
  if (!move(from, to, amount)) {
    return false;
  }
  set_allowance(key, granted - amount);
  return true;
}

checkpoint_t memory_token_ledger::checkpoint() {
  checkpoints_.push_back(journal_.size());
  return checkpoints_.size() - 1;
}

void memory_token_ledger::revert_to(const checkpoint_t checkpoint) {
  if (checkpoint >= checkpoints_.size()) {
    strongbox::common::critical("revert_to called with unknown checkpoint");
  }
  auto mark = checkpoints_[checkpoint];
  while (journal_.size() > mark) {
    const auto& entry = journal_.back();
    if (entry.is_allowance) {
      allowances_[entry.key] = entry.previous;
    } else {
      balances_[entry.key.first] = entry.previous;
    }
    journal_.pop_back();
  }
  checkpoints_.resize(checkpoint);
}

void memory_token_ledger::release(const checkpoint_t checkpoint) {
  if (checkpoint >= checkpoints_.size()) {
    strongbox::common::critical("release called with unknown checkpoint");
  }
  checkpoints_.resize(checkpoint);
  if (checkpoints_.empty()) {
    journal_.clear();
  }
}

void memory_token_ledger::credit(const address_t& holder,
                                 const amount_t& amount) {
  set_balance(holder, balance_of(holder) + amount);
}

void memory_token_ledger::approve(const address_t& owner,
                                  const address_t& spender,
                                  const amount_t& amount) {
  set_allowance(allowance_key_t{owner, spender}, amount);
}

void memory_token_ledger::set_balance(const address_t& holder,
                                      const amount_t& amount) {
  if (!checkpoints_.empty()) {
    journal_.push_back(journal_entry{.is_allowance = false,
                                     .key = allowance_key_t{holder, {}},
                                     .previous = balance_of(holder)});
  }
  balances_[holder] = amount;
}

void memory_token_ledger::set_allowance(const allowance_key_t& key,
                                        const amount_t& amount) {
  if (!checkpoints_.empty()) {
    journal_.push_back(journal_entry{
        .is_allowance = true,
        .key = key,
        .previous = allowance(key.first, key.second)});
  }
  allowances_[key] = amount;
}

bool memory_token_ledger::move(const address_t& from,
                               const address_t& to,
                               const amount_t& amount) {
  auto available = balance_of(from);
  if (available < amount) {
    spdlog::debug("Ledger rejected transfer: balance {} < {}", available.str(),
                  amount.str());
    return false;
  }
  if (from == to) {
    return true;
  }
  set_balance(from, available - amount);
  set_balance(to, balance_of(to) + amount);
  return true;
}

}  // namespace strongbox::ledger
