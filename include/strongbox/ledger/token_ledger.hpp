#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

namespace strongbox::ledger {

using checkpoint_t = uint64_t;

/// External fungible-token ledger holding the balances the vault custodies.
///
/// The ledger owns every balance; the vault only asks it to move tokens.
/// `checkpoint`/`revert_to`/`release` give the vault an undo scope so a
/// multi-transfer operation that fails half way leaves no transfer behind.
/// Checkpoints nest and must be released or reverted innermost first.
class token_ledger {
 public:
  virtual ~token_ledger() = default;

  /// Current balance of `holder`; unknown holders have zero.
  virtual strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& holder) const = 0;

  /// Move `amount` from `from` to `to`. Returns false without side effects
  /// when the ledger rejects the transfer.
  virtual bool transfer(const strongbox::schema::address_t& from,
                        const strongbox::schema::address_t& to,
                        const strongbox::schema::amount_t& amount) = 0;

  /// Move `amount` from `from` to `to` on behalf of `spender`, consuming
  /// allowance granted by `from`.
  virtual bool transfer_from(const strongbox::schema::address_t& spender,
                             const strongbox::schema::address_t& from,
                             const strongbox::schema::address_t& to,
                             const strongbox::schema::amount_t& amount) = 0;

  virtual checkpoint_t checkpoint() = 0;
  virtual void revert_to(checkpoint_t checkpoint) = 0;
  virtual void release(checkpoint_t checkpoint) = 0;
};

/// Reverts to a checkpoint on scope exit unless `release` was called.
class scoped_checkpoint final {
 public:
  explicit scoped_checkpoint(token_ledger& ledger)
      : ledger_{ledger}, checkpoint_{ledger.checkpoint()} {}

  scoped_checkpoint(const scoped_checkpoint&) = delete;
  scoped_checkpoint& operator=(const scoped_checkpoint&) = delete;

  ~scoped_checkpoint() {
    if (!released_) {
      ledger_.revert_to(checkpoint_);
    }
  }

  void release() {
    if (!released_) {
      ledger_.release(checkpoint_);
      released_ = true;
    }
  }

 private:
  token_ledger& ledger_;
  checkpoint_t checkpoint_;
  bool released_{false};
};

}  // namespace strongbox::ledger
