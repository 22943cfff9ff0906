#pragma once

#include <strongbox/execution/access_registry.hpp>
#include <strongbox/execution/event_log.hpp>
#include <strongbox/execution/pause_gate.hpp>
#include <strongbox/execution/reentrancy_guard.hpp>
#include <strongbox/execution/time_source.hpp>
#include <strongbox/ledger/token_ledger.hpp>
#include <strongbox/schema/create_vault.hpp>
#include <strongbox/schema/encoding/encoder.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/operation_result.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <strongbox/schema/vault_state.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace strongbox::execution {

inline constexpr std::string_view kVaultCodespace{"strongbox.vault"};

/// Check deployment parameters. Returns the first failure, if any.
std::optional<strongbox::schema::vault_error_code_t> validate_create_vault(
    const strongbox::schema::address_t& deployer,
    const strongbox::schema::create_vault_t& params);

/// Custody address of a vault: blake3("strongbox-vault" || owner || token ||
/// label). Fixed at deployment; ownership transfer does not move it.
strongbox::schema::address_t derive_vault_address(
    const strongbox::schema::address_t& owner,
    const strongbox::schema::create_vault_t& params);

/// Single-token custody vault.
///
/// Holds one token in custody on an external ledger and tracks aggregate
/// deposits, withdrawal rules, roles, the pause switch and an audit log.
/// Every mutating call is all-or-nothing: on any failure the vault state,
/// persisted rows and ledger balances are exactly as before the call, and
/// no event is recorded. Calls are serialized; a call made from inside a
/// ledger transfer is rejected with `reentrant_call`.
class vault final {
 public:
  using encoder_t = strongbox::schema::encoding::encoder<
      strongbox::schema::encoding::scale_encoder_tag>;
  using storage_t =
      strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>;

  /// Open the vault persisted in `storage`, or deploy a new one with
  /// `params` and `deployer` as owner when storage is empty.
  ///
  /// Invalid parameters, or a stored vault for a different token, are fatal.
  vault(encoder_t& encoder,
        storage_t& storage,
        strongbox::ledger::token_ledger& ledger,
        time_source_t now,
        const strongbox::schema::address_t& deployer,
        const strongbox::schema::create_vault_t& params);

  vault(const vault&) = delete;
  vault& operator=(const vault&) = delete;

  /// Pull `amount` from the caller into custody. Requires a prior ledger
  /// approval of the vault address by the caller.
  strongbox::schema::operation_result_t deposit(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  /// Release `amount` from custody to the caller, net of the withdrawal fee.
  strongbox::schema::operation_result_t withdraw(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  /// Owner-only drain that ignores pause, limit, timelock and fee.
  strongbox::schema::operation_result_t emergency_withdraw(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::operation_result_t pause(
      const strongbox::schema::address_t& caller);
  strongbox::schema::operation_result_t unpause(
      const strongbox::schema::address_t& caller);

  strongbox::schema::operation_result_t set_fee_percentage(
      const strongbox::schema::address_t& caller,
      strongbox::schema::basis_points_t fee_percentage);
  strongbox::schema::operation_result_t set_fee_collector(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& fee_collector);
  strongbox::schema::operation_result_t set_withdrawal_limit(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& withdrawal_limit);
  strongbox::schema::operation_result_t set_withdrawal_timelock(
      const strongbox::schema::address_t& caller,
      strongbox::schema::duration_seconds_t withdrawal_timelock);

  strongbox::schema::operation_result_t add_operator(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& account);
  strongbox::schema::operation_result_t remove_operator(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& account);
  strongbox::schema::operation_result_t transfer_ownership(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& new_owner);

  /// Ledger balance held at the vault address.
  strongbox::schema::amount_t vault_balance() const;

  bool can_withdraw_now(const strongbox::schema::address_t& depositor) const;

  /// Seconds until `depositor` may withdraw again; zero when eligible.
  strongbox::schema::duration_seconds_t time_until_withdrawal(
      const strongbox::schema::address_t& depositor) const;

  /// Last successful withdrawal time, zero when there has been none.
  strongbox::schema::timestamp_seconds_t last_withdrawal_time(
      const strongbox::schema::address_t& depositor) const;

  bool is_owner(const strongbox::schema::address_t& account) const;
  bool is_operator(const strongbox::schema::address_t& account) const;

  /// Explicitly recorded operators, ascending.
  std::vector<strongbox::schema::address_t> operators() const;

  strongbox::schema::address_t owner() const;
  strongbox::schema::address_t token() const;
  strongbox::schema::address_t vault_address() const;
  strongbox::schema::address_t fee_collector() const;
  strongbox::schema::basis_points_t fee_percentage() const;
  strongbox::schema::amount_t withdrawal_limit() const;
  strongbox::schema::duration_seconds_t withdrawal_timelock() const;
  strongbox::schema::amount_t total_deposited() const;
  uint64_t version() const;
  bool paused() const;

  /// Snapshot of the whole vault row.
  strongbox::schema::vault_state_t info() const;

  /// Committed events with sequence in [from_sequence, to_sequence], read
  /// from storage.
  std::vector<strongbox::schema::event_record_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;
  uint64_t event_count() const;

  /// Recompute the persisted chain and check it ends at the in-memory head.
  bool verify_events() const;

 private:
  class transaction;

  template <typename Body>
  strongbox::schema::operation_result_t execute(std::string_view operation,
                                                Body&& body);

  strongbox::schema::vault_state_t current_state() const;
  strongbox::schema::timestamp_seconds_t withdrawal_available_at(
      const strongbox::schema::address_t& depositor) const;
  std::vector<strongbox::schema::event_record_t> read_events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  void deploy(const strongbox::schema::address_t& deployer,
              const strongbox::schema::create_vault_t& params);
  void load_persisted_state(const strongbox::schema::vault_state_t& stored);

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  strongbox::ledger::token_ledger& ledger_;
  time_source_t now_;
  strongbox::schema::vault_state_t state_;
  access_registry registry_;
  pause_gate gate_;
  std::map<strongbox::schema::address_t, strongbox::schema::timestamp_seconds_t>
      last_withdrawal_;
  event_log events_;
  reentrancy_guard guard_;
};

}  // namespace strongbox::execution
