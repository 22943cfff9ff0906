#pragma once

#include <strongbox/execution/vault.hpp>
#include <strongbox/ledger/memory_token_ledger.hpp>
#include <strongbox/schema/create_vault.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <strongbox/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace strongbox::testing {

inline const auto kOwner = make_address(0x10);
inline const auto kAlice = make_address(0x20);
inline const auto kBob = make_address(0x30);
inline const auto kFeeCollector = make_address(0x40);
inline const auto kToken = make_address(0x50);
inline const auto kOperator = make_address(0x60);

/// Clock starts here; small enough that a first withdrawal under a one-day
/// timelock is still blocked.
inline constexpr strongbox::schema::timestamp_seconds_t kStartTime = 1000;

/// fee 1%, limit 10000 tokens, timelock one day.
inline strongbox::schema::create_vault_t default_vault_params() {
  auto params = strongbox::schema::create_vault_t{};
  params.token = kToken;
  params.fee_collector = kFeeCollector;
  params.fee_percentage = 100;
  params.withdrawal_limit = tokens(10000);
  params.withdrawal_timelock = 86400;
  return params;
}

/// Vault over a throwaway RocksDB directory, a manual clock and a ledger of
/// type `Ledger`.
template <typename Ledger = strongbox::ledger::memory_token_ledger>
class basic_vault_fixture final {
 public:
  explicit basic_vault_fixture(
      const std::string_view db_prefix,
      strongbox::schema::create_vault_t params = default_vault_params())
      : db_path_{make_db_path(db_prefix)},
        params_{std::move(params)},
        storage_{strongbox::storage::make_storage<
            strongbox::storage::rocksdb_storage_tag>(db_path_)} {
    open();
  }

  basic_vault_fixture(const basic_vault_fixture&) = delete;
  basic_vault_fixture& operator=(const basic_vault_fixture&) = delete;

  ~basic_vault_fixture() {
    vault_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  strongbox::execution::vault& vault() { return *vault_; }
  Ledger& ledger() { return ledger_; }
  scale_encoder_t& encoder() { return encoder_; }
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }

  strongbox::schema::timestamp_seconds_t now() const { return now_; }
  void advance(const strongbox::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }

  /// Give `account` a balance and approve the vault to pull all of it.
  void fund(const strongbox::schema::address_t& account,
            const strongbox::schema::amount_t& amount) {
    ledger_.credit(account, amount);
    ledger_.approve(account, vault_->vault_address(), amount);
  }

  /// Close the vault and the database, then open both again from disk.
  void reopen() {
    vault_.reset();
    storage_.database.reset();
    storage_ = strongbox::storage::make_storage<
        strongbox::storage::rocksdb_storage_tag>(db_path_);
    open();
  }

 private:
  void open() {
    vault_.emplace(encoder_, storage_, ledger_, [this] { return now_; },
                   kOwner, params_);
  }

  std::string db_path_;
  strongbox::schema::create_vault_t params_;
  scale_encoder_t encoder_{};
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag> storage_;
  Ledger ledger_{};
  strongbox::schema::timestamp_seconds_t now_{kStartTime};
  std::optional<strongbox::execution::vault> vault_;
};

using vault_fixture = basic_vault_fixture<>;

}  // namespace strongbox::testing
