#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/common/critical.hpp>
#include <strongbox/execution/fee_engine.hpp>
#include <strongbox/execution/vault.hpp>
#include <strongbox/schema/key/vault_keys.hpp>
#include <string>
#include <utility>

using namespace strongbox::schema;

namespace {

constexpr std::string_view kVaultAddressDomain{"strongbox-vault"};

operation_result_t make_error_result(const vault_error_code_t code,
                                     const std::string_view operation) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::string{operation};
  result.codespace = std::string{strongbox::execution::kVaultCodespace};
  return result;
}

timestamp_seconds_t saturating_add(const timestamp_seconds_t lhs,
                                   const duration_seconds_t rhs) {
  if (lhs > std::numeric_limits<timestamp_seconds_t>::max() - rhs) {
    return std::numeric_limits<timestamp_seconds_t>::max();
  }
  return lhs + rhs;
}

}  // namespace

namespace strongbox::execution {

std::optional<vault_error_code_t> validate_create_vault(
    const address_t& deployer,
    const create_vault_t& params) {
  if (is_zero_address(deployer) || is_zero_address(params.token) ||
      is_zero_address(params.fee_collector)) {
    return vault_error_code_t::invalid_address;
  }
  if (!is_valid_fee(params.fee_percentage)) {
    return vault_error_code_t::fee_exceeds_maximum;
  }
  return std::nullopt;
}

address_t derive_vault_address(const address_t& owner,
                               const create_vault_t& params) {
  auto hasher = strongbox::blake3::hasher{};
  hasher.update(kVaultAddressDomain)
      .update(bytes_view_t{owner})
      .update(bytes_view_t{params.token});
  if (params.label) {
    hasher.update(bytes_view_t{params.label->data(), params.label->size()});
  }
  return hasher.finalize();
}

/// Undo scope for one vault call. Restores in-memory state and reverts ledger
/// transfers unless `commit` succeeds; `commit` persists everything touched
/// in a single storage batch.
class vault::transaction final {
 public:
  transaction(vault& target, const timestamp_seconds_t now)
      : vault_{target},
        now_{now},
        saved_state_{target.state_},
        saved_registry_{target.registry_},
        saved_gate_{target.gate_},
        checkpoint_{target.ledger_} {}

  ~transaction() {
    if (!committed_) {
      rollback();
    }
  }

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;

  timestamp_seconds_t now() const { return now_; }

  void record_withdrawal(const address_t& depositor) {
    if (!withdrawal_undo_.contains(depositor)) {
      auto existing = vault_.last_withdrawal_.find(depositor);
      withdrawal_undo_[depositor] =
          existing == std::end(vault_.last_withdrawal_)
              ? std::nullopt
              : std::optional<timestamp_seconds_t>{existing->second};
    }
    vault_.last_withdrawal_[depositor] = now_;
  }

  void emit(vault_event_t event) { pending_.push_back(std::move(event)); }

  operation_result_t commit() {
    auto records = vault_.events_.prepare(pending_, now_);

    auto batch = strongbox::storage::write_batch{};
    batch.puts.emplace_back(key::make_vault_state_key(),
                            vault_.encoder_.encode(vault_.current_state()));

    const auto& before = saved_registry_.operators();
    const auto& after = vault_.registry_.operators();
    for (const auto& account : before) {
      if (!after.contains(account)) {
        batch.deletes.push_back(key::make_operator_key(account));
      }
    }
    for (const auto& account : after) {
      if (!before.contains(account)) {
        batch.puts.emplace_back(key::make_operator_key(account),
                                vault_.encoder_.encode(true));
      }
    }

    for (const auto& [depositor, previous] : withdrawal_undo_) {
      static_cast<void>(previous);
      batch.puts.emplace_back(
          key::make_last_withdrawal_key(depositor),
          vault_.encoder_.encode(vault_.last_withdrawal_.at(depositor)));
    }

    for (const auto& record : records) {
      batch.puts.emplace_back(key::make_event_key(record.sequence),
                              vault_.encoder_.encode(record));
    }

    vault_.storage_.commit(batch);
    vault_.events_.append(records);
    checkpoint_.release();
    committed_ = true;

    auto result = operation_result_t{};
    result.code = 0;
    result.codespace = std::string{kVaultCodespace};
    result.events = std::move(records);
    return result;
  }

 private:
  void rollback() {
    vault_.state_ = saved_state_;
    vault_.registry_ = saved_registry_;
    vault_.gate_ = saved_gate_;
    for (const auto& [depositor, previous] : withdrawal_undo_) {
      if (previous) {
        vault_.last_withdrawal_[depositor] = *previous;
      } else {
        vault_.last_withdrawal_.erase(depositor);
      }
    }
  }

  vault& vault_;
  timestamp_seconds_t now_;
  vault_state_t saved_state_;
  access_registry saved_registry_;
  pause_gate saved_gate_;
  std::map<address_t, std::optional<timestamp_seconds_t>> withdrawal_undo_;
  std::vector<vault_event_t> pending_;
  strongbox::ledger::scoped_checkpoint checkpoint_;
  bool committed_{false};
};

vault::vault(encoder_t& encoder,
             storage_t& storage,
             strongbox::ledger::token_ledger& ledger,
             time_source_t now,
             const address_t& deployer,
             const create_vault_t& params)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      now_{std::move(now)} {
  auto lock = std::scoped_lock{mutex_};
  auto stored =
      storage_.get<vault_state_t>(encoder_, key::make_vault_state_key());
  if (stored) {
    if (stored->token != params.token) {
      spdlog::error("Stored vault custodies {}, requested {}",
                    to_string(stored->token), to_string(params.token));
      strongbox::common::critical("stored vault token mismatch");
    }
    load_persisted_state(*stored);
  } else {
    deploy(deployer, params);
  }
  spdlog::info("Vault {} ready: token {}, owner {}, {} event(s)",
               to_string(state_.vault_address), to_string(state_.token),
               to_string(registry_.owner()), events_.size());
}

void vault::deploy(const address_t& deployer, const create_vault_t& params) {
  if (auto error = validate_create_vault(deployer, params)) {
    spdlog::error("Invalid vault parameters: {}", to_string(*error));
    strongbox::common::critical("invalid vault parameters");
  }

  state_ = vault_state_t{};
  state_.vault_address = derive_vault_address(deployer, params);
  state_.token = params.token;
  state_.owner = deployer;
  state_.fee_collector = params.fee_collector;
  state_.fee_percentage = params.fee_percentage;
  state_.withdrawal_limit = params.withdrawal_limit;
  state_.withdrawal_timelock = params.withdrawal_timelock;
  state_.label = params.label;
  registry_ = access_registry{deployer};
  gate_ = pause_gate{};

  auto batch = strongbox::storage::write_batch{};
  batch.puts.emplace_back(key::make_vault_state_key(),
                          encoder_.encode(current_state()));
  batch.puts.emplace_back(key::make_operator_key(deployer),
                          encoder_.encode(true));
  storage_.commit(batch);
  spdlog::info("Deployed vault {} for token {}",
               to_string(state_.vault_address), to_string(state_.token));
}

void vault::load_persisted_state(const vault_state_t& stored) {
  spdlog::debug("Loading persisted vault state");
  state_ = stored;

  auto operators = std::set<address_t>{};
  for (const auto& [row_key, value] : storage_.list_by_prefix(
           make_bytes_view(key::kOperatorKeyPrefix))) {
    static_cast<void>(value);
    auto account = key::parse_address_suffix(key::kOperatorKeyPrefix,
                                             bytes_view_t{row_key});
    if (!account) {
      strongbox::common::critical("malformed operator key");
    }
    operators.insert(*account);
  }
  registry_ = access_registry{stored.owner, std::move(operators)};
  gate_ = pause_gate{stored.pause_state};

  last_withdrawal_.clear();
  for (const auto& [row_key, value] : storage_.list_by_prefix(
           make_bytes_view(key::kLastWithdrawalKeyPrefix))) {
    auto depositor = key::parse_address_suffix(key::kLastWithdrawalKeyPrefix,
                                               bytes_view_t{row_key});
    if (!depositor) {
      strongbox::common::critical("malformed last withdrawal key");
    }
    last_withdrawal_[*depositor] =
        encoder_.decode<timestamp_seconds_t>(bytes_view_t{value});
  }

  auto head = storage_.last_by_prefix(make_bytes_view(key::kEventPrefix));
  if (head &&
      !events_.restore(encoder_.decode<event_record_t>(
          bytes_view_t{head->second}))) {
    strongbox::common::critical("persisted event head failed verification");
  }
}

template <typename Body>
operation_result_t vault::execute(const std::string_view operation,
                                  Body&& body) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = guard_.try_enter();
  if (!entry) {
    spdlog::warn("Rejected reentrant {} call", operation);
    return make_error_result(vault_error_code_t::reentrant_call, operation);
  }

  auto tx = transaction{*this, now_()};
  if (auto error = body(tx)) {
    spdlog::debug("{} rejected: {}", operation, to_string(*error));
    return make_error_result(*error, operation);
  }
  auto result = tx.commit();
  spdlog::debug("{} committed with {} event(s)", operation,
                result.events.size());
  return result;
}

operation_result_t vault::deposit(const address_t& caller,
                                  const amount_t& amount) {
  return execute(
      "deposit", [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (gate_.is_paused()) {
          return vault_error_code_t::paused;
        }
        if (amount == 0) {
          return vault_error_code_t::invalid_amount;
        }
        if (!ledger_.transfer_from(state_.vault_address, caller,
                                   state_.vault_address, amount)) {
          return vault_error_code_t::token_transfer_failed;
        }
        state_.total_deposited += amount;
        tx.emit(deposited_t{caller, amount, tx.now()});
        spdlog::info("Deposit of {} from {}", to_string(amount),
                     to_string(caller));
        return std::nullopt;
      });
}

operation_result_t vault::withdraw(const address_t& caller,
                                   const amount_t& amount) {
  return execute(
      "withdraw", [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (gate_.is_paused()) {
          return vault_error_code_t::paused;
        }
        if (amount == 0) {
          return vault_error_code_t::invalid_amount;
        }
        if (amount > state_.withdrawal_limit) {
          return vault_error_code_t::withdrawal_limit_exceeded;
        }
        if (tx.now() < withdrawal_available_at(caller)) {
          return vault_error_code_t::withdrawal_too_soon;
        }
        if (amount > state_.total_deposited) {
          return vault_error_code_t::insufficient_balance;
        }

        state_.total_deposited -= amount;
        tx.record_withdrawal(caller);

        auto split = compute_fee(amount, state_.fee_percentage);
        if (split.fee > 0 && !ledger_.transfer(state_.vault_address,
                                               state_.fee_collector,
                                               split.fee)) {
          return vault_error_code_t::token_transfer_failed;
        }
        if (!ledger_.transfer(state_.vault_address, caller, split.net)) {
          return vault_error_code_t::token_transfer_failed;
        }
        tx.emit(withdrawn_t{caller, amount, tx.now()});
        spdlog::info("Withdrawal of {} by {} (fee {})", to_string(amount),
                     to_string(caller), to_string(split.fee));
        return std::nullopt;
      });
}

operation_result_t vault::emergency_withdraw(const address_t& caller,
                                             const amount_t& amount) {
  return execute(
      "emergency_withdraw",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (!registry_.is_owner(caller)) {
          return vault_error_code_t::unauthorized;
        }
        if (amount == 0) {
          return vault_error_code_t::invalid_amount;
        }
        if (amount > ledger_.balance_of(state_.vault_address)) {
          return vault_error_code_t::insufficient_balance;
        }

        state_.total_deposited = amount >= state_.total_deposited
                                     ? amount_t{0}
                                     : amount_t{state_.total_deposited - amount};
        if (!ledger_.transfer(state_.vault_address, registry_.owner(),
                              amount)) {
          return vault_error_code_t::token_transfer_failed;
        }
        tx.emit(emergency_withdrawal_t{caller, amount});
        spdlog::warn("Emergency withdrawal of {} by {}", to_string(amount),
                     to_string(caller));
        return std::nullopt;
      });
}

operation_result_t vault::pause(const address_t& caller) {
  return execute("pause",
                 [&](transaction& tx) -> std::optional<vault_error_code_t> {
                   const auto was_paused = gate_.is_paused();
                   if (auto error = gate_.pause(registry_, caller)) {
                     return error;
                   }
                   if (!was_paused) {
                     tx.emit(paused_t{caller});
                   }
                   return std::nullopt;
                 });
}

operation_result_t vault::unpause(const address_t& caller) {
  return execute("unpause",
                 [&](transaction& tx) -> std::optional<vault_error_code_t> {
                   const auto was_paused = gate_.is_paused();
                   if (auto error = gate_.unpause(registry_, caller)) {
                     return error;
                   }
                   if (was_paused) {
                     tx.emit(unpaused_t{caller});
                   }
                   return std::nullopt;
                 });
}

operation_result_t vault::set_fee_percentage(
    const address_t& caller,
    const basis_points_t fee_percentage) {
  return execute(
      "set_fee_percentage",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (!registry_.is_owner(caller)) {
          return vault_error_code_t::unauthorized;
        }
        if (!is_valid_fee(fee_percentage)) {
          return vault_error_code_t::fee_exceeds_maximum;
        }
        auto previous = state_.fee_percentage;
        state_.fee_percentage = fee_percentage;
        ++state_.config_version;
        tx.emit(fee_updated_t{previous, fee_percentage});
        return std::nullopt;
      });
}

operation_result_t vault::set_fee_collector(const address_t& caller,
                                            const address_t& fee_collector) {
  return execute(
      "set_fee_collector",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (!registry_.is_owner(caller)) {
          return vault_error_code_t::unauthorized;
        }
        if (is_zero_address(fee_collector)) {
          return vault_error_code_t::invalid_address;
        }
        auto previous = state_.fee_collector;
        state_.fee_collector = fee_collector;
        ++state_.config_version;
        tx.emit(fee_collector_updated_t{previous, fee_collector});
        return std::nullopt;
      });
}

operation_result_t vault::set_withdrawal_limit(
    const address_t& caller,
    const amount_t& withdrawal_limit) {
  return execute(
      "set_withdrawal_limit",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (!registry_.is_owner(caller)) {
          return vault_error_code_t::unauthorized;
        }
        auto previous = state_.withdrawal_limit;
        state_.withdrawal_limit = withdrawal_limit;
        ++state_.config_version;
        tx.emit(withdrawal_limit_updated_t{previous, withdrawal_limit});
        return std::nullopt;
      });
}

operation_result_t vault::set_withdrawal_timelock(
    const address_t& caller,
    const duration_seconds_t withdrawal_timelock) {
  return execute(
      "set_withdrawal_timelock",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (!registry_.is_owner(caller)) {
          return vault_error_code_t::unauthorized;
        }
        auto previous = state_.withdrawal_timelock;
        state_.withdrawal_timelock = withdrawal_timelock;
        ++state_.config_version;
        tx.emit(timelock_updated_t{previous, withdrawal_timelock});
        return std::nullopt;
      });
}

operation_result_t vault::add_operator(const address_t& caller,
                                       const address_t& account) {
  return execute(
      "add_operator",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (auto error = registry_.add_operator(caller, account)) {
          return error;
        }
        tx.emit(operator_added_t{account});
        return std::nullopt;
      });
}

operation_result_t vault::remove_operator(const address_t& caller,
                                          const address_t& account) {
  return execute(
      "remove_operator",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        if (auto error = registry_.remove_operator(caller, account)) {
          return error;
        }
        tx.emit(operator_removed_t{account});
        return std::nullopt;
      });
}

operation_result_t vault::transfer_ownership(const address_t& caller,
                                             const address_t& new_owner) {
  return execute(
      "transfer_ownership",
      [&](transaction& tx) -> std::optional<vault_error_code_t> {
        auto previous = registry_.owner();
        if (auto error = registry_.transfer_ownership(caller, new_owner)) {
          return error;
        }
        tx.emit(ownership_transferred_t{previous, new_owner});
        return std::nullopt;
      });
}

amount_t vault::vault_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.balance_of(state_.vault_address);
}

bool vault::can_withdraw_now(const address_t& depositor) const {
  auto lock = std::scoped_lock{mutex_};
  return now_() >= withdrawal_available_at(depositor);
}

duration_seconds_t vault::time_until_withdrawal(
    const address_t& depositor) const {
  auto lock = std::scoped_lock{mutex_};
  auto available_at = withdrawal_available_at(depositor);
  auto now = now_();
  return available_at > now ? available_at - now : 0;
}

timestamp_seconds_t vault::last_withdrawal_time(
    const address_t& depositor) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = last_withdrawal_.find(depositor);
  return found == std::end(last_withdrawal_) ? 0 : found->second;
}

bool vault::is_owner(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_owner(account);
}

bool vault::is_operator(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_operator(account);
}

std::vector<address_t> vault::operators() const {
  auto lock = std::scoped_lock{mutex_};
  const auto& members = registry_.operators();
  return std::vector<address_t>{std::begin(members), std::end(members)};
}

address_t vault::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.owner();
}

address_t vault::token() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.token;
}

address_t vault::vault_address() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.vault_address;
}

address_t vault::fee_collector() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.fee_collector;
}

basis_points_t vault::fee_percentage() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.fee_percentage;
}

amount_t vault::withdrawal_limit() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.withdrawal_limit;
}

duration_seconds_t vault::withdrawal_timelock() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.withdrawal_timelock;
}

amount_t vault::total_deposited() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.total_deposited;
}

uint64_t vault::version() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.config_version;
}

bool vault::paused() const {
  auto lock = std::scoped_lock{mutex_};
  return gate_.is_paused();
}

vault_state_t vault::info() const {
  auto lock = std::scoped_lock{mutex_};
  return current_state();
}

std::vector<event_record_t> vault::events(const uint64_t from_sequence,
                                          const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  return read_events(from_sequence, to_sequence);
}

uint64_t vault::event_count() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

bool vault::verify_events() const {
  auto lock = std::scoped_lock{mutex_};
  auto records = read_events(1, events_.size());
  if (records.size() != events_.size()) {
    spdlog::warn("Event log holds {} of {} record(s)", records.size(),
                 events_.size());
    return false;
  }
  if (!records.empty() && records.back().digest != events_.head_digest()) {
    spdlog::warn("Event log head does not match the newest record");
    return false;
  }
  return event_log::verify_chain(records);
}

std::vector<event_record_t> vault::read_events(uint64_t from_sequence,
                                               uint64_t to_sequence) const {
  from_sequence = std::max<uint64_t>(from_sequence, 1);
  to_sequence = std::min(to_sequence, events_.size());
  auto records = std::vector<event_record_t>{};
  if (from_sequence > to_sequence) {
    return records;
  }
  auto begin = key::make_event_key(from_sequence);
  auto end = key::make_event_key(to_sequence + 1);
  for (const auto& [row_key, value] :
       storage_.list_range(bytes_view_t{begin}, bytes_view_t{end})) {
    static_cast<void>(row_key);
    records.push_back(encoder_.decode<event_record_t>(bytes_view_t{value}));
  }
  return records;
}

vault_state_t vault::current_state() const {
  auto state = state_;
  state.owner = registry_.owner();
  state.pause_state = gate_.state();
  return state;
}

timestamp_seconds_t vault::withdrawal_available_at(
    const address_t& depositor) const {
  auto found = last_withdrawal_.find(depositor);
  auto last = found == std::end(last_withdrawal_) ? timestamp_seconds_t{0}
                                                  : found->second;
  return saturating_add(last, state_.withdrawal_timelock);
}

}  // namespace strongbox::execution
