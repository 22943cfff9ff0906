#pragma once
#include <strongbox/schema/primitives.hpp>
#include <string_view>
#include <variant>

// Schema type: vault event.
// Custody workflow: Observable state transitions consumed by UI, audit and
// indexers. Only committed operations produce events.
namespace strongbox::schema {

struct deposited_t final {
  address_t depositor{};
  amount_t amount{};
  timestamp_seconds_t timestamp{};
};

// `gross_amount` is the amount debited from custody, before fees.
struct withdrawn_t final {
  address_t depositor{};
  amount_t gross_amount{};
  timestamp_seconds_t timestamp{};
};

struct emergency_withdrawal_t final {
  address_t by{};
  amount_t amount{};
};

struct fee_updated_t final {
  basis_points_t previous{};
  basis_points_t current{};
};

struct fee_collector_updated_t final {
  address_t previous{};
  address_t current{};
};

struct withdrawal_limit_updated_t final {
  amount_t previous{};
  amount_t current{};
};

struct timelock_updated_t final {
  duration_seconds_t previous{};
  duration_seconds_t current{};
};

struct operator_added_t final {
  address_t account{};
};

struct operator_removed_t final {
  address_t account{};
};

struct paused_t final {
  address_t by{};
};

struct unpaused_t final {
  address_t by{};
};

struct ownership_transferred_t final {
  address_t previous{};
  address_t current{};
};

using vault_event_t = std::variant<deposited_t,
                                   withdrawn_t,
                                   emergency_withdrawal_t,
                                   fee_updated_t,
                                   fee_collector_updated_t,
                                   withdrawal_limit_updated_t,
                                   timelock_updated_t,
                                   operator_added_t,
                                   operator_removed_t,
                                   paused_t,
                                   unpaused_t,
                                   ownership_transferred_t>;

std::string_view event_name(const vault_event_t& event);

}  // namespace strongbox::schema
