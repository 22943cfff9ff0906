#pragma once
#include <strongbox/schema/pause_state.hpp>
#include <strongbox/schema/primitives.hpp>
#include <optional>

// Schema type: vault state.
// Custody workflow: Singleton custody row. `config_version` is bumped once per
// administrative change and never by deposit, withdraw or pause.
namespace strongbox::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  address_t vault_address{};
  address_t token{};
  address_t owner{};
  address_t fee_collector{};
  basis_points_t fee_percentage{};
  amount_t withdrawal_limit{};
  duration_seconds_t withdrawal_timelock{};
  amount_t total_deposited{};
  uint64_t config_version{};
  pause_state_t pause_state{pause_state_t::active};
  std::optional<bytes_t> label;
};

using vault_state_t = vault_state<1>;

}  // namespace strongbox::schema
