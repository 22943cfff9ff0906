#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>

// Schema type: create vault.
// Custody workflow: Deployment parameters; the deployer becomes owner and
// first operator.
namespace strongbox::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  address_t token{};
  address_t fee_collector{};
  basis_points_t fee_percentage{};
  amount_t withdrawal_limit{};
  duration_seconds_t withdrawal_timelock{};
  std::optional<bytes_t> label;
};

using create_vault_t = create_vault<1>;

}  // namespace strongbox::schema
