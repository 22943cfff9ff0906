#pragma once

#include <strongbox/execution/access_registry.hpp>
#include <strongbox/schema/pause_state.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <optional>

namespace strongbox::execution {

/// Circuit breaker for deposit and withdraw.
///
/// Any operator may pause; only the owner may unpause. Pausing a paused gate
/// (or unpausing an active one) succeeds without changing anything.
class pause_gate final {
 public:
  explicit pause_gate(
      strongbox::schema::pause_state_t initial =
          strongbox::schema::pause_state_t::active)
      : state_{initial} {}

  strongbox::schema::pause_state_t state() const { return state_; }
  bool is_paused() const {
    return state_ == strongbox::schema::pause_state_t::paused;
  }

  std::optional<strongbox::schema::vault_error_code_t> pause(
      const access_registry& registry,
      const strongbox::schema::address_t& caller);

  std::optional<strongbox::schema::vault_error_code_t> unpause(
      const access_registry& registry,
      const strongbox::schema::address_t& caller);

 private:
  strongbox::schema::pause_state_t state_;
};

}  // namespace strongbox::execution
