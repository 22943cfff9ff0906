#include <spdlog/spdlog.h>
#include <strongbox/execution/pause_gate.hpp>

namespace strongbox::execution {

using strongbox::schema::pause_state_t;
using strongbox::schema::vault_error_code_t;

std::optional<vault_error_code_t> pause_gate::pause(
    const access_registry& registry,
    const strongbox::schema::address_t& caller) {
  if (!registry.is_operator(caller)) {
    return vault_error_code_t::unauthorized;
  }
  if (state_ != pause_state_t::paused) {
    spdlog::warn("Vault paused by {}", strongbox::schema::to_string(caller));
  }
  state_ = pause_state_t::paused;
  return std::nullopt;
}

std::optional<vault_error_code_t> pause_gate::unpause(
    const access_registry& registry,
    const strongbox::schema::address_t& caller) {
  if (!registry.is_owner(caller)) {
    return vault_error_code_t::unauthorized;
  }
  if (state_ != pause_state_t::active) {
    spdlog::info("Vault unpaused by {}", strongbox::schema::to_string(caller));
  }
  state_ = pause_state_t::active;
  return std::nullopt;
}

}  // namespace strongbox::execution
