#include <spdlog/spdlog.h>
#include <strongbox/execution/access_registry.hpp>

#include <utility>

namespace strongbox::execution {

using strongbox::schema::address_t;
using strongbox::schema::vault_error_code_t;

access_registry::access_registry(const address_t& owner)
    : owner_{owner}, operators_{owner} {}

access_registry::access_registry(const address_t& owner,
                                 std::set<address_t> operators)
    : owner_{owner}, operators_{std::move(operators)} {}

bool access_registry::is_owner(const address_t& account) const {
  return account == owner_;
}

bool access_registry::is_operator(const address_t& account) const {
  return is_owner(account) || operators_.contains(account);
}

std::optional<vault_error_code_t> access_registry::add_operator(
    const address_t& caller,
    const address_t& target) {
  if (!is_owner(caller)) {
    return vault_error_code_t::unauthorized;
  }
  if (strongbox::schema::is_zero_address(target)) {
    return vault_error_code_t::invalid_address;
  }
  if (is_operator(target)) {
    return vault_error_code_t::already_operator;
  }
  operators_.insert(target);
  spdlog::debug("Operator {} added", strongbox::schema::to_string(target));
  return std::nullopt;
}

std::optional<vault_error_code_t> access_registry::remove_operator(
    const address_t& caller,
    const address_t& target) {
  if (!is_owner(caller)) {
    return vault_error_code_t::unauthorized;
  }
  if (!is_operator(target)) {
    return vault_error_code_t::not_operator;
  }
  if (is_owner(target)) {
    return vault_error_code_t::cannot_remove_owner;
  }
  operators_.erase(target);
  spdlog::debug("Operator {} removed", strongbox::schema::to_string(target));
  return std::nullopt;
}

std::optional<vault_error_code_t> access_registry::transfer_ownership(
    const address_t& caller,
    const address_t& new_owner) {
  if (!is_owner(caller)) {
    return vault_error_code_t::unauthorized;
  }
  if (strongbox::schema::is_zero_address(new_owner)) {
    return vault_error_code_t::invalid_address;
  }
  spdlog::info("Ownership moving from {} to {}",
               strongbox::schema::to_string(owner_),
               strongbox::schema::to_string(new_owner));
  owner_ = new_owner;
  return std::nullopt;
}

}  // namespace strongbox::execution
