#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <optional>
#include <set>

namespace strongbox::execution {

/// Owner plus operator set.
///
/// The owner is always an operator whether or not it has an explicit entry,
/// so it can never be removed from the operator role. Mutators return the
/// failure kind, or std::nullopt when the change was applied.
class access_registry final {
 public:
  access_registry() = default;

  /// Fresh registry; the owner is also recorded as the first operator.
  explicit access_registry(const strongbox::schema::address_t& owner);

  /// Registry restored from persisted state.
  access_registry(const strongbox::schema::address_t& owner,
                  std::set<strongbox::schema::address_t> operators);

  bool is_owner(const strongbox::schema::address_t& account) const;
  bool is_operator(const strongbox::schema::address_t& account) const;

  const strongbox::schema::address_t& owner() const { return owner_; }

  /// Explicit members only; the implicit owner membership is not listed
  /// unless it was recorded.
  const std::set<strongbox::schema::address_t>& operators() const {
    return operators_;
  }

  std::optional<strongbox::schema::vault_error_code_t> add_operator(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& target);

  std::optional<strongbox::schema::vault_error_code_t> remove_operator(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& target);

  /// Single-step reassignment of the owner role.
  std::optional<strongbox::schema::vault_error_code_t> transfer_ownership(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& new_owner);

 private:
  strongbox::schema::address_t owner_{};
  std::set<strongbox::schema::address_t> operators_;
};

}  // namespace strongbox::execution
