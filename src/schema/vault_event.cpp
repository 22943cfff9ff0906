#include <strongbox/schema/vault_event.hpp>

namespace strongbox::schema {

std::string_view event_name(const vault_event_t& event) {
  return std::visit(
      overloaded{
          [](const deposited_t&) { return std::string_view{"deposited"}; },
          [](const withdrawn_t&) { return std::string_view{"withdrawn"}; },
          [](const emergency_withdrawal_t&) {
            return std::string_view{"emergency_withdrawal"};
          },
          [](const fee_updated_t&) {
            return std::string_view{"fee_updated"};
          },
          [](const fee_collector_updated_t&) {
            return std::string_view{"fee_collector_updated"};
          },
          [](const withdrawal_limit_updated_t&) {
            return std::string_view{"withdrawal_limit_updated"};
          },
          [](const timelock_updated_t&) {
            return std::string_view{"timelock_updated"};
          },
          [](const operator_added_t&) {
            return std::string_view{"operator_added"};
          },
          [](const operator_removed_t&) {
            return std::string_view{"operator_removed"};
          },
          [](const paused_t&) { return std::string_view{"paused"}; },
          [](const unpaused_t&) { return std::string_view{"unpaused"}; },
          [](const ownership_transferred_t&) {
            return std::string_view{"ownership_transferred"};
          }},
      event);
}

}  // namespace strongbox::schema
